#pragma once
#include <mutex>
#include <string>

namespace pxf {

class Logger {
public:
    static Logger& instance();

    // Until init() is called, lines go to stderr.
    void init(const std::string& path);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    void set_debug(bool enabled);

private:
    Logger() = default;
    void write(const std::string& level, const std::string& msg);

    std::mutex mu_;
    std::string path_;
    bool debug_ = false;
};

} // namespace pxf
