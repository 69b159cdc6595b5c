#include <gtest/gtest.h>
#include <filesystem>
#include "pxf/storage/file_store.h"
#include "test_util.h"

using namespace pxf::storage;

TEST(FileStore, DestinationKeepsOnlyTheFileName) {
  FileStore store("/var/pxf/in");
  EXPECT_EQ(store.destination_path("report.pdf"), "/var/pxf/in/report.pdf");
  EXPECT_EQ(store.destination_path("/home/alice/report.pdf"), "/var/pxf/in/report.pdf");
  EXPECT_EQ(store.destination_path("C:\\Users\\bob\\notes.txt"), "/var/pxf/in/notes.txt");
  EXPECT_EQ(store.destination_path("../../etc/passwd"), "/var/pxf/in/passwd");
  EXPECT_EQ(store.destination_path("dir/"), "/var/pxf/in/unnamed");
  EXPECT_EQ(store.destination_path(".."), "/var/pxf/in/unnamed");
}

TEST(FileStore, ReservedDestinationsNeverCollide) {
  FileStore store("/var/pxf/in");
  EXPECT_EQ(store.reserve_destination("d1/x.bin"), "/var/pxf/in/x.bin");
  EXPECT_EQ(store.reserve_destination("d2/x.bin"), "/var/pxf/in/x (1).bin");
  EXPECT_EQ(store.reserve_destination("x.bin"), "/var/pxf/in/x (2).bin");
  EXPECT_EQ(store.reserve_destination("README"), "/var/pxf/in/README");
  EXPECT_EQ(store.reserve_destination("README"), "/var/pxf/in/README (1)");

  store.release_destination("/var/pxf/in/x.bin");
  EXPECT_FALSE(store.is_reserved("/var/pxf/in/x.bin"));
  EXPECT_TRUE(store.is_reserved("/var/pxf/in/x (1).bin"));
  EXPECT_EQ(store.reserve_destination("x.bin"), "/var/pxf/in/x.bin");
}

TEST(FileStore, InitializeCreatesNestedDirectory) {
  pxf::test::TempDir tmp;
  FileStore store(tmp.file("a/b/c"));
  EXPECT_TRUE(store.initialize());
  EXPECT_TRUE(std::filesystem::is_directory(tmp.file("a/b/c")));
  EXPECT_TRUE(store.initialize());
}

TEST(FileStore, SourceReadsSequentialChunks) {
  pxf::test::TempDir tmp;
  auto data = pxf::test::pattern_bytes(25);
  pxf::test::write_file(tmp.file("src"), data);

  FileSource src;
  ASSERT_TRUE(src.open(tmp.file("src")));
  EXPECT_EQ(src.size(), 25u);

  std::vector<uint8_t> chunk, all;
  for (int i = 0; i < 3; i++) {
    ASSERT_TRUE(src.read(chunk, 10));
    all.insert(all.end(), chunk.begin(), chunk.end());
  }
  EXPECT_EQ(chunk.size(), 5u);
  EXPECT_EQ(all, data);

  ASSERT_TRUE(src.read(chunk, 10));
  EXPECT_TRUE(chunk.empty());
}

TEST(FileStore, SourceOpenFailureIsReported) {
  pxf::test::TempDir tmp;
  FileSource src;
  EXPECT_FALSE(src.open(tmp.file("missing")));
  EXPECT_FALSE(src.is_open());
  EXPECT_NE(src.error().find("missing"), std::string::npos);
}

TEST(FileStore, SinkTruncatesExistingFile) {
  pxf::test::TempDir tmp;
  pxf::test::write_file(tmp.file("out"), pxf::test::pattern_bytes(100));

  FileSink sink;
  ASSERT_TRUE(sink.open(tmp.file("out")));
  ASSERT_TRUE(sink.write({1, 2, 3}));
  EXPECT_EQ(sink.written(), 3u);
  ASSERT_TRUE(sink.close());

  EXPECT_EQ(pxf::test::read_file(tmp.file("out")), (std::vector<uint8_t>{1, 2, 3}));
}

TEST(FileStore, SinkIntoMissingDirectoryFails) {
  pxf::test::TempDir tmp;
  FileSink sink;
  EXPECT_FALSE(sink.open(tmp.file("nope/out")));
  EXPECT_FALSE(sink.write({1}));
}

TEST(FileStore, RemoveFileToleratesMissing) {
  pxf::test::TempDir tmp;
  FileStore store(tmp.path().string());
  pxf::test::write_file(tmp.file("x"), {1});
  EXPECT_TRUE(store.remove_file(tmp.file("x")));
  EXPECT_FALSE(std::filesystem::exists(tmp.file("x")));
  EXPECT_TRUE(store.remove_file(tmp.file("x")));
}
