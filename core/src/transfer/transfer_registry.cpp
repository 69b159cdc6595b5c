#include "pxf/transfer/transfer_registry.h"
#include <openssl/rand.h>
#include <stdexcept>

namespace pxf::transfer {

TransferRegistry::TransferRegistry(size_t history_limit)
  : history_limit_(history_limit) {
}

TransferId TransferRegistry::random_id() {
  uint16_t r = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&r), sizeof(r)) != 1) {
    throw std::runtime_error("RAND_bytes(transfer id) failed");
  }
  return static_cast<TransferId>(r % ID_RANDOM_RANGE);
}

TransferId TransferRegistry::allocate_locked(PeerId receiver_peer) const {
  size_t in_use = 0;
  for (const auto& pair : uploads_) {
    if (pair.first.peer == receiver_peer) in_use++;
  }
  // Every id in [0, ID_RANDOM_RANGE) taken: the random retry would never end.
  if (in_use >= ID_RANDOM_RANGE) {
    throw std::runtime_error("no free transfer id for peer " + std::to_string(receiver_peer));
  }

  TransferId id = ID_SEED;
  while (uploads_.count(TransferKey{receiver_peer, id}) > 0) {
    if (id < ID_CEILING) {
      id++;
    } else {
      id = random_id();
    }
  }
  return id;
}

TransferId TransferRegistry::allocate_upload_id(PeerId receiver_peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocate_locked(receiver_peer);
}

TransferId TransferRegistry::register_upload(const std::shared_ptr<TransferDescriptor>& desc) {
  std::lock_guard<std::mutex> lock(mutex_);
  TransferId id = allocate_locked(desc->receiver_peer);
  desc->id = id;
  uploads_[TransferKey{desc->receiver_peer, id}] = desc;
  return id;
}

std::shared_ptr<TransferDescriptor> TransferRegistry::find(Collection c, PeerId peer, TransferId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Table& t = table(c);

  auto it = t.find(TransferKey{peer, id});
  if (it != t.end()) {
    return it->second;
  }
  for (const auto& pair : t) {
    const auto& d = pair.second;
    if ((d->sender_peer == peer || d->receiver_peer == peer) && d->id == id) {
      return d;
    }
  }
  return nullptr;
}

bool TransferRegistry::add(Collection c, const std::shared_ptr<TransferDescriptor>& desc) {
  std::lock_guard<std::mutex> lock(mutex_);
  return table(c).emplace(TransferKey{desc->remote_peer(), desc->id}, desc).second;
}

bool TransferRegistry::remove(Collection c, const std::shared_ptr<TransferDescriptor>& desc) {
  std::lock_guard<std::mutex> lock(mutex_);
  Table& t = table(c);
  auto it = t.find(TransferKey{desc->remote_peer(), desc->id});
  if (it == t.end() || it->second != desc) {
    return false;
  }
  t.erase(it);

  if (history_limit_ > 0) {
    history_.push_back(desc);
    while (history_.size() > history_limit_) {
      history_.pop_front();
    }
  }
  return true;
}

size_t TransferRegistry::count(Collection c) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return table(c).size();
}

std::vector<std::shared_ptr<TransferDescriptor>> TransferRegistry::active(Collection c) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<TransferDescriptor>> result;
  result.reserve(table(c).size());
  for (const auto& pair : table(c)) {
    result.push_back(pair.second);
  }
  return result;
}

std::vector<std::shared_ptr<TransferDescriptor>> TransferRegistry::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::shared_ptr<TransferDescriptor>>(history_.begin(), history_.end());
}

} // namespace pxf::transfer
