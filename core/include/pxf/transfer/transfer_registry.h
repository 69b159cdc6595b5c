#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "pxf/common/types.h"
#include "pxf/transfer/transfer_descriptor.h"

namespace pxf::transfer {

enum class Collection {
  UPLOADS,
  DOWNLOADS
};

// (remote peer, transfer id)
struct TransferKey {
  PeerId peer = 0;
  TransferId id = 0;

  bool operator==(const TransferKey& o) const { return peer == o.peer && id == o.id; }
};

struct TransferKeyHash {
  size_t operator()(const TransferKey& k) const {
    return std::hash<uint64_t>()((static_cast<uint64_t>(k.peer) << 16) | k.id);
  }
};

class TransferRegistry {
public:
  static constexpr TransferId ID_SEED = 1;
  static constexpr TransferId ID_CEILING = 32765;
  // Random fallback ids are drawn from [0, ID_RANDOM_RANGE).
  static constexpr uint32_t ID_RANDOM_RANGE = 32766;

  explicit TransferRegistry(size_t history_limit = 64);

  // Lowest free id from ID_SEED upwards for this receiver, random once the
  // ceiling is hit. Nothing is reserved: use register_upload() to allocate
  // and insert atomically.
  TransferId allocate_upload_id(PeerId receiver_peer);

  // Allocates an id for desc->receiver_peer, stores it in desc->id and adds
  // the descriptor to the active uploads, all under one lock.
  TransferId register_upload(const std::shared_ptr<TransferDescriptor>& desc);

  // Matches `peer` against either endpoint of the descriptor.
  std::shared_ptr<TransferDescriptor> find(Collection c, PeerId peer, TransferId id) const;

  // False if a descriptor with the same (remote peer, id) is already active.
  bool add(Collection c, const std::shared_ptr<TransferDescriptor>& desc);

  // Moves the descriptor from the active collection into the history.
  // False if it was not active.
  bool remove(Collection c, const std::shared_ptr<TransferDescriptor>& desc);

  size_t count(Collection c) const;
  std::vector<std::shared_ptr<TransferDescriptor>> active(Collection c) const;

  // Oldest first, at most history_limit entries.
  std::vector<std::shared_ptr<TransferDescriptor>> history() const;
  size_t history_limit() const { return history_limit_; }

private:
  using Table = std::unordered_map<TransferKey, std::shared_ptr<TransferDescriptor>, TransferKeyHash>;

  Table& table(Collection c) { return c == Collection::UPLOADS ? uploads_ : downloads_; }
  const Table& table(Collection c) const { return c == Collection::UPLOADS ? uploads_ : downloads_; }

  TransferId allocate_locked(PeerId receiver_peer) const;
  static TransferId random_id();

  mutable std::mutex mutex_;
  Table uploads_;
  Table downloads_;
  std::deque<std::shared_ptr<TransferDescriptor>> history_;
  size_t history_limit_;
};

} // namespace pxf::transfer
