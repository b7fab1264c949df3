#pragma once

// warden/dlq.hpp — Dead-letter queue over a pluggable storage backend.
//
// DESIGN:
//   Tasks that exhaust their retries are handed to a DeadLetterQueue. The
//   queue encodes each DlqEntry into an opaque byte string and stores it as a
//   QueueItem keyed by task id in a DlqStorage backend. The control plane only
//   depends on the DlqStorage interface; InMemoryDlqStorage is the reference
//   backend.
//
// ENCODING (version 1):
//   A flat JSON envelope. The payload is hex encoded, zstd-compressed first
//   when compression is on, WARDEN_WITH_ZSTD is defined and the payload is at
//   least kCompressThreshold bytes. Error strings are hex encoded so arbitrary
//   text survives the flat-document reader. The envelope ends in a BLAKE3
//   digest ("dlq:" domain) over every byte before it.
//
// INVARIANTS:
//   - decode_dlq_entry() fails closed: a digest mismatch, a missing field or an
//     undecodable payload is ErrorCode::entry_corrupt, never a partial entry.
//   - Popped items stay in the backend's processing set until ack() or nack().
//   - on_message runs on the EventDispatcher, never on the pushing thread.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "warden/event_dispatcher.hpp"
#include "warden/types.hpp"

namespace warden {

struct DlqEntry {
  std::string task_id;
  std::string payload;
  uint64_t failed_at_ms{0};
  int failure_count{0};
  std::vector<std::string> errors;
};

struct QueueItem {
  std::string id;
  std::string data;
  int priority{0};
  uint64_t created_at_ms{0};
  int attempts{0};
};

constexpr size_t kCompressThreshold = 256;

std::string encode_dlq_entry(const DlqEntry& entry, bool compress);
Result<DlqEntry> decode_dlq_entry(const std::string& encoded);

// ---------------------------------------------------------------------------
// DlqStorage — backend contract
// ---------------------------------------------------------------------------
class DlqStorage {
 public:
  virtual ~DlqStorage() = default;

  virtual Status push(QueueItem item) = 0;
  // Moves the head item into the processing set. queue_empty when empty.
  virtual Result<QueueItem> pop() = 0;
  virtual Result<QueueItem> peek() const = 0;
  // Forgets a processing item. not_found when it is not processing.
  virtual Status ack(const std::string& id) = 0;
  // Requeues a processing item with attempts + 1. not_found when unknown.
  virtual Status nack(const std::string& id) = 0;
  virtual size_t len() const = 0;
  virtual Status close() = 0;
};

class InMemoryDlqStorage : public DlqStorage {
 public:
  explicit InMemoryDlqStorage(size_t max_size = 0);  // 0 = unbounded

  Status push(QueueItem item) override;
  Result<QueueItem> pop() override;
  Result<QueueItem> peek() const override;
  Status ack(const std::string& id) override;
  Status nack(const std::string& id) override;
  size_t len() const override;
  Status close() override;

  size_t processing() const;

 private:
  const size_t max_size_;
  mutable std::mutex mu_;
  std::deque<QueueItem> items_;
  std::unordered_map<std::string, QueueItem> processing_;
  bool closed_{false};
};

// ---------------------------------------------------------------------------
// DeadLetterQueue
// ---------------------------------------------------------------------------
using DlqMessageCallback = std::function<void(const DlqEntry&)>;

struct DlqConfig {
  size_t max_size{0};
  std::chrono::milliseconds retention{0};  // 0 = keep forever
  bool compression{true};
  DlqMessageCallback on_message;
};

struct DlqStats {
  size_t size{0};
  size_t max_size{0};
  std::chrono::milliseconds retention{0};
  uint64_t pushed{0};
  uint64_t expired{0};
  uint64_t corrupt{0};

  std::string to_json() const;
};

class DeadLetterQueue {
 public:
  DeadLetterQueue(DlqConfig config, std::shared_ptr<DlqStorage> storage,
                  std::shared_ptr<EventDispatcher> dispatcher = nullptr);

  DeadLetterQueue(const DeadLetterQueue&) = delete;
  DeadLetterQueue& operator=(const DeadLetterQueue&) = delete;

  Status push(const DlqEntry& entry);

  // entry_corrupt carries the item id in Status::detail; the item stays in
  // the processing set so the caller can ack() it away.
  Result<DlqEntry> pop();
  Result<DlqEntry> peek() const;

  Status ack(const std::string& task_id) { return storage_->ack(task_id); }
  Status nack(const std::string& task_id) { return storage_->nack(task_id); }

  // Drops entries older than the retention window, plus corrupt entries found
  // at the head. Returns how many were dropped.
  Result<size_t> cleanup();

  size_t len() const { return storage_->len(); }
  Status close() { return storage_->close(); }
  DlqStats stats() const;

 private:
  const DlqConfig config_;
  std::shared_ptr<DlqStorage> storage_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  std::mutex mu_;

  std::atomic<uint64_t> pushed_{0};
  std::atomic<uint64_t> expired_{0};
  std::atomic<uint64_t> corrupt_{0};
};

}  // namespace warden
