#include "warden/dlq.hpp"

#include <cstdio>
#include <optional>

#if defined(WARDEN_WITH_ZSTD)
#include <zstd.h>
#endif

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/version.hpp"

namespace warden {

namespace {

constexpr const char* kDigestDomain = "dlq:";
constexpr const char* kDigestMarker = ",\"digest\":\"";

#if defined(WARDEN_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

// The payload field can be large; a plain scan avoids the regex engine's
// per-character recursion on long matches. Hex never contains a quote.
std::optional<std::string> raw_field(const std::string& body, const std::string& key) {
  const std::string open = "\"" + key + "\":\"";
  const auto start = body.find(open);
  if (start == std::string::npos) return std::nullopt;
  const auto from = start + open.size();
  const auto end = body.find('"', from);
  if (end == std::string::npos) return std::nullopt;
  return body.substr(from, end - from);
}

Result<DlqEntry> corrupt(const std::string& why) {
  Result<DlqEntry> r;
  r.status = Status::failure(ErrorCode::entry_corrupt, why);
  return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// Entry codec
// ---------------------------------------------------------------------------

std::string encode_dlq_entry(const DlqEntry& entry, bool compress) {
  std::string stored = entry.payload;
  std::string encoding = "identity";
#if defined(WARDEN_WITH_ZSTD)
  if (compress && entry.payload.size() >= kCompressThreshold) {
    auto c = compress_zstd(entry.payload);
    if (!c.empty() && c.size() < entry.payload.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compress;
#endif

  std::string body;
  body.reserve(128 + stored.size() * 2);
  body += "{\"v\":";
  body += std::to_string(version::DLQ_ENTRY_VERSION);
  body += ",\"task_id\":\"";
  body += jsonlite::escape(entry.task_id);
  body += "\",\"failed_at_ms\":";
  body += std::to_string(entry.failed_at_ms);
  body += ",\"failure_count\":";
  body += std::to_string(entry.failure_count);
  body += ",\"encoding\":\"";
  body += encoding;
  body += "\",\"payload_size\":";
  body += std::to_string(entry.payload.size());
  body += ",\"payload_hex\":\"";
  body += hex_encode(stored);
  body += "\",\"errors_hex\":[";
  for (size_t i = 0; i < entry.errors.size(); ++i) {
    if (i) body += ',';
    body += '"';
    body += hex_encode(entry.errors[i]);
    body += '"';
  }
  body += ']';

  std::string out = body;
  out += kDigestMarker;
  out += hash_domain(kDigestDomain, body);
  out += "\"}";
  return out;
}

Result<DlqEntry> decode_dlq_entry(const std::string& encoded) {
  const auto marker = encoded.rfind(kDigestMarker);
  if (marker == std::string::npos) return corrupt("missing digest");

  const std::string body = encoded.substr(0, marker);
  const size_t digest_at = marker + std::char_traits<char>::length(kDigestMarker);
  if (encoded.size() != digest_at + 64 + 2 || encoded.compare(digest_at + 64, 2, "\"}") != 0) {
    return corrupt("malformed digest field");
  }
  if (encoded.compare(digest_at, 64, hash_domain(kDigestDomain, body)) != 0) {
    return corrupt("digest mismatch");
  }

  if (jsonlite::get_u64(body, "v", 0) != version::DLQ_ENTRY_VERSION) return corrupt("unsupported version");
  const auto payload_hex = raw_field(body, "payload_hex");
  if (!jsonlite::has_key(body, "task_id") || !payload_hex) return corrupt("missing field");

  Result<DlqEntry> r;
  DlqEntry& e = r.value;
  e.task_id = jsonlite::get_string(body, "task_id");
  e.failed_at_ms = jsonlite::get_u64(body, "failed_at_ms");
  e.failure_count = static_cast<int>(jsonlite::get_i64(body, "failure_count"));

  auto stored = hex_decode(*payload_hex);
  if (!stored) return corrupt("payload is not hex");

  const std::string encoding = jsonlite::get_string(body, "encoding", "identity");
  const size_t payload_size = static_cast<size_t>(jsonlite::get_u64(body, "payload_size"));
  if (encoding == "identity") {
    e.payload = std::move(*stored);
  } else if (encoding == "zstd") {
#if defined(WARDEN_WITH_ZSTD)
    auto plain = decompress_zstd(*stored, payload_size);
    if (!plain) return corrupt("zstd decode failed");
    e.payload = std::move(*plain);
#else
    return corrupt("zstd entry but zstd support is not built in");
#endif
  } else {
    return corrupt("unknown encoding " + encoding);
  }
  if (e.payload.size() != payload_size) return corrupt("payload size mismatch");

  for (const auto& hex : jsonlite::get_string_array(body, "errors_hex")) {
    auto text = hex_decode(hex);
    if (!text) return corrupt("error text is not hex");
    e.errors.push_back(std::move(*text));
  }
  return r;
}

// ---------------------------------------------------------------------------
// InMemoryDlqStorage
// ---------------------------------------------------------------------------

InMemoryDlqStorage::InMemoryDlqStorage(size_t max_size) : max_size_(max_size) {}

Status InMemoryDlqStorage::push(QueueItem item) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return Status::failure(ErrorCode::storage_closed);
  if (max_size_ > 0 && items_.size() >= max_size_) {
    return Status::failure(ErrorCode::queue_full, std::to_string(max_size_));
  }
  items_.push_back(std::move(item));
  return Status::success();
}

Result<QueueItem> InMemoryDlqStorage::pop() {
  Result<QueueItem> r;
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) {
    r.status = Status::failure(ErrorCode::storage_closed);
    return r;
  }
  if (items_.empty()) {
    r.status = Status::failure(ErrorCode::queue_empty);
    return r;
  }
  r.value = std::move(items_.front());
  items_.pop_front();
  processing_[r.value.id] = r.value;
  return r;
}

Result<QueueItem> InMemoryDlqStorage::peek() const {
  Result<QueueItem> r;
  std::lock_guard<std::mutex> lock(mu_);
  if (items_.empty()) {
    r.status = Status::failure(ErrorCode::queue_empty);
    return r;
  }
  r.value = items_.front();
  return r;
}

Status InMemoryDlqStorage::ack(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (processing_.erase(id) == 0) return Status::failure(ErrorCode::not_found, id);
  return Status::success();
}

Status InMemoryDlqStorage::nack(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = processing_.find(id);
  if (it == processing_.end()) return Status::failure(ErrorCode::not_found, id);
  if (max_size_ > 0 && items_.size() >= max_size_) {
    return Status::failure(ErrorCode::queue_full, std::to_string(max_size_));
  }
  QueueItem item = std::move(it->second);
  processing_.erase(it);
  item.attempts++;
  items_.push_back(std::move(item));
  return Status::success();
}

size_t InMemoryDlqStorage::len() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

size_t InMemoryDlqStorage::processing() const {
  std::lock_guard<std::mutex> lock(mu_);
  return processing_.size();
}

Status InMemoryDlqStorage::close() {
  std::lock_guard<std::mutex> lock(mu_);
  closed_ = true;
  return Status::success();
}

// ---------------------------------------------------------------------------
// DeadLetterQueue
// ---------------------------------------------------------------------------

std::string DlqStats::to_json() const {
  std::string out = "{\"size\":";
  out += std::to_string(size);
  out += ",\"max_size\":";
  out += std::to_string(max_size);
  out += ",\"retention_ms\":";
  out += std::to_string(retention.count());
  out += ",\"pushed\":";
  out += std::to_string(pushed);
  out += ",\"expired\":";
  out += std::to_string(expired);
  out += ",\"corrupt\":";
  out += std::to_string(corrupt);
  out += '}';
  return out;
}

DeadLetterQueue::DeadLetterQueue(DlqConfig config, std::shared_ptr<DlqStorage> storage,
                                 std::shared_ptr<EventDispatcher> dispatcher)
    : config_(std::move(config)), storage_(std::move(storage)), dispatcher_(std::move(dispatcher)) {
  if (!storage_) storage_ = std::make_shared<InMemoryDlqStorage>(config_.max_size);
  if (config_.on_message && !dispatcher_) dispatcher_ = std::make_shared<EventDispatcher>();
}

Status DeadLetterQueue::push(const DlqEntry& entry) {
  if (config_.max_size > 0 && storage_->len() >= config_.max_size) {
    return Status::failure(ErrorCode::queue_full, std::to_string(config_.max_size));
  }

  QueueItem item;
  item.id = entry.task_id;
  item.data = encode_dlq_entry(entry, config_.compression);
  item.created_at_ms = entry.failed_at_ms;
  Status s = storage_->push(std::move(item));
  if (!s.ok()) return s;

  pushed_.fetch_add(1, std::memory_order_relaxed);

  ControlEvent ev;
  ev.kind = EventKind::dead_lettered;
  ev.severity = Severity::warn;
  ev.task_id = entry.task_id;
  ev.detail = "failures=" + std::to_string(entry.failure_count);
  emit_control_event(ev);

  if (config_.on_message && dispatcher_) {
    dispatcher_->post([cb = config_.on_message, entry] { cb(entry); });
  }
  return Status::success();
}

Result<DlqEntry> DeadLetterQueue::pop() {
  Result<DlqEntry> r;
  auto item = storage_->pop();
  if (!item.ok()) {
    r.status = item.status;
    return r;
  }
  r = decode_dlq_entry(item.value.data);
  if (!r.ok()) {
    corrupt_.fetch_add(1, std::memory_order_relaxed);
    r.status.detail = item.value.id;
  }
  return r;
}

Result<DlqEntry> DeadLetterQueue::peek() const {
  Result<DlqEntry> r;
  auto item = storage_->peek();
  if (!item.ok()) {
    r.status = item.status;
    return r;
  }
  r = decode_dlq_entry(item.value.data);
  if (!r.ok()) r.status.detail = item.value.id;
  return r;
}

Result<size_t> DeadLetterQueue::cleanup() {
  Result<size_t> r;
  if (config_.retention.count() <= 0) return r;

  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t now = wall_clock_ms();
  const uint64_t retention = static_cast<uint64_t>(config_.retention.count());
  const uint64_t cutoff = now > retention ? now - retention : 0;

  while (true) {
    auto head = storage_->peek();
    if (!head.ok()) {
      if (head.status.code != ErrorCode::queue_empty) r.status = head.status;
      break;
    }

    const bool is_corrupt = !decode_dlq_entry(head.value.data).ok();
    if (!is_corrupt && head.value.created_at_ms > cutoff) break;

    auto popped = storage_->pop();
    if (!popped.ok()) {
      r.status = popped.status;
      break;
    }
    Status acked = storage_->ack(popped.value.id);
    if (!acked.ok()) {
      r.status = acked;
      break;
    }
    if (is_corrupt) {
      corrupt_.fetch_add(1, std::memory_order_relaxed);
    } else {
      expired_.fetch_add(1, std::memory_order_relaxed);
    }
    r.value++;
  }
  return r;
}

DlqStats DeadLetterQueue::stats() const {
  DlqStats s;
  s.size = storage_->len();
  s.max_size = config_.max_size;
  s.retention = config_.retention;
  s.pushed = pushed_.load(std::memory_order_relaxed);
  s.expired = expired_.load(std::memory_order_relaxed);
  s.corrupt = corrupt_.load(std::memory_order_relaxed);
  return s;
}

}  // namespace warden
