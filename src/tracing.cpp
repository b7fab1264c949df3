#include "warden/tracing.hpp"

#include <chrono>
#include <random>

#include "warden/jsonlite.hpp"

namespace warden {
namespace {

std::string random_hex(size_t bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::string out;
  out.reserve(bytes * 2);
  uint64_t word = 0;
  for (size_t i = 0; i < bytes; ++i) {
    if (i % 8 == 0) word = rng();
    const auto b = static_cast<unsigned>(word & 0xff);
    word >>= 8;
    out += kHex[b >> 4];
    out += kHex[b & 0x0f];
  }
  return out;
}

uint64_t to_unix_ms(WallClock::time_point t) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
}

SpanPtr make_span(const std::string& name, const std::map<std::string, std::string>& attributes,
                  const SpanPtr& parent) {
  auto span = std::make_shared<Span>();
  span->name = name;
  span->attributes = attributes;
  span->span_id = random_hex(8);
  if (parent) {
    span->trace_id = parent->trace_id;
    span->parent_id = parent->span_id;
  } else {
    span->trace_id = random_hex(16);
  }
  span->start = WallClock::now();
  return span;
}

void finish_span(Span& span, const Status& status) {
  span.end = WallClock::now();
  span.status = status;
  span.ended = true;
}

}  // namespace

std::string Span::to_json() const {
  std::string out = "{";
  out += "\"trace_id\":\"" + trace_id + "\"";
  out += ",\"span_id\":\"" + span_id + "\"";
  out += ",\"parent_id\":\"" + parent_id + "\"";
  out += ",\"name\":\"" + jsonlite::escape(name) + "\"";
  out += ",\"start_ms\":" + std::to_string(to_unix_ms(start));
  out += ",\"end_ms\":" + std::to_string(ended ? to_unix_ms(end) : 0);
  out += ",\"status\":\"" + to_string(status.code) + "\"";
  out += ",\"attributes\":{";
  bool first = true;
  for (const auto& [k, v] : attributes) {
    if (!first) out += ",";
    first = false;
    out += "\"" + jsonlite::escape(k) + "\":\"" + jsonlite::escape(v) + "\"";
  }
  out += "}}";
  return out;
}

SpanPtr NoopTracer::start_span(const std::string& name,
                               const std::map<std::string, std::string>& attributes,
                               const SpanPtr& parent) {
  return make_span(name, attributes, parent);
}

void NoopTracer::end_span(const SpanPtr& span, const Status& status) {
  if (span) finish_span(*span, status);
}

SpanPtr RecordingTracer::start_span(const std::string& name,
                                    const std::map<std::string, std::string>& attributes,
                                    const SpanPtr& parent) {
  auto span = make_span(name, attributes, parent);
  std::lock_guard<std::mutex> lk(mu_);
  ++started_;
  return span;
}

void RecordingTracer::end_span(const SpanPtr& span, const Status& status) {
  if (!span || span->ended) return;
  finish_span(*span, status);
  std::lock_guard<std::mutex> lk(mu_);
  finished_.push_back(*span);
}

std::vector<Span> RecordingTracer::finished() const {
  std::lock_guard<std::mutex> lk(mu_);
  return finished_;
}

size_t RecordingTracer::started() const {
  std::lock_guard<std::mutex> lk(mu_);
  return started_;
}

void RecordingTracer::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  finished_.clear();
  started_ = 0;
}

}  // namespace warden
