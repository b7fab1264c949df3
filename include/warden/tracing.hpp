#pragma once

// warden/tracing.hpp — Span contract for task execution tracing.
//
// The control plane opens one span per executed task and closes it with the
// task's final Status. It never exports spans itself: a Tracer
// implementation decides where they go.
//
// EXTENSION_POINT: otel_tracer
//   Implement Tracer over an OpenTelemetry SDK tracer. trace_id/span_id are
//   already 128/64-bit lowercase hex, the W3C trace-context widths.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

struct Span {
  std::string trace_id;   // 32 hex chars, shared by a span and its children
  std::string span_id;    // 16 hex chars
  std::string parent_id;  // empty for a root span
  std::string name;
  WallClock::time_point start{};
  WallClock::time_point end{};
  std::map<std::string, std::string> attributes;
  Status status;
  bool ended{false};

  std::string to_json() const;
};

using SpanPtr = std::shared_ptr<Span>;

class Tracer {
 public:
  virtual ~Tracer() = default;

  // parent may be null for a root span.
  virtual SpanPtr start_span(const std::string& name,
                             const std::map<std::string, std::string>& attributes,
                             const SpanPtr& parent = nullptr) = 0;
  virtual void end_span(const SpanPtr& span, const Status& status) = 0;
};

// Fills in identities and timestamps, keeps nothing.
class NoopTracer : public Tracer {
 public:
  SpanPtr start_span(const std::string& name,
                     const std::map<std::string, std::string>& attributes,
                     const SpanPtr& parent = nullptr) override;
  void end_span(const SpanPtr& span, const Status& status) override;
};

// Keeps every finished span in memory, in end order.
class RecordingTracer : public Tracer {
 public:
  SpanPtr start_span(const std::string& name,
                     const std::map<std::string, std::string>& attributes,
                     const SpanPtr& parent = nullptr) override;
  void end_span(const SpanPtr& span, const Status& status) override;

  std::vector<Span> finished() const;
  size_t started() const;
  void clear();

 private:
  mutable std::mutex mu_;
  std::vector<Span> finished_;
  size_t started_{0};
};

}  // namespace warden
