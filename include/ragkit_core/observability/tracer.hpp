#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

#include "ragkit_core/request_context.hpp"

namespace ragkit_core {

// One timed unit of pipeline work. Ending a span twice is a no-op.
class SpanHandle {
 public:
  virtual ~SpanHandle() = default;

  virtual void end(const nlohmann::json &metadata, const nlohmann::json &output) = 0;

  // Milliseconds since the span was started.
  virtual double elapsed_ms() const = 0;
};

class Tracer {
 public:
  virtual ~Tracer() = default;

  virtual std::unique_ptr<SpanHandle> start_span(const RequestContext &context,
                                                 const std::string &name,
                                                 const nlohmann::json &input) = 0;
};

/**
 * Writes one JSON line per finished span:
 * {"trace_id", "request_id", "tenant_id", "span", "input", "metadata", "output"}
 */
class LogTracer : public Tracer {
 public:
  explicit LogTracer(std::ostream &out);

  std::unique_ptr<SpanHandle> start_span(const RequestContext &context,
                                         const std::string &name,
                                         const nlohmann::json &input) override;

  void emit(const nlohmann::json &record);

 private:
  std::ostream &out_;
  std::mutex out_mutex_;
};

// Spans still measure time so latency can be reported, but nothing is written.
class NullTracer : public Tracer {
 public:
  std::unique_ptr<SpanHandle> start_span(const RequestContext &context,
                                         const std::string &name,
                                         const nlohmann::json &input) override;
};

}  // namespace ragkit_core
