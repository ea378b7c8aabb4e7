#include "ragkit_core/observability/tracer.hpp"

namespace ragkit_core {

namespace {

using Clock = std::chrono::steady_clock;

class LogSpan : public SpanHandle {
 public:
  LogSpan(LogTracer &tracer, const RequestContext &context, std::string name, nlohmann::json input)
      : tracer_(tracer),
        context_(context),
        name_(std::move(name)),
        input_(std::move(input)),
        started_(Clock::now()) {}

  void end(const nlohmann::json &metadata, const nlohmann::json &output) override {
    if (ended_) {
      return;
    }
    ended_ = true;
    nlohmann::json record = {{"trace_id", context_.trace_id},
                             {"request_id", context_.request_id},
                             {"tenant_id", context_.tenant_id},
                             {"span", name_},
                             {"input", input_},
                             {"metadata", metadata},
                             {"output", output}};
    tracer_.emit(record);
  }

  double elapsed_ms() const override {
    return std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
  }

 private:
  LogTracer &tracer_;
  RequestContext context_;
  std::string name_;
  nlohmann::json input_;
  Clock::time_point started_;
  bool ended_ = false;
};

class NullSpan : public SpanHandle {
 public:
  NullSpan() : started_(Clock::now()) {}

  void end(const nlohmann::json &, const nlohmann::json &) override {}

  double elapsed_ms() const override {
    return std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
  }

 private:
  Clock::time_point started_;
};

}  // namespace

LogTracer::LogTracer(std::ostream &out) : out_(out) {}

std::unique_ptr<SpanHandle> LogTracer::start_span(const RequestContext &context,
                                                  const std::string &name,
                                                  const nlohmann::json &input) {
  return std::make_unique<LogSpan>(*this, context, name, input);
}

void LogTracer::emit(const nlohmann::json &record) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  // Non-UTF-8 model output must not abort the request.
  out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

std::unique_ptr<SpanHandle> NullTracer::start_span(const RequestContext &,
                                                   const std::string &,
                                                   const nlohmann::json &) {
  return std::make_unique<NullSpan>();
}

}  // namespace ragkit_core
