#pragma once

#include <recchain/app/config.hpp>
#include <recchain/core/chain.hpp>
#include <recchain/core/error.hpp>
#include <recchain/core/host_function.hpp>
#include <recchain/core/input.hpp>
#include <recchain/core/pipeline_spec.hpp>
#include <recchain/core/record.hpp>
#include <recchain/core/stage_catalog.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace recchain::app {

/// Optional per-stage trace: (stage_index, stage_name, event). Pass via RunParams.
using StageTraceCallback = recchain::core::StageTraceCallback;

/// Decides whether a spec ending in the named stage yields text.
using TextStagePredicate = std::function<bool(std::string_view stage_name)>;

struct RunParams {
  recchain::core::Input input;
  /// When set, every produced line is written here and run() returns it.
  std::ostream* output{nullptr};
  StageTraceCallback* trace_cb{nullptr};
};

/// What run() materialized: the caller's stream, accumulated text, or records.
class RunResult {
 public:
  using Value = std::variant<std::ostream*, std::string, std::vector<recchain::core::Json>>;

  explicit RunResult(Value value) : value_(std::move(value)) {}

  [[nodiscard]] bool is_stream() const noexcept {
    return std::holds_alternative<std::ostream*>(value_);
  }
  [[nodiscard]] bool is_text() const noexcept {
    return std::holds_alternative<std::string>(value_);
  }
  [[nodiscard]] bool is_records() const noexcept {
    return std::holds_alternative<std::vector<recchain::core::Json>>(value_);
  }

  /// Accessors throw std::bad_variant_access on the wrong shape.
  [[nodiscard]] std::ostream& stream() const { return *std::get<std::ostream*>(value_); }
  [[nodiscard]] const std::string& text() const { return std::get<std::string>(value_); }
  [[nodiscard]] const std::vector<recchain::core::Json>& records() const {
    return std::get<std::vector<recchain::core::Json>>(value_);
  }

  [[nodiscard]] const Value& value() const noexcept { return value_; }

 private:
  Value value_;
};

/// Compiles and runs pipeline specs against a stage catalog.
///
/// Result policy, first match wins:
///   1. params.output set      -> lines streamed to it, returns the stream
///   2. last stage is textual  -> lines buffered in memory, returns the text
///   3. otherwise              -> returns the collected records
///
/// Owns the host-function registry, so closures bridged by one runner are
/// invisible to others. The registry only grows; see HostFunctionRegistry.
/// Not thread-safe: one run at a time per runner.
class PipelineRunner {
 public:
  /// \p catalog must outlive the runner.
  explicit PipelineRunner(const recchain::core::StageCatalog& catalog,
                          RunnerConfig config = default_config());

  [[nodiscard]] recchain::core::Result<RunResult> run(
      const recchain::core::PipelineSpec& spec,
      RunParams params = {});

  /// Overrides the config-derived text-stage predicate.
  void set_text_stage_predicate(TextStagePredicate predicate) {
    text_stage_predicate_ = std::move(predicate);
  }

  [[nodiscard]] bool is_text_producing_stage(std::string_view stage_name) const;

  [[nodiscard]] const RunnerConfig& config() const noexcept { return config_; }

  [[nodiscard]] recchain::core::HostFunctionRegistry& host_functions() noexcept {
    return registry_;
  }

 private:
  [[nodiscard]] recchain::core::Result<void> execute(
      const recchain::core::PipelineSpec& spec,
      const RunParams& params,
      recchain::core::IRecordConsumer& sink);

  const recchain::core::StageCatalog& catalog_;
  RunnerConfig config_;
  recchain::core::HostFunctionRegistry registry_;
  TextStagePredicate text_stage_predicate_;
};

}  // namespace recchain::app
