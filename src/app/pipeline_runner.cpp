#include <recchain/app/pipeline_runner.hpp>
#include <recchain/core/driver.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/sink.hpp>
#include <sstream>

namespace recchain::app {

PipelineRunner::PipelineRunner(const recchain::core::StageCatalog& catalog,
                               RunnerConfig config)
    : catalog_(catalog),
      config_(std::move(config)),
      registry_(config_.max_host_functions) {}

bool PipelineRunner::is_text_producing_stage(std::string_view stage_name) const {
  if (text_stage_predicate_) return text_stage_predicate_(stage_name);
  return app::is_text_producing_stage(config_, stage_name);
}

recchain::core::Result<void> PipelineRunner::execute(
    const recchain::core::PipelineSpec& spec,
    const RunParams& params,
    recchain::core::IRecordConsumer& sink) {
  using namespace recchain::core;

  HostFunctionBridge bridge(registry_, config_.annotate_host_functions);
  RunContext context(registry_);

  auto chain = compile_chain(spec, catalog_, bridge, context, sink, params.trace_cb);
  if (!chain) {
    return std::unexpected(chain.error());
  }
  return drive(*chain, params.input, context);
}

recchain::core::Result<RunResult> PipelineRunner::run(
    const recchain::core::PipelineSpec& spec,
    RunParams params) {
  using namespace recchain::core;

  if (params.output) {
    LineSink sink(*params.output);
    auto ran = execute(spec, params, sink);
    if (!ran) {
      return std::unexpected(ran.error());
    }
    return RunResult(params.output);
  }

  const auto last = spec.last_stage_name();
  if (last && is_text_producing_stage(*last)) {
    std::ostringstream buffer;
    LineSink sink(buffer);
    auto ran = execute(spec, params, sink);
    if (!ran) {
      return std::unexpected(ran.error());
    }
    buffer.flush();
    if (!buffer) {
      return fail(PipelineError::IoError, "in-memory output buffer failed");
    }
    return RunResult(std::move(buffer).str());
  }

  RecordSink sink;
  auto ran = execute(spec, params, sink);
  if (!ran) {
    return std::unexpected(ran.error());
  }
  return RunResult(sink.take_records());
}

}  // namespace recchain::app
