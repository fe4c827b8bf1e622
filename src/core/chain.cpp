#include <recchain/core/chain.hpp>

namespace recchain::core {

Result<bool> ChainNode::accept_line(std::string_view line) {
  trace(TraceEvent::Line);
  return stage_->accept_line(line);
}

Result<bool> ChainNode::accept_record(Record record) {
  trace(TraceEvent::Record);
  return stage_->accept_record(std::move(record));
}

Result<void> ChainNode::finish() {
  trace(TraceEvent::Finish);
  return stage_->finish();
}

std::size_t Chain::stage_count() const noexcept {
  std::size_t n = 0;
  for (const ChainNode* node = head_.get(); node; node = node->next_node()) {
    ++n;
  }
  return n;
}

Result<Chain> compile_chain(const PipelineSpec& spec,
                            const StageCatalog& catalog,
                            HostFunctionBridge& bridge,
                            const RunContext& context,
                            IRecordConsumer& sink,
                            const StageTraceCallback* trace_cb) {
  const auto& calls = spec.stages();
  std::unique_ptr<ChainNode> next;

  for (std::size_t i = calls.size(); i-- > 0;) {
    const StageCall& call = calls[i];

    const StageFactory* factory = catalog.resolve(call.name);
    if (!factory) {
      return fail(PipelineError::UnknownStage, "unknown stage: " + call.name);
    }

    auto args = bridge.bridge_args(call.args);
    if (!args) {
      return std::unexpected(args.error());
    }

    IRecordConsumer& downstream = next ? static_cast<IRecordConsumer&>(*next) : sink;
    auto stage = (*factory)(context, *args, downstream);
    if (!stage) {
      return std::unexpected(stage.error());
    }
    if (!*stage) {
      return fail(PipelineError::InvalidArgument,
                  "stage factory for " + call.name + " returned no stage");
    }

    next = std::make_unique<ChainNode>(i, call.name, std::move(*stage),
                                       std::move(next), trace_cb);
  }

  return Chain(std::move(next), sink);
}

}  // namespace recchain::core
