#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/pipeline_spec.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <recchain/core/stage_catalog.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace recchain::core {

/// What a chain node is about to hand to its stage.
enum class TraceEvent : std::uint8_t {
  Line,
  Record,
  Finish,
};

/// Optional per-run observer: (stage_index, stage_name, event).
/// Called by each node before it forwards to its stage.
using StageTraceCallback =
    std::function<void(std::size_t stage_index, std::string_view stage_name, TraceEvent event)>;

/// One compiled link: a stage instance plus ownership of the rest of the
/// chain. The stage was constructed pushing into the next node (or the sink).
class ChainNode : public IRecordConsumer {
 public:
  /// \p stage must already push into \p next_node (or the sink when
  /// \p next_node is null).
  ChainNode(std::size_t index,
            std::string name,
            std::unique_ptr<IStage> stage,
            std::unique_ptr<ChainNode> next_node,
            const StageTraceCallback* trace_cb)
      : index_(index),
        name_(std::move(name)),
        next_node_(std::move(next_node)),
        stage_(std::move(stage)),
        trace_cb_(trace_cb) {}

  [[nodiscard]] Result<bool> accept_line(std::string_view line) override;
  [[nodiscard]] Result<bool> accept_record(Record record) override;
  [[nodiscard]] Result<void> finish() override;

  [[nodiscard]] bool wants_input() const { return stage_->wants_input(); }
  [[nodiscard]] std::size_t index() const noexcept { return index_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  /// Next compiled node; nullptr for the last stage (which feeds the sink).
  [[nodiscard]] const ChainNode* next_node() const noexcept { return next_node_.get(); }

 private:
  void trace(TraceEvent event) const {
    if (trace_cb_ && *trace_cb_) (*trace_cb_)(index_, name_, event);
  }

  std::size_t index_;
  std::string name_;
  // Declared before stage_: the stage holds a reference into it.
  std::unique_ptr<ChainNode> next_node_;
  std::unique_ptr<IStage> stage_;
  const StageTraceCallback* trace_cb_;
};

/// A compiled chain: head node (absent for an empty spec) ending in a sink.
class Chain {
 public:
  Chain(std::unique_ptr<ChainNode> head, IRecordConsumer& sink)
      : head_(std::move(head)), sink_(sink) {}

  /// Where input is pushed: the first node, or the sink for an empty spec.
  [[nodiscard]] IRecordConsumer& entry() noexcept {
    return head_ ? static_cast<IRecordConsumer&>(*head_) : sink_;
  }

  /// nullptr for an empty spec.
  [[nodiscard]] const ChainNode* head() const noexcept { return head_.get(); }

  [[nodiscard]] IRecordConsumer& output_sink() noexcept { return sink_; }

  [[nodiscard]] std::size_t stage_count() const noexcept;

 private:
  std::unique_ptr<ChainNode> head_;
  IRecordConsumer& sink_;
};

/// Compiles \p spec tail-first so every stage is built with its downstream
/// already in place. Host-function arguments are bridged here.
/// Errors: UnknownStage for an unresolvable name, RegistrationFailed from
/// bridging, or whatever the stage factory reports.
[[nodiscard]] Result<Chain> compile_chain(const PipelineSpec& spec,
                                          const StageCatalog& catalog,
                                          HostFunctionBridge& bridge,
                                          const RunContext& context,
                                          IRecordConsumer& sink,
                                          const StageTraceCallback* trace_cb = nullptr);

}  // namespace recchain::core
