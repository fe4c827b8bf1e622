#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/snippet.hpp>
#include <recchain/core/stage.hpp>
#include <memory>

namespace recchain::stages {

/// Passes records whose snippet evaluates truthy (falsy with -v).
class GrepStage : public core::StageBase {
 public:
  GrepStage(const core::RunContext& context,
            core::Snippet predicate,
            bool invert,
            core::IRecordConsumer& next)
      : core::StageBase(next),
        context_(context),
        predicate_(std::move(predicate)),
        invert_(invert) {}

  /// Arguments: [-v] <snippet>
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;

 private:
  const core::RunContext& context_;
  core::Snippet predicate_;
  bool invert_;
};

}  // namespace recchain::stages
