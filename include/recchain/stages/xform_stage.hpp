#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/snippet.hpp>
#include <recchain/core/stage.hpp>
#include <memory>
#include <string>

namespace recchain::stages {

/// Sets one field of every record to the value of a snippet.
class XformStage : public core::StageBase {
 public:
  XformStage(const core::RunContext& context,
             std::string field,
             core::Snippet expression,
             core::IRecordConsumer& next)
      : core::StageBase(next),
        context_(context),
        field_(std::move(field)),
        expression_(std::move(expression)) {}

  /// Arguments: --field KEY/SPEC <snippet>
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;

 private:
  const core::RunContext& context_;
  std::string field_;
  core::Snippet expression_;
};

}  // namespace recchain::stages
