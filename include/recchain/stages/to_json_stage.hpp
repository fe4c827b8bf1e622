#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <memory>

namespace recchain::stages {

/// Writes each record as one line of compact JSON text.
class ToJsonStage : public core::StageBase {
 public:
  explicit ToJsonStage(core::IRecordConsumer& next) : core::StageBase(next) {}

  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;
};

}  // namespace recchain::stages
