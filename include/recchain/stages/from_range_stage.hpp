#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace recchain::stages {

/// Self-generating source: emits {field: i} for i in [0, count) at finish.
/// Does not want input; records pushed into it pass through unchanged.
class FromRangeStage : public core::StageBase {
 public:
  FromRangeStage(std::size_t count, std::string field, core::IRecordConsumer& next)
      : core::StageBase(next), count_(count), field_(std::move(field)) {}

  /// Arguments: --count N [--field NAME] (field defaults to "n").
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] bool wants_input() const override { return false; }
  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;
  [[nodiscard]] core::Result<void> finish() override;

 private:
  std::size_t count_;
  std::string field_;
};

}  // namespace recchain::stages
