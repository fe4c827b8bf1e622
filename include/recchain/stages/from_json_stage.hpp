#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <memory>

namespace recchain::stages {

/// Parses each input line as a JSON object and pushes it as a record.
/// Parse errors name the source and line they came from.
class FromJsonStage : public core::StageBase {
 public:
  FromJsonStage(const core::RunContext& context, core::IRecordConsumer& next)
      : core::StageBase(next), context_(context) {}

  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_line(std::string_view line) override;
  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;

 private:
  const core::RunContext& context_;
};

}  // namespace recchain::stages
