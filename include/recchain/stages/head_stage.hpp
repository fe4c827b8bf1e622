#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <cstddef>
#include <memory>

namespace recchain::stages {

/// Passes the first N records, then signals stop.
class HeadStage : public core::StageBase {
 public:
  HeadStage(std::size_t limit, core::IRecordConsumer& next)
      : core::StageBase(next), limit_(limit) {}

  /// Arguments: [-n N] (default 10)
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;

  [[nodiscard]] std::size_t seen() const noexcept { return seen_; }

 private:
  std::size_t limit_;
  std::size_t seen_{0};
};

}  // namespace recchain::stages
