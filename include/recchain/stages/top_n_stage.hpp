#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/record.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace recchain::stages {

/// Emits the N records with the largest key at finish, largest first.
/// Produces records despite its "to" prefix.
class TopNStage : public core::StageBase {
 public:
  TopNStage(std::size_t limit, std::string key_spec, bool numeric, core::IRecordConsumer& next)
      : core::StageBase(next),
        limit_(limit),
        key_spec_(std::move(key_spec)),
        numeric_(numeric) {}

  /// Arguments: --key KEY/SPEC [-n N] [--numeric] (N defaults to 10)
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;
  [[nodiscard]] core::Result<void> finish() override;

 private:
  std::size_t limit_;
  std::string key_spec_;
  bool numeric_;
  std::vector<core::Record> buffer_;
};

}  // namespace recchain::stages
