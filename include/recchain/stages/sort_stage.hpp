#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/record.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <memory>
#include <string>
#include <vector>

namespace recchain::stages {

struct SortKey {
  std::string key_spec;
  bool numeric{false};
  bool reverse{false};
};

/// Buffers every record and emits them stably sorted at finish.
class SortStage : public core::StageBase {
 public:
  SortStage(SortKey key, core::IRecordConsumer& next)
      : core::StageBase(next), key_(std::move(key)) {}

  /// Arguments: --key KEY/SPEC [--numeric] [--reverse]
  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;
  [[nodiscard]] core::Result<void> finish() override;

 private:
  SortKey key_;
  std::vector<core::Record> buffer_;
};

}  // namespace recchain::stages
