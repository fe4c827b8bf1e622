#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/record.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <memory>
#include <vector>

namespace recchain::stages {

/// Buffers records and writes an aligned text table at finish:
/// a header row, a dash row, then one row per record. Columns are the
/// union of field names in first-seen order.
class ToTableStage : public core::StageBase {
 public:
  explicit ToTableStage(core::IRecordConsumer& next) : core::StageBase(next) {}

  [[nodiscard]] static core::Result<std::unique_ptr<core::IStage>> create(
      const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next);

  [[nodiscard]] core::Result<bool> accept_record(core::Record record) override;
  [[nodiscard]] core::Result<void> finish() override;

 private:
  std::vector<core::Record> buffer_;
};

}  // namespace recchain::stages
