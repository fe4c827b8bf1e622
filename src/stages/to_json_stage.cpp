#include <recchain/stages/to_json_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> ToJsonStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("tojson", args, {});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return std::make_unique<ToJsonStage>(next);
}

core::Result<bool> ToJsonStage::accept_record(core::Record record) {
  return push_line(record.to_line());
}

}  // namespace recchain::stages
