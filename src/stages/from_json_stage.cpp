#include <recchain/stages/from_json_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> FromJsonStage::create(
    const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("fromjson", args, {});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  if (!parsed->positional.empty()) {
    return core::fail(core::PipelineError::InvalidArgument,
                      "fromjson: unexpected argument " + parsed->positional.front());
  }
  return std::make_unique<FromJsonStage>(context, next);
}

core::Result<bool> FromJsonStage::accept_line(std::string_view line) {
  if (line.find_first_not_of(" \t") == std::string_view::npos) {
    return true;
  }
  auto record = core::Record::parse(line);
  if (!record) {
    return core::fail(record.error().code, context_.location() + record.error().message);
  }
  return push_record(std::move(*record));
}

core::Result<bool> FromJsonStage::accept_record(core::Record record) {
  return push_record(std::move(record));
}

}  // namespace recchain::stages
