#include <recchain/stages/xform_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> XformStage::create(
    const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("xform", args, {"--field"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  auto field = detail::required_option("xform", *parsed, "--field");
  if (!field) {
    return std::unexpected(field.error());
  }
  if (parsed->positional.size() != 1) {
    return core::fail(core::PipelineError::InvalidArgument,
                      "xform: expected exactly one snippet");
  }
  auto snippet = core::Snippet::parse(parsed->positional.front());
  if (!snippet) {
    return core::fail(snippet.error().code, "xform: " + snippet.error().message);
  }
  return std::make_unique<XformStage>(context, std::move(*field), std::move(*snippet), next);
}

core::Result<bool> XformStage::accept_record(core::Record record) {
  auto value = expression_.evaluate(record, context_.host_functions());
  if (!value) {
    return core::fail(value.error().code, "xform: " + value.error().message);
  }
  record.set_path(field_, std::move(*value));
  return push_record(std::move(record));
}

}  // namespace recchain::stages
