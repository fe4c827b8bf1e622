#include <recchain/stages/grep_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> GrepStage::create(
    const core::RunContext& context, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("grep", args, {}, {"-v"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  if (parsed->positional.size() != 1) {
    return core::fail(core::PipelineError::InvalidArgument,
                      "grep: expected exactly one snippet");
  }
  auto snippet = core::Snippet::parse(parsed->positional.front());
  if (!snippet) {
    return core::fail(snippet.error().code, "grep: " + snippet.error().message);
  }
  return std::make_unique<GrepStage>(context, std::move(*snippet), parsed->has_flag("-v"), next);
}

core::Result<bool> GrepStage::accept_record(core::Record record) {
  auto value = predicate_.evaluate(record, context_.host_functions());
  if (!value) {
    return core::fail(value.error().code, "grep: " + value.error().message);
  }
  if (core::is_truthy(*value) == invert_) {
    return true;
  }
  return push_record(std::move(record));
}

}  // namespace recchain::stages
