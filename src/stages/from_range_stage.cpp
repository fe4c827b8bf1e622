#include <recchain/stages/from_range_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> FromRangeStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("fromrange", args, {"--count", "--field"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  auto count_text = detail::required_option("fromrange", *parsed, "--count");
  if (!count_text) {
    return std::unexpected(count_text.error());
  }
  auto count = detail::parse_count("fromrange", "--count", *count_text);
  if (!count) {
    return std::unexpected(count.error());
  }
  const std::string* field = parsed->option("--field");
  return std::make_unique<FromRangeStage>(*count, field ? *field : std::string("n"), next);
}

core::Result<bool> FromRangeStage::accept_record(core::Record record) {
  return push_record(std::move(record));
}

core::Result<void> FromRangeStage::finish() {
  for (std::size_t i = 0; i < count_; ++i) {
    core::Record record;
    record.set(field_, i);
    auto more = push_record(std::move(record));
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) break;
  }
  return next().finish();
}

}  // namespace recchain::stages
