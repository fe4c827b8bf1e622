#include <recchain/stages/head_stage.hpp>
#include "stage_args.hpp"

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> HeadStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("head", args, {"-n"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  std::size_t limit = 10;
  if (const std::string* n = parsed->option("-n")) {
    auto count = detail::parse_count("head", "-n", *n);
    if (!count) {
      return std::unexpected(count.error());
    }
    limit = *count;
  }
  return std::make_unique<HeadStage>(limit, next);
}

core::Result<bool> HeadStage::accept_record(core::Record record) {
  if (seen_ >= limit_) {
    return false;
  }
  ++seen_;
  auto more = push_record(std::move(record));
  if (!more) {
    return more;
  }
  return *more && seen_ < limit_;
}

}  // namespace recchain::stages
