#include <recchain/stages/sort_stage.hpp>
#include "record_order.hpp"
#include "stage_args.hpp"
#include <algorithm>

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> SortStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("sort", args, {"--key"}, {"--numeric", "--reverse"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  auto key = detail::required_option("sort", *parsed, "--key");
  if (!key) {
    return std::unexpected(key.error());
  }
  SortKey sort_key{std::move(*key), parsed->has_flag("--numeric"), parsed->has_flag("--reverse")};
  return std::make_unique<SortStage>(std::move(sort_key), next);
}

core::Result<bool> SortStage::accept_record(core::Record record) {
  buffer_.push_back(std::move(record));
  return true;
}

core::Result<void> SortStage::finish() {
  std::stable_sort(buffer_.begin(), buffer_.end(),
                   [this](const core::Record& a, const core::Record& b) {
                     const int c = detail::compare_field(a, b, key_.key_spec, key_.numeric);
                     return key_.reverse ? c > 0 : c < 0;
                   });
  for (auto& record : buffer_) {
    auto more = push_record(std::move(record));
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) break;
  }
  buffer_.clear();
  return next().finish();
}

}  // namespace recchain::stages
