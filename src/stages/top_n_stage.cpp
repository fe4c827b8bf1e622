#include <recchain/stages/top_n_stage.hpp>
#include "record_order.hpp"
#include "stage_args.hpp"
#include <algorithm>

namespace recchain::stages {

core::Result<std::unique_ptr<core::IStage>> TopNStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("topn", args, {"--key", "-n"}, {"--numeric"});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  auto key = detail::required_option("topn", *parsed, "--key");
  if (!key) {
    return std::unexpected(key.error());
  }
  std::size_t limit = 10;
  if (const std::string* n = parsed->option("-n")) {
    auto count = detail::parse_count("topn", "-n", *n);
    if (!count) {
      return std::unexpected(count.error());
    }
    limit = *count;
  }
  return std::make_unique<TopNStage>(limit, std::move(*key), parsed->has_flag("--numeric"), next);
}

core::Result<bool> TopNStage::accept_record(core::Record record) {
  buffer_.push_back(std::move(record));
  return true;
}

core::Result<void> TopNStage::finish() {
  std::stable_sort(buffer_.begin(), buffer_.end(),
                   [this](const core::Record& a, const core::Record& b) {
                     return detail::compare_field(a, b, key_spec_, numeric_) > 0;
                   });
  const std::size_t n = std::min(limit_, buffer_.size());
  for (std::size_t i = 0; i < n; ++i) {
    auto more = push_record(std::move(buffer_[i]));
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) break;
  }
  buffer_.clear();
  return next().finish();
}

}  // namespace recchain::stages
