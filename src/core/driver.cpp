#include <recchain/core/driver.hpp>
#include <string>
#include <vector>

namespace recchain::core {

namespace {

Result<void> feed_stream(IRecordConsumer& entry,
                         const StreamSource& source,
                         RunContext& context) {
  std::istream& in = *source.stream;
  context.set_current_source(stream_label(in, source.label));

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    context.advance_line();
    auto more = entry.accept_line(line);
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) return {};
  }
  if (in.bad()) {
    return fail(PipelineError::IoError, "read failed on " + context.current_source());
  }
  return {};
}

Result<void> feed_lines(IRecordConsumer& entry,
                        const std::vector<std::string>& lines,
                        RunContext& context) {
  context.set_current_source({});
  for (const auto& line : lines) {
    context.advance_line();
    auto more = entry.accept_line(line);
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) break;
  }
  return {};
}

Result<void> feed_records(IRecordConsumer& entry, const std::vector<Json>& records) {
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (!records[i].is_object()) {
      return fail(PipelineError::UnsupportedInput,
                  "input element " + std::to_string(i) +
                      " is neither a line nor a record: " + records[i].dump());
    }
  }
  for (const auto& value : records) {
    auto more = entry.accept_record(Record(value));
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) break;
  }
  return {};
}

}  // namespace

Result<void> drive(Chain& chain, const Input& input, RunContext& context) {
  const ChainNode* head = chain.head();
  const bool wants_input = head == nullptr || head->wants_input();

  if (wants_input) {
    if (head && input.empty()) {
      return fail(PipelineError::InputRequired, "input required for " + head->name());
    }

    IRecordConsumer& entry = chain.entry();
    Result<void> fed;
    if (const auto* stream = std::get_if<StreamSource>(&input.source())) {
      if (!stream->stream) {
        return fail(PipelineError::UnsupportedInput, "stream input has no stream");
      }
      fed = feed_stream(entry, *stream, context);
    } else if (const auto* lines = std::get_if<std::vector<std::string>>(&input.source())) {
      fed = feed_lines(entry, *lines, context);
    } else if (const auto* records = std::get_if<std::vector<Json>>(&input.source())) {
      fed = feed_records(entry, *records);
    }
    if (!fed) {
      return fed;
    }
  }

  return chain.entry().finish();
}

}  // namespace recchain::core
