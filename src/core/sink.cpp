#include <recchain/core/sink.hpp>

namespace recchain::core {

Result<bool> RecordSink::accept_line(std::string_view line) {
  auto record = Record::parse(line);
  if (!record) {
    return std::unexpected(record.error());
  }
  return accept_record(std::move(*record));
}

Result<bool> RecordSink::accept_record(Record record) {
  records_.push_back(std::move(record).into_json());
  return true;
}

Result<bool> LineSink::accept_line(std::string_view line) {
  out_ << line << '\n';
  if (!out_) {
    return fail(PipelineError::IoError, "write to output failed");
  }
  return true;
}

Result<bool> LineSink::accept_record(Record record) {
  return accept_line(record.to_line());
}

Result<void> LineSink::finish() {
  out_.flush();
  if (!out_) {
    return fail(PipelineError::IoError, "flush of output failed");
  }
  return {};
}

}  // namespace recchain::core
