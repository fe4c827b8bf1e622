#pragma once

#include <recchain/core/record.hpp>
#include <recchain/core/stage.hpp>
#include <ostream>
#include <string_view>
#include <vector>

namespace recchain::core {

/// Terminal consumer collecting plain JSON objects in arrival order.
/// Lines reaching it are parsed as JSON records.
class RecordSink : public IRecordConsumer {
 public:
  [[nodiscard]] Result<bool> accept_line(std::string_view line) override;
  [[nodiscard]] Result<bool> accept_record(Record record) override;
  [[nodiscard]] Result<void> finish() override { return {}; }

  [[nodiscard]] const std::vector<Json>& records() const noexcept { return records_; }
  [[nodiscard]] std::vector<Json> take_records() noexcept { return std::move(records_); }

 private:
  std::vector<Json> records_;
};

/// Terminal consumer writing one line plus '\n' per call to a stream.
/// Records are written as compact JSON. The stream is never closed.
class LineSink : public IRecordConsumer {
 public:
  explicit LineSink(std::ostream& out) : out_(out) {}

  [[nodiscard]] Result<bool> accept_line(std::string_view line) override;
  [[nodiscard]] Result<bool> accept_record(Record record) override;

  /// Flushes the stream; IoError if it is in a failed state.
  [[nodiscard]] Result<void> finish() override;

  [[nodiscard]] std::ostream& stream() noexcept { return out_; }

 private:
  std::ostream& out_;
};

}  // namespace recchain::core
