#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/record.hpp>
#include <string_view>

namespace recchain::core {

/// Downstream contract shared by chain nodes, stages and sinks.
/// accept_* return true to keep receiving input, false to ask the driving
/// loop to stop reading; finish() is called once at end of input.
class IRecordConsumer {
 public:
  virtual ~IRecordConsumer() = default;

  [[nodiscard]] virtual Result<bool> accept_line(std::string_view line) = 0;
  [[nodiscard]] virtual Result<bool> accept_record(Record record) = 0;
  [[nodiscard]] virtual Result<void> finish() = 0;
};

/// Capability every stage implementation must satisfy.
class IStage : public IRecordConsumer {
 public:
  /// False for self-generating stages; input given to them is not fed.
  [[nodiscard]] virtual bool wants_input() const = 0;
};

/// Convenience base for stages that push to a single downstream.
/// Lines are treated as JSON records, the format stages exchange lines in.
class StageBase : public IStage {
 public:
  explicit StageBase(IRecordConsumer& next) : next_(next) {}

  [[nodiscard]] bool wants_input() const override { return true; }

  [[nodiscard]] Result<bool> accept_line(std::string_view line) override;

  /// Default: nothing buffered, so just finish downstream.
  [[nodiscard]] Result<void> finish() override { return next_.finish(); }

 protected:
  [[nodiscard]] Result<bool> push_record(Record record) {
    return next_.accept_record(std::move(record));
  }
  [[nodiscard]] Result<bool> push_line(std::string_view line) {
    return next_.accept_line(line);
  }

  [[nodiscard]] IRecordConsumer& next() noexcept { return next_; }

 private:
  IRecordConsumer& next_;
};

}  // namespace recchain::core
