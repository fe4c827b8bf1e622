#pragma once

#include <recchain/core/host_function.hpp>
#include <cstddef>
#include <string>

namespace recchain::core {

/// Per-run state visible to stages: the host-function registry for snippet
/// evaluation and the current input position for error attribution.
class RunContext {
 public:
  explicit RunContext(const HostFunctionRegistry& host_functions)
      : host_functions_(host_functions) {}

  [[nodiscard]] const HostFunctionRegistry& host_functions() const noexcept {
    return host_functions_;
  }

  /// Label of the stream being read ("stdin", a file name, ...); empty when
  /// input comes from memory.
  [[nodiscard]] const std::string& current_source() const noexcept {
    return current_source_;
  }

  /// 1-based line number within current_source(); 0 before the first line.
  [[nodiscard]] std::size_t current_line() const noexcept { return current_line_; }

  void set_current_source(std::string label) {
    current_source_ = std::move(label);
    current_line_ = 0;
  }

  void advance_line() noexcept { ++current_line_; }

  /// "source:line: " prefix for messages, or empty when there is no source.
  [[nodiscard]] std::string location() const;

 private:
  const HostFunctionRegistry& host_functions_;
  std::string current_source_;
  std::size_t current_line_{0};
};

}  // namespace recchain::core
