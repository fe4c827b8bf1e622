#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace recchain::core {

/// Pipeline error codes; every failure aborts the current run.
enum class PipelineError {
  None = 0,
  UnknownStage,
  InputRequired,
  UnsupportedInput,
  RegistrationFailed,
  IoError,
  InvalidRecord,
  InvalidArgument,
  InvalidConfig,
  HostFunctionFailed,
};

/// Error code plus a message naming the stage, source or value involved.
struct Error {
  PipelineError code{PipelineError::None};
  std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] std::string_view to_string(PipelineError code) noexcept;

/// Shorthand for returning a failed Result.
[[nodiscard]] inline std::unexpected<Error> fail(PipelineError code,
                                                 std::string message) {
  return std::unexpected(Error{code, std::move(message)});
}

}  // namespace recchain::core
