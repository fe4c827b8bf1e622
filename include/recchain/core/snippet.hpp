#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function.hpp>
#include <recchain/core/record.hpp>
#include <string>
#include <string_view>

namespace recchain::core {

/// Instruction emitted by the bridge: "@call <token>" invokes the host
/// function registered under <token> with the current record.
inline constexpr std::string_view kHostCallInstruction = "@call";

/// Expression micro-language understood by the reference stages.
///
/// A snippet is one of:
///   @call <token>    host function invocation (see HostFunctionBridge)
///   {{key/spec}}     value of a record field, null when absent
///   <json>           a JSON literal
/// Lines starting with '#' are comments.
class Snippet {
 public:
  enum class Kind {
    HostCall,
    Field,
    Literal,
  };

  [[nodiscard]] static Result<Snippet> parse(std::string_view text);

  [[nodiscard]] Result<Json> evaluate(const Record& record,
                                      const HostFunctionRegistry& host_functions) const;

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

  /// Token for HostCall, key spec for Field, empty for Literal.
  [[nodiscard]] const std::string& target() const noexcept { return target_; }

 private:
  Snippet(Kind kind, std::string target, Json literal)
      : kind_(kind), target_(std::move(target)), literal_(std::move(literal)) {}

  Kind kind_;
  std::string target_;
  Json literal_;
};

}  // namespace recchain::core
