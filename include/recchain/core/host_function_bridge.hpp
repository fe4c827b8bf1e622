#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function.hpp>
#include <recchain/core/pipeline_spec.hpp>
#include <string>
#include <vector>

namespace recchain::core {

/// Literal arguments handed to a stage factory.
using StageArgs = std::vector<std::string>;

/// Turns host functions into textual stage arguments.
///
/// bridge() registers the closure and returns snippet text that, when a
/// stage evaluates it against a record, looks the token up in the registry
/// and calls the closure with that record. The closure itself is never
/// serialized; only the invocation instruction is text.
class HostFunctionBridge {
 public:
  /// \p annotate: prefix the text with the closure's description as comments.
  explicit HostFunctionBridge(HostFunctionRegistry& registry, bool annotate = true)
      : registry_(registry), annotate_(annotate) {}

  [[nodiscard]] Result<std::string> bridge(const HostFunctionHandle& fn);

  /// Literals pass through unchanged; host functions are bridged.
  [[nodiscard]] Result<StageArgs> bridge_args(const std::vector<Arg>& args);

 private:
  HostFunctionRegistry& registry_;
  bool annotate_;
};

}  // namespace recchain::core
