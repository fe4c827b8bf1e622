#pragma once

#include <recchain/core/error.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace recchain::app {

/// Runner configuration: result policy, host-function bridging, tracing.
struct RunnerConfig {
  /// Stages whose name starts with this prefix produce text.
  std::string text_stage_prefix{"to"};
  /// Names matching the prefix that still produce records.
  std::vector<std::string> record_stage_exceptions{"topn"};
  std::size_t max_host_functions{0};  // 0 = unbounded
  bool annotate_host_functions{true};
  bool trace{false};
};

/// Load config from a simple key=value file (one per line) or use defaults
/// when the file cannot be opened. InvalidConfig for a malformed value.
[[nodiscard]] core::Result<RunnerConfig> load_config(const std::string& path);

/// Default config when no file is provided.
RunnerConfig default_config();

/// Prefix match on text_stage_prefix, minus record_stage_exceptions.
[[nodiscard]] bool is_text_producing_stage(const RunnerConfig& config,
                                           std::string_view stage_name);

}  // namespace recchain::app
