#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace recchain::stages::detail {

/// Command-line style arguments split into options, flags and positionals.
struct ParsedArgs {
  std::map<std::string, std::string, std::less<>> options;
  std::set<std::string, std::less<>> flags;
  std::vector<std::string> positional;

  [[nodiscard]] bool has_flag(std::string_view name) const {
    return flags.find(name) != flags.end();
  }
  [[nodiscard]] const std::string* option(std::string_view name) const {
    auto it = options.find(name);
    return it == options.end() ? nullptr : &it->second;
  }
};

/// \p value_options take the next argument ("-n 3", "--key x");
/// \p flag_options take none. Anything not starting with '-' is positional.
/// InvalidArgument for unknown options or a missing value.
[[nodiscard]] core::Result<ParsedArgs> parse_args(
    std::string_view stage,
    const core::StageArgs& args,
    std::initializer_list<std::string_view> value_options,
    std::initializer_list<std::string_view> flag_options = {});

/// Non-negative integer option value.
[[nodiscard]] core::Result<std::size_t> parse_count(std::string_view stage,
                                                    std::string_view option,
                                                    const std::string& value);

/// Value of a required option, InvalidArgument when absent.
[[nodiscard]] core::Result<std::string> required_option(std::string_view stage,
                                                        const ParsedArgs& parsed,
                                                        std::string_view option);

}  // namespace recchain::stages::detail
