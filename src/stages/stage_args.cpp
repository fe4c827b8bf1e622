#include "stage_args.hpp"
#include <algorithm>
#include <charconv>

namespace recchain::stages::detail {

namespace {

bool contains(std::initializer_list<std::string_view> names, std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

core::Result<ParsedArgs> parse_args(std::string_view stage,
                                    const core::StageArgs& args,
                                    std::initializer_list<std::string_view> value_options,
                                    std::initializer_list<std::string_view> flag_options) {
  ParsedArgs parsed;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.size() < 2 || arg[0] != '-') {
      parsed.positional.push_back(arg);
      continue;
    }
    if (contains(flag_options, arg)) {
      parsed.flags.insert(arg);
    } else if (contains(value_options, arg)) {
      if (i + 1 >= args.size()) {
        return core::fail(core::PipelineError::InvalidArgument,
                          std::string(stage) + ": option " + arg + " needs a value");
      }
      parsed.options.insert_or_assign(arg, args[++i]);
    } else {
      return core::fail(core::PipelineError::InvalidArgument,
                        std::string(stage) + ": unknown option " + arg);
    }
  }
  return parsed;
}

core::Result<std::size_t> parse_count(std::string_view stage,
                                      std::string_view option,
                                      const std::string& value) {
  std::size_t n = 0;
  const auto* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), last, n);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return core::fail(core::PipelineError::InvalidArgument,
                      std::string(stage) + ": " + std::string(option) +
                          " expects a non-negative integer, got '" + value + "'");
  }
  return n;
}

core::Result<std::string> required_option(std::string_view stage,
                                          const ParsedArgs& parsed,
                                          std::string_view option) {
  const std::string* value = parsed.option(option);
  if (!value) {
    return core::fail(core::PipelineError::InvalidArgument,
                      std::string(stage) + ": " + std::string(option) + " is required");
  }
  return *value;
}

}  // namespace recchain::stages::detail
