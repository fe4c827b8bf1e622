#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/snippet.hpp>
#include <string_view>

namespace recchain::core {

namespace {

std::string comment_block(std::string_view description) {
  std::string out;
  std::size_t start = 0;
  while (start < description.size()) {
    auto end = description.find('\n', start);
    if (end == std::string_view::npos) end = description.size();
    out += "# ";
    out.append(description.substr(start, end - start));
    out += '\n';
    start = end + 1;
  }
  return out;
}

}  // namespace

Result<std::string> HostFunctionBridge::bridge(const HostFunctionHandle& fn) {
  auto token = registry_.register_function(fn);
  if (!token) {
    return std::unexpected(token.error());
  }

  std::string text;
  if (annotate_ && !fn->description.empty()) {
    text = comment_block(fn->description);
  }
  text.append(kHostCallInstruction);
  text += ' ';
  text += *token;
  return text;
}

Result<StageArgs> HostFunctionBridge::bridge_args(const std::vector<Arg>& args) {
  StageArgs out;
  out.reserve(args.size());
  for (const auto& arg : args) {
    if (const auto* literal = std::get_if<std::string>(&arg)) {
      out.push_back(*literal);
      continue;
    }
    auto text = bridge(std::get<HostFunctionHandle>(arg));
    if (!text) {
      return std::unexpected(text.error());
    }
    out.push_back(std::move(*text));
  }
  return out;
}

}  // namespace recchain::core
