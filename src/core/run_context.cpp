#include <recchain/core/run_context.hpp>

namespace recchain::core {

std::string RunContext::location() const {
  if (current_source_.empty()) return {};
  return current_source_ + ":" + std::to_string(current_line_) + ": ";
}

}  // namespace recchain::core
