#include <recchain/core/input.hpp>
#include <iostream>
#include <sstream>

namespace recchain::core {

std::string stream_label(const std::istream& stream, const std::string& label) {
  if (&stream == &std::cin) return "stdin";
  if (!label.empty()) return label;
  std::ostringstream out;
  out << "stream@" << static_cast<const void*>(&stream);
  return out.str();
}

}  // namespace recchain::core
