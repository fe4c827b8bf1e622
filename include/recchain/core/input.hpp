#pragma once

#include <recchain/core/record.hpp>
#include <istream>
#include <string>
#include <variant>
#include <vector>

namespace recchain::core {

/// Open text stream read one line at a time.
struct StreamSource {
  std::istream* stream{nullptr};
  /// Attribution label; derived from the stream when empty.
  std::string label;
};

/// Input for one run. Exactly one shape, chosen by the named constructor.
class Input {
 public:
  using Source = std::variant<std::monostate,
                              StreamSource,
                              std::vector<std::string>,
                              std::vector<Json>>;

  Input() = default;

  [[nodiscard]] static Input none() { return Input{}; }

  /// The stream must outlive the run; it is read, never closed.
  [[nodiscard]] static Input from_stream(std::istream& stream, std::string label = {}) {
    return Input(Source{StreamSource{&stream, std::move(label)}});
  }

  [[nodiscard]] static Input from_lines(std::vector<std::string> lines) {
    return Input(Source{std::move(lines)});
  }

  /// Each element must be a JSON object; checked when the run starts.
  [[nodiscard]] static Input from_records(std::vector<Json> records) {
    return Input(Source{std::move(records)});
  }

  [[nodiscard]] bool empty() const noexcept {
    return std::holds_alternative<std::monostate>(source_);
  }

  [[nodiscard]] const Source& source() const noexcept { return source_; }

 private:
  explicit Input(Source source) : source_(std::move(source)) {}

  Source source_;
};

/// "stdin" for std::cin, else \p label, else "stream@<address>".
[[nodiscard]] std::string stream_label(const std::istream& stream, const std::string& label);

}  // namespace recchain::core
