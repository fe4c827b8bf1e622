#pragma once

#include <recchain/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace recchain::core {

/// Field values keep insertion order, like the records they come from.
using Json = nlohmann::ordered_json;

/// One unit of data flowing through a chain: ordered field name -> value.
/// Values may be scalars or nested objects/arrays.
class Record {
 public:
  Record() : fields_(Json::object()) {}

  /// Wraps an existing JSON object. Use from_json() when the value is untrusted.
  explicit Record(Json fields) : fields_(std::move(fields)) {}

  /// Fails with InvalidRecord unless \p value is a JSON object.
  [[nodiscard]] static Result<Record> from_json(Json value);

  /// Parses one line of JSON text; the line must hold a single object.
  [[nodiscard]] static Result<Record> parse(std::string_view line);

  [[nodiscard]] bool has(std::string_view key) const;

  /// Value of a top-level field, or nullptr when absent.
  [[nodiscard]] const Json* get(std::string_view key) const;

  /// Value addressed by a key spec; "a/b" descends into nested objects.
  [[nodiscard]] const Json* get_path(std::string_view key_spec) const;

  void set(std::string_view key, Json value);

  /// Assigns through a key spec, creating intermediate objects as needed.
  void set_path(std::string_view key_spec, Json value);

  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

  /// Plain mapping view of the record.
  [[nodiscard]] const Json& as_json() const& noexcept { return fields_; }
  [[nodiscard]] Json into_json() && noexcept { return std::move(fields_); }

  /// Compact single-line JSON; the line format used between stages.
  [[nodiscard]] std::string to_line() const;

  friend bool operator==(const Record& a, const Record& b) {
    return a.fields_ == b.fields_;
  }

 private:
  Json fields_;
};

/// Truthiness used by filtering stages: null, false, 0, "" and empty
/// containers are false.
[[nodiscard]] bool is_truthy(const Json& value);

}  // namespace recchain::core
