#pragma once

#include <recchain/core/record.hpp>
#include <string>
#include <string_view>

namespace recchain::stages::detail {

/// Display form of a value: strings unquoted, null empty, others as JSON.
[[nodiscard]] std::string value_text(const core::Json& value);

/// Three-way comparison of the field at \p key_spec. Missing fields sort
/// first. Numeric mode compares numbers (strings are parsed, unparsable
/// ones count as 0); otherwise compares value_text() lexically.
[[nodiscard]] int compare_field(const core::Record& a,
                                const core::Record& b,
                                std::string_view key_spec,
                                bool numeric);

}  // namespace recchain::stages::detail
