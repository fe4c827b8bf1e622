#include "record_order.hpp"
#include <cstdlib>

namespace recchain::stages::detail {

namespace {

double numeric_value(const core::Json& value) {
  if (value.is_number()) return value.get<double>();
  if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
  if (value.is_string()) {
    const std::string& s = value.get_ref<const std::string&>();
    return std::strtod(s.c_str(), nullptr);
  }
  return 0.0;
}

}  // namespace

std::string value_text(const core::Json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return {};
  return value.dump();
}

int compare_field(const core::Record& a,
                  const core::Record& b,
                  std::string_view key_spec,
                  bool numeric) {
  const core::Json* va = a.get_path(key_spec);
  const core::Json* vb = b.get_path(key_spec);
  if (!va || !vb) {
    return (va ? 1 : 0) - (vb ? 1 : 0);
  }
  if (numeric) {
    const double x = numeric_value(*va);
    const double y = numeric_value(*vb);
    return x < y ? -1 : (y < x ? 1 : 0);
  }
  return value_text(*va).compare(value_text(*vb));
}

}  // namespace recchain::stages::detail
