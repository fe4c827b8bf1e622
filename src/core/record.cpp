#include <recchain/core/record.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace recchain::core {

namespace {

std::vector<std::string> split_key_spec(std::string_view key_spec) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = key_spec.find('/', start);
    parts.emplace_back(key_spec.substr(start, pos == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : pos - start));
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return parts;
}

}  // namespace

Result<Record> Record::from_json(Json value) {
  if (!value.is_object()) {
    return fail(PipelineError::InvalidRecord,
                "record must be a JSON object, got " + value.dump());
  }
  return Record(std::move(value));
}

Result<Record> Record::parse(std::string_view line) {
  Json value = Json::parse(line.begin(), line.end(), nullptr,
                           /*allow_exceptions=*/false);
  if (value.is_discarded()) {
    return fail(PipelineError::InvalidRecord,
                "invalid JSON: " + std::string(line));
  }
  return from_json(std::move(value));
}

bool Record::has(std::string_view key) const {
  return get(key) != nullptr;
}

const Json* Record::get(std::string_view key) const {
  auto it = fields_.find(std::string(key));
  return it == fields_.end() ? nullptr : &*it;
}

const Json* Record::get_path(std::string_view key_spec) const {
  const Json* node = &fields_;
  for (const auto& part : split_key_spec(key_spec)) {
    if (!node->is_object()) return nullptr;
    auto it = node->find(part);
    if (it == node->end()) return nullptr;
    node = &*it;
  }
  return node;
}

void Record::set(std::string_view key, Json value) {
  fields_[std::string(key)] = std::move(value);
}

void Record::set_path(std::string_view key_spec, Json value) {
  Json* node = &fields_;
  for (const auto& part : split_key_spec(key_spec)) {
    if (!node->is_object()) *node = Json::object();
    node = &(*node)[part];
  }
  *node = std::move(value);
}

std::string Record::to_line() const {
  return fields_.dump();
}

bool is_truthy(const Json& value) {
  switch (value.type()) {
    case Json::value_t::null:
      return false;
    case Json::value_t::boolean:
      return value.get<bool>();
    case Json::value_t::number_integer:
      return value.get<std::int64_t>() != 0;
    case Json::value_t::number_unsigned:
      return value.get<std::uint64_t>() != 0;
    case Json::value_t::number_float:
      return value.get<double>() != 0.0;
    case Json::value_t::string:
      return !value.get_ref<const std::string&>().empty();
    case Json::value_t::array:
    case Json::value_t::object:
      return !value.empty();
    default:
      return false;
  }
}

}  // namespace recchain::core
