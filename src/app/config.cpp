#include <recchain/app/config.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>

namespace recchain::app {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(kBlank);
  if (start == std::string_view::npos) return {};
  return s.substr(start, s.find_last_not_of(kBlank) - start + 1);
}

/// One "key = value" line with both sides trimmed.
struct Setting {
  std::string key;
  std::string value;
};

std::optional<Setting> parse_setting(std::string_view line) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return std::nullopt;
  Setting setting{std::string(trim(line.substr(0, pos))),
                  std::string(trim(line.substr(pos + 1)))};
  if (setting.key.empty()) return std::nullopt;
  return setting;
}

std::vector<std::string> split_list(std::string_view value) {
  std::vector<std::string> out;
  while (!value.empty()) {
    const auto comma = value.find(',');
    const auto item = trim(value.substr(0, comma));
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return out;
}

core::Result<bool> parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return core::fail(core::PipelineError::InvalidConfig,
                    key + ": expected true or false, got '" + value + "'");
}

core::Result<std::size_t> parse_size(const std::string& key, const std::string& value) {
  std::size_t n = 0;
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, n);
  if (ec != std::errc{} || ptr != last || value.empty()) {
    return core::fail(core::PipelineError::InvalidConfig,
                      key + ": expected a non-negative integer, got '" + value + "'");
  }
  return n;
}

}  // namespace

RunnerConfig default_config() {
  RunnerConfig c;
  c.text_stage_prefix = "to";
  c.record_stage_exceptions = {"topn"};
  c.max_host_functions = 0;
  c.annotate_host_functions = true;
  c.trace = false;
  return c;
}

core::Result<RunnerConfig> load_config(const std::string& path) {
  RunnerConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string raw;
  while (std::getline(f, raw)) {
    const auto line = trim(raw);
    if (line.empty() || line.front() == '#') continue;
    auto setting = parse_setting(line);
    if (!setting) continue;
    const std::string& key = setting->key;
    const std::string& value = setting->value;

    if (key == "text_stage_prefix") c.text_stage_prefix = value;
    else if (key == "record_stage_exceptions") c.record_stage_exceptions = split_list(value);
    else if (key == "max_host_functions") {
      auto n = parse_size(key, value);
      if (!n) return std::unexpected(n.error());
      c.max_host_functions = *n;
    }
    else if (key == "annotate_host_functions") {
      auto b = parse_bool(key, value);
      if (!b) return std::unexpected(b.error());
      c.annotate_host_functions = *b;
    }
    else if (key == "trace") {
      auto b = parse_bool(key, value);
      if (!b) return std::unexpected(b.error());
      c.trace = *b;
    }
  }
  return c;
}

bool is_text_producing_stage(const RunnerConfig& config, std::string_view stage_name) {
  if (config.text_stage_prefix.empty() ||
      !stage_name.starts_with(config.text_stage_prefix)) {
    return false;
  }
  return std::find(config.record_stage_exceptions.begin(),
                   config.record_stage_exceptions.end(),
                   stage_name) == config.record_stage_exceptions.end();
}

}  // namespace recchain::app
