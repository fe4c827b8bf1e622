#include <recchain/core/snippet.hpp>
#include <string>

namespace recchain::core {

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

/// Drops comment lines and joins the rest with spaces.
std::string strip_comments(std::string_view text) {
  std::string body;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    const std::string_view line = trim(text.substr(start, end - start));
    if (!line.empty() && line.front() != '#') {
      if (!body.empty()) body += ' ';
      body.append(line);
    }
    start = end + 1;
  }
  return body;
}

}  // namespace

Result<Snippet> Snippet::parse(std::string_view text) {
  const std::string body = strip_comments(text);
  const std::string_view code = body;

  if (code.starts_with(kHostCallInstruction)) {
    const std::string_view token = trim(code.substr(kHostCallInstruction.size()));
    if (token.empty() || token.find_first_of(" \t") != std::string_view::npos) {
      return fail(PipelineError::InvalidArgument,
                  "malformed host call: " + std::string(code));
    }
    return Snippet(Kind::HostCall, std::string(token), Json{});
  }

  if (code.size() > 4 && code.starts_with("{{") && code.ends_with("}}")) {
    const std::string_view key = trim(code.substr(2, code.size() - 4));
    if (!key.empty() && key.find("}}") == std::string_view::npos) {
      return Snippet(Kind::Field, std::string(key), Json{});
    }
  }

  Json literal = Json::parse(code.begin(), code.end(), nullptr,
                             /*allow_exceptions=*/false);
  if (literal.is_discarded()) {
    return fail(PipelineError::InvalidArgument,
                "unsupported snippet: " + std::string(code));
  }
  return Snippet(Kind::Literal, std::string{}, std::move(literal));
}

Result<Json> Snippet::evaluate(const Record& record,
                               const HostFunctionRegistry& host_functions) const {
  switch (kind_) {
    case Kind::HostCall:
      return host_functions.invoke(target_, record);
    case Kind::Field: {
      const Json* value = record.get_path(target_);
      return value ? *value : Json{};
    }
    case Kind::Literal:
    default:
      return literal_;
  }
}

}  // namespace recchain::core
