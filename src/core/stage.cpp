#include <recchain/core/stage.hpp>

namespace recchain::core {

Result<bool> StageBase::accept_line(std::string_view line) {
  auto record = Record::parse(line);
  if (!record) {
    return std::unexpected(record.error());
  }
  return accept_record(std::move(*record));
}

}  // namespace recchain::core
