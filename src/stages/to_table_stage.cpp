#include <recchain/stages/to_table_stage.hpp>
#include "record_order.hpp"
#include "stage_args.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace recchain::stages {

namespace {

constexpr std::size_t kColumnGap = 3;

std::string format_row(const std::vector<std::string>& cells,
                       const std::vector<std::size_t>& widths) {
  std::string row;
  for (std::size_t c = 0; c < cells.size(); ++c) {
    row += cells[c];
    if (c + 1 < cells.size()) {
      row.append(widths[c] - cells[c].size() + kColumnGap, ' ');
    }
  }
  return row;
}

}  // namespace

core::Result<std::unique_ptr<core::IStage>> ToTableStage::create(
    const core::RunContext& /*context*/, const core::StageArgs& args, core::IRecordConsumer& next) {
  auto parsed = detail::parse_args("totable", args, {});
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return std::make_unique<ToTableStage>(next);
}

core::Result<bool> ToTableStage::accept_record(core::Record record) {
  buffer_.push_back(std::move(record));
  return true;
}

core::Result<void> ToTableStage::finish() {
  if (!buffer_.empty()) {
    std::vector<std::string> columns;
    for (const auto& record : buffer_) {
      for (const auto& field : record.as_json().items()) {
        if (std::find(columns.begin(), columns.end(), field.key()) == columns.end()) {
          columns.push_back(field.key());
        }
      }
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(buffer_.size() + 2);
    rows.push_back(columns);
    rows.emplace_back();
    for (const auto& record : buffer_) {
      std::vector<std::string> cells;
      cells.reserve(columns.size());
      for (const auto& column : columns) {
        const core::Json* value = record.get(column);
        cells.push_back(value ? detail::value_text(*value) : std::string{});
      }
      rows.push_back(std::move(cells));
    }

    std::vector<std::size_t> widths(columns.size(), 0);
    for (const auto& row : rows) {
      for (std::size_t c = 0; c < row.size(); ++c) {
        widths[c] = std::max(widths[c], row[c].size());
      }
    }
    for (std::size_t c = 0; c < columns.size(); ++c) {
      rows[1].push_back(std::string(widths[c], '-'));
    }

    for (const auto& row : rows) {
      auto more = push_line(format_row(row, widths));
      if (!more) {
        return std::unexpected(more.error());
      }
      if (!*more) break;
    }
    buffer_.clear();
  }
  return next().finish();
}

}  // namespace recchain::stages
