#include "csv_export.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "logger.hpp"

namespace {

std::string escapeCell(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                    cell.find('\n') != std::string::npos || cell.find('\r') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

void writeRow(std::ostream& out, const std::vector<std::string>& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    out << escapeCell(row[i]);
    if (i + 1 < row.size()) out << ',';
  }
  out << "\n";
}

} // namespace

void writeResultAsCsv(const PipelineResult& result, std::ostream& out) {
  std::vector<std::string> header;
  for (Field f : result.columns) header.push_back(fieldLabel(f));
  writeRow(out, header);

  for (const ConsolidatedEmployee& e : result.employees) {
    std::vector<std::string> row;
    for (Field f : result.columns) row.push_back(result.cell(e, f));
    writeRow(out, row);
  }

  // The name column carries the label; without one the row is totals only.
  std::vector<std::string> totals;
  for (Field f : result.columns) {
    totals.push_back(isAmountField(f) ? formatCanonical(result.grandTotal(f)) : "TOTAL");
  }
  writeRow(out, totals);
}

void writeResultAsCsvFile(const PipelineResult& result, const std::string& path) {
  std::filesystem::path p(path);
  if (p.has_parent_path() && !std::filesystem::exists(p.parent_path())) {
    std::filesystem::create_directories(p.parent_path());
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("cannot open " + path + " for writing");
  }
  ofs << "\xEF\xBB\xBF";
  writeResultAsCsv(result, ofs);
  ofs.close();
  if (!ofs) {
    throw std::runtime_error("failed writing " + path);
  }
  Logger::info("CSV written: " + path);
}
