#pragma once

#include <ostream>
#include <string>

#include "pipeline.hpp"

// Writes the projected table: a header row of field labels, one row per
// employee and a closing "TOTAL" row with the grand totals.
void writeResultAsCsv(const PipelineResult& result, std::ostream& out);

// Same, into a file prefixed with a UTF-8 BOM so spreadsheet programs pick
// the right encoding. Parent directories are created. Throws
// std::runtime_error when the file cannot be written.
void writeResultAsCsvFile(const PipelineResult& result, const std::string& path);
