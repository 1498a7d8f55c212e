#include "consolidator.hpp"
#include "csv_export.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "fields.hpp"
#include "logger.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--fields=name,net_payable,...] [--order=alpha|original] [--csv=out.csv]"
               " [--parallel] [--verbose|--quiet] <statement>...\n";
  std::cerr << "Fields:";
  for (Field f : allFields()) std::cerr << " " << fieldId(f);
  std::cerr << "\n";
}

bool readFile(const std::string& path, std::string& bytes) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  bytes.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

std::string jsonEscape(const std::string& s) {
  std::string out;
  for (char ch : s) {
    if (ch == '"' || ch == '\\') out.push_back('\\');
    out.push_back(ch);
  }
  return out;
}

void printResult(const PipelineResult& result) {
  // Compact JSON-like view
  std::cout << "{\n";
  std::cout << "  \"employees\": [\n";
  for (size_t i = 0; i < result.employees.size(); ++i) {
    const ConsolidatedEmployee& e = result.employees[i];
    std::cout << "    {";
    for (size_t c = 0; c < result.columns.size(); ++c) {
      Field f = result.columns[c];
      std::cout << "\"" << fieldId(f) << "\": \"";
      std::cout << (f == Field::Name ? jsonEscape(e.displayName) : formatLocale(e.amount(f))) << "\"";
      std::cout << (c + 1 == result.columns.size() ? "" : ", ");
    }
    std::cout << ", \"roles\": " << e.blockCount << "}";
    std::cout << (i + 1 == result.employees.size() ? "\n" : ",\n");
  }
  std::cout << "  ],\n";

  std::cout << "  \"totals\": {";
  for (size_t i = 0; i < result.grandTotals.size(); ++i) {
    std::cout << "\"" << fieldId(result.grandTotals[i].first) << "\": \""
              << formatLocale(result.grandTotals[i].second) << "\""
              << (i + 1 == result.grandTotals.size() ? "" : ", ");
  }
  std::cout << "},\n";

  std::cout << "  \"records\": " << result.totalBlocks << ",\n";
  std::cout << "  \"uniqueEmployees\": " << result.uniqueEmployees << ",\n";
  std::cout << "  \"skippedBlocks\": " << result.skippedBlocks << ",\n";
  std::cout << "  \"documentErrors\": [";
  for (size_t i = 0; i < result.documentErrors.size(); ++i) {
    std::cout << "\"" << jsonEscape(result.documentErrors[i].document) << ": "
              << jsonEscape(result.documentErrors[i].message) << "\""
              << (i + 1 == result.documentErrors.size() ? "" : ", ");
  }
  std::cout << "]\n";
  std::cout << "}\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::vector<std::string> paths;
    PipelineOptions options;
    std::string csvPath;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.rfind("--fields=", 0) == 0) {
        options.fields = parseFieldList(arg.substr(std::string("--fields=").size()));
      } else if (arg.rfind("--order=", 0) == 0) {
        options.ordering = parseOrdering(arg.substr(std::string("--order=").size()));
      } else if (arg.rfind("--csv=", 0) == 0) {
        csvPath = arg.substr(std::string("--csv=").size());
      } else if (arg == "--parallel") {
        options.parallel = true;
      } else if (arg == "--verbose") {
        Logger::setLevel(Logger::Level::Debug);
      } else if (arg == "--quiet") {
        Logger::setLevel(Logger::Level::Error);
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else {
        paths.push_back(arg);
      }
    }

    if (paths.empty()) {
      printUsage(argv[0]);
      return 2;
    }

    std::vector<InputDocument> documents;
    for (const std::string& path : paths) {
      InputDocument doc;
      doc.filename = std::filesystem::path(path).filename().string();
      if (!std::filesystem::exists(path) || !readFile(path, doc.bytes)) {
        Logger::error("cannot read " + path + ", skipped");
        continue;
      }
      documents.push_back(std::move(doc));
    }
    if (documents.empty()) {
      std::cerr << "No readable statement among the given files\n";
      return 2;
    }

    bool anyPdf = false;
    for (const InputDocument& doc : documents) {
      if (classifyDocument(doc.bytes) == DocumentKind::RealDocument) anyPdf = true;
    }
    if (anyPdf && !pdftotextAvailable()) {
      Logger::warn("pdftotext not found; PDF statements will be reported as failed documents");
    }

    options.progress.onDocumentStarted = [](size_t index, size_t total, const std::string& name) {
      Logger::info("reading " + name + " (" + std::to_string(index + 1) + "/" + std::to_string(total) + ")");
    };

    PipelineTask task = runPipelineAsync(std::move(documents), options);
    PipelineResult result = task.get();

    printResult(result);
    if (!csvPath.empty()) {
      writeResultAsCsvFile(result, csvPath);
      std::cerr << "Exported " << result.uniqueEmployees << " employee(s) to '" << csvPath << "'\n";
    }
    return 0;
  } catch (const ConfigError& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
