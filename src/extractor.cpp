#include "extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "errors.hpp"
#include "logger.hpp"
#include "text_decode.hpp"
#include "word_layout.hpp"

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char ch : s) {
    if (ch == '\'') out += "'\\''";
    else out.push_back(ch);
  }
  out += "'";
  return out;
}

// Owns a private temporary file holding the document bytes; removes it on scope exit.
class TempFile {
public:
  explicit TempFile(const std::string& contents) {
    std::string pattern = (std::filesystem::temp_directory_path() / "liquidapro-XXXXXX").string();
    int fd = mkstemp(&pattern[0]);
    if (fd < 0) {
      throw ExtractionError("cannot create temporary file for PDF decoding");
    }
    ::close(fd);
    path_ = pattern;

    std::ofstream ofs(path_, std::ios::binary | std::ios::trunc);
    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    ofs.close();
    if (!ofs) {
      removeQuietly();
      throw ExtractionError("cannot write temporary file " + path_);
    }
  }

  ~TempFile() { removeQuietly(); }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

private:
  void removeQuietly() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) Logger::debug("could not remove " + path_ + ": " + ec.message());
  }

  std::string path_;
};

std::string runPdftotext(const std::string& options, const std::string& pdfPath) {
  if (!commandExists("pdftotext")) {
    throw ExtractionError(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
  std::string cmd = "pdftotext " + options + " -q " + shellQuote(pdfPath) + " - 2>/dev/null";
  std::string output;

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw ExtractionError("Failed to open pipe to pdftotext");
  }

  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw ExtractionError("pdftotext " + options + " returned non-zero exit code");
  }
  return output;
}

std::string extractWithWordLayout(const std::string& pdfPath) {
  return reconstructTextFromBoxes(runPdftotext("-bbox-layout", pdfPath));
}

std::string extractRaw(const std::string& pdfPath) {
  return runPdftotext("-raw -nopgbrk", pdfPath);
}

} // namespace

bool pdftotextAvailable() {
  return commandExists("pdftotext");
}

std::string extractPdfTextWith(const std::string& pdfPath,
                               const ExtractionStrategy& primary,
                               const ExtractionStrategy& fallback) {
  std::string primaryFailure;
  try {
    std::string text = primary(pdfPath);
    if (!isBlank(text)) {
      Logger::debug("word layout extraction: " + std::to_string(text.size()) + " chars");
      return text;
    }
    primaryFailure = "word layout produced no text";
  } catch (const std::exception& ex) {
    primaryFailure = ex.what();
  }
  Logger::warn("word layout extraction failed (" + primaryFailure + "), falling back to raw text");

  std::string fallbackFailure;
  try {
    std::string text = fallback(pdfPath);
    if (!isBlank(text)) {
      Logger::debug("raw extraction: " + std::to_string(text.size()) + " chars");
      return text;
    }
    fallbackFailure = "raw extraction produced no text";
  } catch (const std::exception& ex) {
    fallbackFailure = ex.what();
  }

  throw ExtractionError("cannot decode PDF: " + primaryFailure + "; " + fallbackFailure);
}

std::string extractPdfText(const std::string& pdfPath) {
  return extractPdfTextWith(pdfPath, extractWithWordLayout, extractRaw);
}

std::string extractDocumentText(const std::string& bytes, DocumentKind kind) {
  if (kind == DocumentKind::PlainText) {
    return decodePlainText(bytes);
  }
  TempFile file(bytes);
  return extractPdfText(file.path());
}
