#include "format_sniffer.hpp"

#include "logger.hpp"

namespace {

const char kPdfMagic[] = "%PDF-";
constexpr size_t kPdfMagicLength = sizeof(kPdfMagic) - 1;

} // namespace

DocumentKind classifyDocument(const std::string& bytes) {
  if (bytes.empty()) {
    Logger::warn("empty input, treating as plain text");
    return DocumentKind::PlainText;
  }
  if (bytes.size() >= kPdfMagicLength && bytes.compare(0, kPdfMagicLength, kPdfMagic) == 0) {
    return DocumentKind::RealDocument;
  }
  return DocumentKind::PlainText;
}

std::string documentKindName(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::RealDocument: return "pdf";
    case DocumentKind::PlainText:    return "text";
  }
  return "unknown";
}
