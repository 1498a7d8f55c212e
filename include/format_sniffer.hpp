#pragma once

#include <string>

enum class DocumentKind {
  RealDocument,
  PlainText
};

// Classifies raw bytes by content alone. Bytes starting with the PDF magic
// "%PDF-" are a RealDocument; anything else, empty input included, is
// PlainText. Never throws.
DocumentKind classifyDocument(const std::string& bytes);

std::string documentKindName(DocumentKind kind);
