#pragma once

#include <functional>
#include <string>

#include "format_sniffer.hpp"

// Returns the flat text of a document. Real PDFs are decoded with poppler's
// `pdftotext`: first word boxes rebuilt into rows (-bbox-layout), then the
// raw content stream order (-raw) when the first strategy fails or yields
// nothing. Plain-text payloads are decoded to UTF-8 without binary parsing.
// Throws ExtractionError when no strategy yields text.
std::string extractDocumentText(const std::string& bytes, DocumentKind kind);

// Same as above for a PDF already on disk.
std::string extractPdfText(const std::string& pdfPath);

// Decodes the PDF at the given path to text, or throws.
using ExtractionStrategy = std::function<std::string(const std::string& pdfPath)>;

// The two-strategy chain behind extractPdfText. `fallback` runs when `primary`
// throws or yields blank text; when both fail the ExtractionError names both
// reasons.
std::string extractPdfTextWith(const std::string& pdfPath,
                               const ExtractionStrategy& primary,
                               const ExtractionStrategy& fallback);

bool pdftotextAvailable();
