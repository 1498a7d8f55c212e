#pragma once

#include <string>

bool isValidUtf8(const std::string& bytes);

// Transcodes Windows-1252 bytes (a superset of Latin-1 for printable text)
// to UTF-8. Unassigned code points become U+FFFD.
std::string windows1252ToUtf8(const std::string& bytes);

// Plain-text payload to UTF-8: strips a UTF-8 BOM, keeps valid UTF-8 as is,
// otherwise assumes Windows-1252.
std::string decodePlainText(const std::string& bytes);
