#pragma once

#include <string>
#include <vector>

struct WordBox {
  int pageNumber;
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

// Parses the XHTML printed by `pdftotext -bbox-layout` (or `-bbox`) into
// word boxes. Pages are numbered from 1 in order of appearance.
std::vector<WordBox> parseWordBoxes(const std::string& xhtml);

// Groups the words of each page into rows by vertical centre and returns one
// line per row, words ordered left to right. Pages follow each other with
// no separator line.
std::vector<std::string> layoutRows(std::vector<WordBox> words);

// parseWordBoxes + layoutRows, joined with '\n'.
std::string reconstructTextFromBoxes(const std::string& xhtml);
