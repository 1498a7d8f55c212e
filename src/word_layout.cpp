#include "word_layout.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <string>

namespace {

void appendUtf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          bool ok = !digits.empty() && std::all_of(digits.begin(), digits.end(), [hex](unsigned char c) {
            return hex ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
          });
          if (ok && digits.size() <= 8) {
            appendUtf8(rep, std::stoul(digits, nullptr, hex ? 16 : 10));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size()/2, v.end());
  return v[v.size()/2];
}

struct RowGroup { double yCenter; std::vector<const WordBox*> words; };

std::vector<RowGroup> clusterRows(std::vector<WordBox>& wordsOnPage, double tolerance) {
  std::vector<RowGroup> rows;
  if (wordsOnPage.empty()) return rows;

  std::stable_sort(wordsOnPage.begin(), wordsOnPage.end(), [](const WordBox& a, const WordBox& b) {
    double ya = (a.yMin + a.yMax) * 0.5;
    double yb = (b.yMin + b.yMax) * 0.5;
    if (ya == yb) return a.xMin < b.xMin;
    return ya < yb; // top of the page first
  });

  for (const auto& w : wordsOnPage) {
    double yc = (w.yMin + w.yMax) * 0.5;
    if (rows.empty() || std::abs(yc - rows.back().yCenter) > tolerance) {
      rows.push_back(RowGroup{yc, {}});
    }
    RowGroup& row = rows.back();
    row.words.push_back(&w);
    // running average of the row centre
    row.yCenter = (row.yCenter * (row.words.size() - 1) + yc) / row.words.size();
  }

  for (auto& r : rows) {
    std::stable_sort(r.words.begin(), r.words.end(), [](const WordBox* a, const WordBox* b) {
      return a->xMin < b->xMin;
    });
  }
  return rows;
}

// Words further apart than this many line heights belong to separate cells.
constexpr double kCellGapFactor = 1.5;

std::string joinRow(const RowGroup& row, double lineHeight) {
  std::string line;
  const WordBox* prev = nullptr;
  for (const WordBox* w : row.words) {
    if (prev) {
      double gap = w->xMin - prev->xMax;
      line += (lineHeight > 0 && gap > lineHeight * kCellGapFactor) ? "   " : " ";
    }
    line += w->text;
    prev = w;
  }
  return line;
}

} // namespace

std::vector<WordBox> parseWordBoxes(const std::string& xhtml) {
  std::vector<WordBox> words;
  static const std::regex tokenRe(
    "<page\\b[^>]*>|<word\\s+xMin=\"([0-9.]+)\"\\s+yMin=\"([0-9.]+)\"\\s+xMax=\"([0-9.]+)\"\\s+yMax=\"([0-9.]+)\"\\s*>([^<]*)</word>");

  int currentPage = 0;
  auto begin = std::sregex_iterator(xhtml.begin(), xhtml.end(), tokenRe);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    if (!m[1].matched) {
      currentPage++;
      continue;
    }
    WordBox w;
    w.pageNumber = currentPage > 0 ? currentPage : 1;
    w.xMin = std::stod(m[1].str());
    w.yMin = std::stod(m[2].str());
    w.xMax = std::stod(m[3].str());
    w.yMax = std::stod(m[4].str());
    w.text = decodeEntities(m[5].str());
    if (!w.text.empty()) words.push_back(std::move(w));
  }
  return words;
}

std::vector<std::string> layoutRows(std::vector<WordBox> words) {
  std::map<int, std::vector<WordBox>> pageWords;
  for (auto& w : words) pageWords[w.pageNumber].push_back(std::move(w));

  std::vector<std::string> lines;
  for (auto& kv : pageWords) {
    std::vector<double> heights;
    heights.reserve(kv.second.size());
    for (const auto& w : kv.second) heights.push_back(w.yMax - w.yMin);
    double hMed = median(heights);
    double tol = hMed > 0 ? hMed * 0.5 : 3.0;

    for (const RowGroup& row : clusterRows(kv.second, tol)) {
      lines.push_back(joinRow(row, hMed));
    }
  }
  return lines;
}

std::string reconstructTextFromBoxes(const std::string& xhtml) {
  std::string text;
  for (const std::string& line : layoutRows(parseWordBoxes(xhtml))) {
    text += line;
    text.push_back('\n');
  }
  return text;
}
