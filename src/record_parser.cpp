#include "record_parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "logger.hpp"

namespace {

// es-AR amount as printed by the payroll system: "216881,97", "1.234,50-".
const std::string kAmountRe = "([-+]?\\d[\\d.]*,\\d{2}-?)";

// `anchor` is a literal every matching line contains; lines without it are
// not handed to the regex engine.
struct AmountPattern {
  Field field;
  const char* anchor;
  std::string pattern;
};

// One entry per monetary field. Adding a field is a row here plus a Field value.
const AmountPattern kAmountPatterns[] = {
  {Field::RemunerationWithContribution,    "Rem c/",     "Rem c/ Aporte\\s*:?\\s*" + kAmountRe},
  {Field::RemunerationWithoutContribution, "Rem s/",     "Rem s/ Aporte\\s*:?\\s*" + kAmountRe},
  {Field::NetPayable,                      "Liq",        "Liq\\.\\s*Pesos\\s*:\\s*" + kAmountRe},
  {Field::RemunerativeSupplement,          "Complemento", "Complemento Remunerativo\\s*:?\\s*" + kAmountRe},
  {Field::HealthFundAdjustment,            "APROSS",     "Ajuste Dif.*?APROSS\\s*:?\\s*" + kAmountRe},
  {Field::FamilyHealthFundDeduction,       "Voluntar",   "Descuento APROSS.*?Voluntar\\S*\\s*:?\\s*" + kAmountRe},
};

struct IdentityPattern {
  std::string RawEmployeeBlock::*member;
  const char* anchor;
  const char* pattern;
};

const IdentityPattern kIdentityPatterns[] = {
  {&RawEmployeeBlock::hrId,       "Hr:",        "Id\\.\\s*Hr:\\s*(\\d+)"},
  {&RawEmployeeBlock::position,   "Cargo:",     "Cargo:\\s*(\\d+)"},
  {&RawEmployeeBlock::role,       "Rol:",       "Rol:\\s*(\\d+)"},
  {&RawEmployeeBlock::daysWorked, "Dias Trab:", "Dias Trab:\\s*(\\d+)"},
  {&RawEmployeeBlock::startDate,  "Fecha Alta:", "Fecha Alta:\\s*([\\d/]+)"},
};

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

bool isBlank(const std::string& text, size_t begin, size_t end) {
  for (size_t i = begin; i < end; ++i) {
    if (!std::isspace(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

std::vector<std::string> splitLines(const std::string& text, size_t begin, size_t end) {
  std::vector<std::string> lines;
  size_t start = begin;
  while (start < end) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos || nl > end) nl = end;
    size_t stop = nl;
    if (stop > start && text[stop - 1] == '\r') stop--;
    lines.emplace_back(text, start, stop - start);
    start = nl + 1;
  }
  return lines;
}

// First capture of the first line matching `re`, in document order.
bool findFirst(const std::vector<std::string>& lines, const std::string& anchor,
               const std::regex& re, std::string& capture) {
  std::smatch m;
  for (const std::string& line : lines) {
    if (line.find(anchor) == std::string::npos) continue;
    if (std::regex_search(line, m, re)) {
      capture = m[1].str();
      return true;
    }
  }
  return false;
}

} // namespace

std::string ConceptLine::key() const {
  return kind + " " + code + " " + label;
}

RecordParser::RecordParser()
  : blockHeader_("Id\\.\\s*Hr:"),
    blockRule_("_{100,}"),
    name_("Apellido y Nombre\\s*:\\s*(.*?)\\s*(?:Centro Pago.*)?$"),
    concept_("\\b(DV|RT)\\s+(\\d+)\\s+(.+?)\\s+" + kAmountRe + "\\s*$") {
  for (const AmountPattern& p : kAmountPatterns) {
    amountRules_.push_back(AmountRule{p.field, p.anchor, std::regex(p.pattern)});
  }
  for (const IdentityPattern& p : kIdentityPatterns) {
    identityRules_.push_back(IdentityRule{p.member, p.anchor, std::regex(p.pattern)});
  }
}

std::vector<RecordParser::Segment> RecordParser::splitBlocks(const std::string& text) const {
  std::vector<Segment> segments;

  std::vector<size_t> starts;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), blockHeader_);
       it != std::sregex_iterator(); ++it) {
    starts.push_back(static_cast<size_t>(it->position()));
  }

  if (!starts.empty()) {
    if (starts.front() > 0) segments.push_back(Segment{0, starts.front(), true});
    for (size_t i = 0; i < starts.size(); ++i) {
      size_t end = i + 1 < starts.size() ? starts[i + 1] : text.size();
      segments.push_back(Segment{starts[i], end, false});
    }
    return segments;
  }

  // No "Id. Hr:" headers: fall back to the underscore rule lines between entries.
  size_t begin = 0;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), blockRule_);
       it != std::sregex_iterator(); ++it) {
    size_t pos = static_cast<size_t>(it->position());
    segments.push_back(Segment{begin, pos, segments.empty()});
    begin = pos + static_cast<size_t>(it->length());
  }
  segments.push_back(Segment{begin, text.size(), segments.empty()});
  return segments;
}

bool RecordParser::parseBlock(const std::vector<std::string>& lines, RawEmployeeBlock& block,
                              std::vector<std::string>& problems) const {
  std::string name;
  if (!findFirst(lines, "Apellido y Nombre", name_, name) || trim(name).empty()) {
    return false;
  }
  block.name = trim(name);

  std::string value;
  for (const IdentityRule& rule : identityRules_) {
    if (findFirst(lines, rule.anchor, rule.pattern, value)) block.*(rule.member) = value;
  }

  for (const AmountRule& rule : amountRules_) {
    if (!findFirst(lines, rule.anchor, rule.pattern, value)) continue;
    auto amount = parseLocaleAmount(value);
    if (amount) {
      block.setAmount(rule.field, *amount);
    } else {
      problems.push_back("unreadable amount '" + value + "' for " + fieldId(rule.field));
    }
  }

  std::smatch m;
  for (const std::string& line : lines) {
    if (line.find("DV") == std::string::npos && line.find("RT") == std::string::npos) continue;
    if (!std::regex_search(line, m, concept_)) continue;
    auto amount = parseLocaleAmount(m[4].str());
    if (!amount) {
      problems.push_back("unreadable concept amount '" + m[4].str() + "'");
      continue;
    }
    ConceptLine c;
    c.kind = m[1].str();
    c.code = m[2].str();
    c.label = trim(m[3].str());
    c.amount = *amount;
    block.concepts.push_back(std::move(c));
  }
  return true;
}

ParsedDocument RecordParser::parse(const std::string& text, const std::string& sourceId) const {
  ParsedDocument doc;
  size_t index = 0;

  for (const Segment& seg : splitBlocks(text)) {
    if (isBlank(text, seg.begin, seg.end)) continue;

    RawEmployeeBlock block;
    block.sourceDocument = sourceId;
    block.blockIndex = index;

    std::vector<std::string> problems;
    bool named = parseBlock(splitLines(text, seg.begin, seg.end), block, problems);
    if (!named) {
      // Header text before the first entry is not an employee block.
      if (seg.preamble) continue;
      doc.skippedBlocks++;
      doc.warnings.push_back(ParseWarning{sourceId, index, "block has no employee name"});
      Logger::warn(sourceId + ": block " + std::to_string(index) + " has no employee name, skipped");
      index++;
      continue;
    }

    for (const std::string& p : problems) {
      doc.warnings.push_back(ParseWarning{sourceId, index, p});
      Logger::warn(sourceId + ": block " + std::to_string(index) + ": " + p);
    }
    doc.blocks.push_back(std::move(block));
    index++;
  }

  Logger::debug(sourceId + ": " + std::to_string(doc.blocks.size()) + " blocks, " +
                std::to_string(doc.skippedBlocks) + " skipped");
  return doc;
}

std::vector<Field> availableFields(const std::vector<RawEmployeeBlock>& blocks) {
  std::vector<Field> fields;
  for (Field f : allFields()) {
    bool always = f == Field::Name || f == Field::RemunerationWithContribution || f == Field::NetPayable;
    if (always || std::any_of(blocks.begin(), blocks.end(), [f](const RawEmployeeBlock& b) {
          return b.amount(f) != 0;
        })) {
      fields.push_back(f);
    }
  }
  return fields;
}
