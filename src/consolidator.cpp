#include "consolidator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace {

// Lead byte of the two-byte UTF-8 sequences for U+00C0..U+00FF.
constexpr unsigned char kLatin1Lead = 0xC3;

bool isSpaceAt(const std::string& s, size_t i, size_t& width) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (std::isspace(c)) { width = 1; return true; }
  // U+00A0 no-break space
  if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) {
    width = 2;
    return true;
  }
  return false;
}

// Latin-1 letter (second byte after 0xC3) folded to lower case.
unsigned char foldLatin1(unsigned char trail) {
  // 0x80..0x9E are upper case except 0x97 (multiplication sign).
  if (trail >= 0x80 && trail <= 0x9E && trail != 0x97) return static_cast<unsigned char>(trail + 0x20);
  return trail;
}

// Base letter of a lower-case Latin-1 letter, 0 when it has none.
char baseLetter(unsigned char trail) {
  switch (trail) {
    case 0xA0: case 0xA1: case 0xA2: case 0xA3: case 0xA4: case 0xA5: return 'a';
    case 0xA7: return 'c';
    case 0xA8: case 0xA9: case 0xAA: case 0xAB: return 'e';
    case 0xAC: case 0xAD: case 0xAE: case 0xAF: return 'i';
    case 0xB2: case 0xB3: case 0xB4: case 0xB5: case 0xB6: return 'o';
    case 0xB9: case 0xBA: case 0xBB: case 0xBC: return 'u';
    case 0xBD: case 0xBF: return 'y';
    default: return 0;
  }
}

void addConcept(std::vector<ConceptTotal>& totals, const std::string& key, Cents amount) {
  for (ConceptTotal& t : totals) {
    if (t.key == key) {
      t.amount += amount;
      return;
    }
  }
  totals.push_back(ConceptTotal{key, amount});
}

void addHrId(std::vector<std::string>& ids, const std::string& id) {
  if (id.empty()) return;
  if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
}

} // namespace

bool operator==(const ConceptTotal& a, const ConceptTotal& b) {
  return a.key == b.key && a.amount == b.amount;
}

bool operator==(const ConsolidatedEmployee& a, const ConsolidatedEmployee& b) {
  return a.normalizedName == b.normalizedName &&
         a.displayName == b.displayName &&
         a.amounts == b.amounts &&
         a.blockCount == b.blockCount &&
         a.hrIds == b.hrIds &&
         a.concepts == b.concepts;
}

bool operator!=(const ConsolidatedEmployee& a, const ConsolidatedEmployee& b) {
  return !(a == b);
}

std::string normalizeName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  bool pendingSpace = false;
  size_t i = 0;
  while (i < name.size()) {
    size_t width = 0;
    if (isSpaceAt(name, i, width)) {
      pendingSpace = !out.empty();
      i += width;
      continue;
    }
    if (pendingSpace) {
      out.push_back(' ');
      pendingSpace = false;
    }
    unsigned char c = static_cast<unsigned char>(name[i]);
    if (c == kLatin1Lead && i + 1 < name.size()) {
      out.push_back(static_cast<char>(c));
      out.push_back(static_cast<char>(foldLatin1(static_cast<unsigned char>(name[i + 1]))));
      i += 2;
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
    i++;
  }
  return out;
}

ConsolidatedEmployee& ConsolidationAccumulator::slotFor(const std::string& normalized,
                                                        const std::string& displayName) {
  auto it = index_.find(normalized);
  if (it != index_.end()) return employees_[it->second];

  index_.emplace(normalized, employees_.size());
  ConsolidatedEmployee e;
  e.normalizedName = normalized;
  e.displayName = displayName;
  employees_.push_back(std::move(e));
  return employees_.back();
}

ConsolidationAccumulator fold(ConsolidationAccumulator acc, RawEmployeeBlock block) {
  ConsolidatedEmployee& e = acc.slotFor(normalizeName(block.name), block.name);
  for (size_t i = 0; i < kAmountFieldCount; ++i) e.amounts[i] += block.amounts[i];
  e.blockCount++;
  addHrId(e.hrIds, block.hrId);
  for (const ConceptLine& c : block.concepts) addConcept(e.concepts, c.key(), c.amount);
  return acc;
}

ConsolidationAccumulator merge(ConsolidationAccumulator acc, ConsolidatedEmployee employee) {
  std::string key = employee.normalizedName.empty() ? normalizeName(employee.displayName)
                                                    : employee.normalizedName;
  ConsolidatedEmployee& e = acc.slotFor(key, employee.displayName);
  for (size_t i = 0; i < kAmountFieldCount; ++i) e.amounts[i] += employee.amounts[i];
  e.blockCount += employee.blockCount;
  for (const std::string& id : employee.hrIds) addHrId(e.hrIds, id);
  for (const ConceptTotal& c : employee.concepts) addConcept(e.concepts, c.key, c.amount);
  return acc;
}

std::vector<ConsolidatedEmployee> consolidate(std::vector<RawEmployeeBlock> blocks) {
  const size_t blockTotal = blocks.size();
  ConsolidationAccumulator acc;
  for (auto& b : blocks) acc = fold(std::move(acc), std::move(b));
  Logger::info("consolidated " + std::to_string(blockTotal) + " blocks into " +
               std::to_string(acc.size()) + " employees");
  return std::move(acc).take();
}

std::vector<ConsolidatedEmployee> reconsolidate(std::vector<ConsolidatedEmployee> employees) {
  ConsolidationAccumulator acc;
  for (auto& e : employees) acc = merge(std::move(acc), std::move(e));
  return std::move(acc).take();
}

Ordering parseOrdering(const std::string& name) {
  std::string key = name;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (key == "original") return Ordering::Original;
  if (key == "alpha" || key == "alphabetical") return Ordering::Alphabetical;
  throw ConfigError("unknown ordering: '" + name + "' (expected 'alpha' or 'original')");
}

std::string orderingName(Ordering ordering) {
  return ordering == Ordering::Original ? "original" : "alphabetical";
}

std::string collationKey(const std::string& name) {
  std::string folded = normalizeName(name);
  std::string key;
  key.reserve(folded.size());
  for (size_t i = 0; i < folded.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(folded[i]);
    if (c == kLatin1Lead && i + 1 < folded.size()) {
      unsigned char trail = static_cast<unsigned char>(folded[++i]);
      if (trail == 0xB1) {
        // ñ sorts after every other n
        key.push_back('n');
        key.push_back('\x7F');
      } else if (char base = baseLetter(trail)) {
        key.push_back(base);
      } else {
        key.push_back(static_cast<char>(c));
        key.push_back(static_cast<char>(trail));
      }
      continue;
    }
    key.push_back(static_cast<char>(c));
  }
  return key;
}

std::vector<ConsolidatedEmployee> orderEmployees(std::vector<ConsolidatedEmployee> employees,
                                                 Ordering ordering) {
  if (ordering == Ordering::Original) return employees;

  std::vector<std::pair<std::string, ConsolidatedEmployee>> keyed;
  keyed.reserve(employees.size());
  for (auto& e : employees) {
    std::string key = collationKey(e.displayName);
    keyed.emplace_back(std::move(key), std::move(e));
  }
  std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first < b.first;
    if (a.second.normalizedName != b.second.normalizedName) {
      return a.second.normalizedName < b.second.normalizedName;
    }
    return a.second.displayName < b.second.displayName;
  });

  std::vector<ConsolidatedEmployee> out;
  out.reserve(keyed.size());
  for (auto& kv : keyed) out.push_back(std::move(kv.second));
  return out;
}
