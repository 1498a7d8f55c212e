#pragma once

#include <map>
#include <string>
#include <vector>

#include "amount.hpp"
#include "fields.hpp"
#include "record_parser.hpp"

struct ConceptTotal {
  std::string key;
  Cents amount = 0;
};

// One person after merging every block (role) that shares a normalized name.
struct ConsolidatedEmployee {
  std::string normalizedName;
  std::string displayName;
  Amounts amounts{};
  size_t blockCount = 0;
  std::vector<std::string> hrIds;
  std::vector<ConceptTotal> concepts;

  Cents amount(Field field) const { return amounts[amountSlot(field)]; }
};

bool operator==(const ConceptTotal& a, const ConceptTotal& b);
bool operator==(const ConsolidatedEmployee& a, const ConsolidatedEmployee& b);
bool operator!=(const ConsolidatedEmployee& a, const ConsolidatedEmployee& b);

// Merge key: trimmed, internal whitespace collapsed to one space, case-folded
// (ASCII and the Latin-1 letters of UTF-8, so "Ñ" and "ñ" compare equal).
std::string normalizeName(const std::string& name);

// Order-preserving accumulation of employees keyed by normalized name.
// It is a plain value: fold() and merge() take it and hand back the updated one.
class ConsolidationAccumulator {
public:
  const std::vector<ConsolidatedEmployee>& employees() const { return employees_; }
  size_t size() const { return employees_.size(); }
  bool empty() const { return employees_.empty(); }

  // Releases the employees in first-seen order.
  std::vector<ConsolidatedEmployee> take() && { return std::move(employees_); }

private:
  friend ConsolidationAccumulator fold(ConsolidationAccumulator acc, RawEmployeeBlock block);
  friend ConsolidationAccumulator merge(ConsolidationAccumulator acc, ConsolidatedEmployee employee);

  ConsolidatedEmployee& slotFor(const std::string& normalized, const std::string& displayName);

  std::vector<ConsolidatedEmployee> employees_;
  std::map<std::string, size_t> index_;
};

// Adds one block: amounts summed field by field, blockCount + 1.
ConsolidationAccumulator fold(ConsolidationAccumulator acc, RawEmployeeBlock block);

// Adds an already consolidated record: amounts and blockCount summed.
ConsolidationAccumulator merge(ConsolidationAccumulator acc, ConsolidatedEmployee employee);

// One employee per normalized name, in first-seen order.
std::vector<ConsolidatedEmployee> consolidate(std::vector<RawEmployeeBlock> blocks);

// Consolidates records that may themselves be partial consolidations
// (for instance one per document). Consolidated input comes back unchanged.
std::vector<ConsolidatedEmployee> reconsolidate(std::vector<ConsolidatedEmployee> employees);

enum class Ordering {
  Original,
  Alphabetical
};

// "original" or "alpha"/"alphabetical". Throws ConfigError.
Ordering parseOrdering(const std::string& name);

std::string orderingName(Ordering ordering);

// Primary sort key for Spanish names: accents and case ignored, "ñ" after "n".
std::string collationKey(const std::string& name);

// Original keeps the input order; Alphabetical sorts by collationKey, then
// by the exact bytes so that the result never depends on input order.
std::vector<ConsolidatedEmployee> orderEmployees(std::vector<ConsolidatedEmployee> employees,
                                                 Ordering ordering);
