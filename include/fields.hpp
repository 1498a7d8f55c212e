#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "amount.hpp"

// Column identifiers of the consolidated table. Every value after Name is a
// monetary field with a slot in Amounts.
enum class Field {
  Name,
  RemunerationWithContribution,
  RemunerationWithoutContribution,
  NetPayable,
  RemunerativeSupplement,
  HealthFundAdjustment,
  FamilyHealthFundDeduction
};

constexpr size_t kAmountFieldCount = 6;

using Amounts = std::array<Cents, kAmountFieldCount>;

// All fields in canonical column order, Name first.
const std::vector<Field>& allFields();

// Monetary fields only, in slot order.
const std::vector<Field>& amountFields();

bool isAmountField(Field field);

// Index into Amounts. Throws std::invalid_argument for Field::Name.
size_t amountSlot(Field field);

// Snake-case identifier used by configuration ("net_payable").
std::string fieldId(Field field);

// Label as printed by the payroll system ("Líquido").
std::string fieldLabel(Field field);

// Throws ConfigError for unknown identifiers.
Field parseFieldId(const std::string& id);

// Comma separated identifiers, any subset, any order. Duplicates are
// ignored after their first occurrence. Throws ConfigError.
std::vector<Field> parseFieldList(const std::string& list);
