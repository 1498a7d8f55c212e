#include "fields.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "errors.hpp"

namespace {

struct FieldInfo {
  Field field;
  const char* id;
  const char* label;
};

const FieldInfo kFieldTable[] = {
  {Field::Name,                            "name",                              "Apellido y Nombre"},
  {Field::RemunerationWithContribution,    "remuneration_with_contribution",    "Rem c/ Aporte"},
  {Field::RemunerationWithoutContribution, "remuneration_without_contribution", "Rem s/ Aporte"},
  {Field::NetPayable,                      "net_payable",                       "L\xC3\xADquido"},
  {Field::RemunerativeSupplement,          "remunerative_supplement",           "Complemento Remunerativo"},
  {Field::HealthFundAdjustment,            "health_fund_adjustment",            "Ajuste Dif. Aporte M\xC3\xADnimo APROSS"},
  {Field::FamilyHealthFundDeduction,       "family_health_fund_deduction",      "Descuento APROSS por afiliados Familiares Voluntar"},
};

const FieldInfo& info(Field field) {
  for (const FieldInfo& fi : kFieldTable) {
    if (fi.field == field) return fi;
  }
  throw std::invalid_argument("unknown field");
}

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

} // namespace

const std::vector<Field>& allFields() {
  static const std::vector<Field> fields = [] {
    std::vector<Field> out;
    for (const FieldInfo& fi : kFieldTable) out.push_back(fi.field);
    return out;
  }();
  return fields;
}

const std::vector<Field>& amountFields() {
  static const std::vector<Field> fields(allFields().begin() + 1, allFields().end());
  return fields;
}

bool isAmountField(Field field) {
  return field != Field::Name;
}

size_t amountSlot(Field field) {
  if (!isAmountField(field)) {
    throw std::invalid_argument("field 'name' has no amount slot");
  }
  return static_cast<size_t>(field) - 1;
}

std::string fieldId(Field field) {
  return info(field).id;
}

std::string fieldLabel(Field field) {
  return info(field).label;
}

Field parseFieldId(const std::string& id) {
  std::string key = trim(id);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const FieldInfo& fi : kFieldTable) {
    if (key == fi.id) return fi.field;
  }
  throw ConfigError("unknown field identifier: '" + trim(id) + "'");
}

std::vector<Field> parseFieldList(const std::string& list) {
  std::vector<Field> fields;
  size_t start = 0;
  while (start <= list.size()) {
    size_t comma = list.find(',', start);
    if (comma == std::string::npos) comma = list.size();
    std::string item = trim(list.substr(start, comma - start));
    if (!item.empty()) {
      Field f = parseFieldId(item);
      if (std::find(fields.begin(), fields.end(), f) == fields.end()) fields.push_back(f);
    }
    start = comma + 1;
  }
  if (fields.empty()) {
    throw ConfigError("field selection is empty");
  }
  return fields;
}
