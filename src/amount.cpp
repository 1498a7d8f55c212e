#include "amount.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace {

// Enough for any payroll figure while staying clear of int64 overflow.
constexpr size_t kMaxIntegerDigits = 16;

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string groupThousands(const std::string& digits, char separator) {
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  size_t lead = digits.size() % 3;
  if (lead == 0) lead = 3;
  out.append(digits, 0, lead);
  for (size_t i = lead; i < digits.size(); i += 3) {
    out.push_back(separator);
    out.append(digits, i, 3);
  }
  return out;
}

std::string format(Cents value, char thousands, char decimal) {
  bool negative = value < 0;
  // Work on the unsigned magnitude so INT64_MIN does not overflow.
  std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(value)
                                     : static_cast<std::uint64_t>(value);
  std::string whole = std::to_string(magnitude / 100);
  unsigned frac = static_cast<unsigned>(magnitude % 100);

  std::string out;
  if (negative) out.push_back('-');
  out += thousands ? groupThousands(whole, thousands) : whole;
  out.push_back(decimal);
  out.push_back(static_cast<char>('0' + frac / 10));
  out.push_back(static_cast<char>('0' + frac % 10));
  return out;
}

} // namespace

std::optional<Cents> parseLocaleAmount(const std::string& text) {
  std::string s = trim(text);
  if (s.empty()) return std::nullopt;

  bool negative = false;
  if (s.front() == '(' && s.back() == ')') {
    negative = true;
    s = trim(s.substr(1, s.size() - 2));
  }
  if (!s.empty() && s.back() == '-') {
    negative = !negative;
    s = trim(s.substr(0, s.size() - 1));
  }
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    if (s.front() == '-') negative = !negative;
    s = trim(s.substr(1));
  }
  if (!s.empty() && s.front() == '$') {
    s = trim(s.substr(1));
  }
  if (s.empty()) return std::nullopt;

  std::string whole;
  std::string frac;
  bool inFraction = false;
  for (char ch : s) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      (inFraction ? frac : whole).push_back(ch);
    } else if (ch == '.' && !inFraction) {
      // thousands separator
    } else if (ch == ',' && !inFraction) {
      inFraction = true;
    } else {
      return std::nullopt;
    }
  }

  if (whole.empty() && frac.empty()) return std::nullopt;
  if (frac.size() > 2) return std::nullopt;
  if (whole.size() > kMaxIntegerDigits) return std::nullopt;
  while (frac.size() < 2) frac.push_back('0');

  Cents value = whole.empty() ? 0 : static_cast<Cents>(std::strtoll(whole.c_str(), nullptr, 10));
  value = value * 100 + (frac[0] - '0') * 10 + (frac[1] - '0');
  return negative ? -value : value;
}

std::string formatCanonical(Cents value) {
  return format(value, 0, '.');
}

std::string formatLocale(Cents value) {
  return format(value, '.', ',');
}
