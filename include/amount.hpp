#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Money is kept as a whole number of cents so that sums are exact.
using Cents = std::int64_t;

// Parses a number printed in the es-AR convention ("1.234.567,89").
// '.' groups thousands and ',' starts the decimals (at most two digits).
// Accepts an optional '$', a leading '+'/'-', a trailing '-', parentheses
// for negatives and surrounding whitespace. Returns nullopt when malformed.
std::optional<Cents> parseLocaleAmount(const std::string& text);

// "1234567.89" (CSV / machine form).
std::string formatCanonical(Cents value);

// "1.234.567,89" (display form).
std::string formatLocale(Cents value);
