#include <catch2/catch_all.hpp>

#include "amount.hpp"

#include <string>

TEST_CASE("parseLocaleAmount reads es-AR figures into cents", "[amount]") {
  REQUIRE(parseLocaleAmount("1.234.567,89") == Cents{123456789});
  REQUIRE(parseLocaleAmount("216881,97") == Cents{21688197});
  REQUIRE(parseLocaleAmount("0,00") == Cents{0});
  REQUIRE(parseLocaleAmount("0,5") == Cents{50});
  REQUIRE(parseLocaleAmount("1.234") == Cents{123400});
  REQUIRE(parseLocaleAmount("  $ 1.500,00 ") == Cents{150000});
}

TEST_CASE("parseLocaleAmount understands sign markers", "[amount]") {
  REQUIRE(parseLocaleAmount("-1.500,25") == Cents{-150025});
  REQUIRE(parseLocaleAmount("+1.500,25") == Cents{150025});
  REQUIRE(parseLocaleAmount("1.500,25-") == Cents{-150025});
  REQUIRE(parseLocaleAmount("(1.500,25)") == Cents{-150025});
}

TEST_CASE("parseLocaleAmount rejects malformed text", "[amount]") {
  REQUIRE_FALSE(parseLocaleAmount("").has_value());
  REQUIRE_FALSE(parseLocaleAmount("   ").has_value());
  REQUIRE_FALSE(parseLocaleAmount("abc").has_value());
  REQUIRE_FALSE(parseLocaleAmount("1,234,56").has_value());
  REQUIRE_FALSE(parseLocaleAmount("12,345").has_value());
  REQUIRE_FALSE(parseLocaleAmount("-").has_value());
  REQUIRE_FALSE(parseLocaleAmount("99999999999999999999,00").has_value());
}

TEST_CASE("amounts format back in canonical and display form", "[amount]") {
  REQUIRE(formatCanonical(123456789) == "1234567.89");
  REQUIRE(formatCanonical(5) == "0.05");
  REQUIRE(formatCanonical(-150025) == "-1500.25");
  REQUIRE(formatLocale(123456789) == "1.234.567,89");
  REQUIRE(formatLocale(100000) == "1.000,00");
  REQUIRE(formatLocale(99999) == "999,99");
  REQUIRE(formatLocale(-150025) == "-1.500,25");
}
