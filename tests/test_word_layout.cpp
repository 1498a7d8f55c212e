#include <catch2/catch_all.hpp>

#include "word_layout.hpp"

#include <string>

namespace {

std::string word(double xMin, double yMin, double xMax, double yMax, const std::string& text) {
  return "<word xMin=\"" + std::to_string(xMin) + "\" yMin=\"" + std::to_string(yMin) +
         "\" xMax=\"" + std::to_string(xMax) + "\" yMax=\"" + std::to_string(yMax) + "\">" +
         text + "</word>\n";
}

// Shaped like `pdftotext -bbox-layout` output; the amount of the first row
// sits in another flow and is printed before its label.
std::string sampleBoxes() {
  return
    "<!DOCTYPE html><html><head><title></title></head><body>\n"
    "<doc>\n"
    "  <page width=\"595.000000\" height=\"842.000000\">\n"
    "    <flow><block><line>\n" +
    word(400, 100.5, 450, 110.5, "216881,97") +
    "    </line></block></flow>\n"
    "    <flow><block><line>\n" +
    word(50, 100, 70, 110, "Rem") +
    word(72, 100, 80, 110, "c/") +
    word(82, 100, 120, 110, "Aporte") +
    "    </line><line>\n" +
    word(50, 120, 70, 130, "Liq.") +
    word(72, 120, 110, 130, "Pesos:") +
    word(112, 120, 160, 130, "138784,57") +
    "    </line></block></flow>\n"
    "  </page>\n"
    "  <page width=\"595.000000\" height=\"842.000000\">\n" +
    word(50, 40, 90, 50, "A&amp;B") +
    word(92, 40, 130, 50, "&#209;U&#xD1;EZ") +
    "  </page>\n"
    "</doc></body></html>\n";
}

} // namespace

TEST_CASE("parseWordBoxes reads coordinates, pages and entities", "[layout]") {
  auto words = parseWordBoxes(sampleBoxes());
  REQUIRE(words.size() == 9);
  REQUIRE(words[0].text == "216881,97");
  REQUIRE(words[0].pageNumber == 1);
  REQUIRE(words[0].xMin == Catch::Approx(400.0));
  REQUIRE(words[0].yMax == Catch::Approx(110.5));
  REQUIRE(words[6].pageNumber == 1);
  REQUIRE(words[7].pageNumber == 2);
  REQUIRE(words[7].text == "A&B");
  REQUIRE(words[8].text == "\xC3\x91U\xC3\x91" "EZ");
}

TEST_CASE("layoutRows rebuilds table rows left to right", "[layout]") {
  auto lines = layoutRows(parseWordBoxes(sampleBoxes()));
  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0] == "Rem c/ Aporte   216881,97");
  REQUIRE(lines[1] == "Liq. Pesos: 138784,57");
  REQUIRE(lines[2] == "A&B \xC3\x91U\xC3\x91" "EZ");
}

TEST_CASE("reconstructTextFromBoxes of an empty document is empty", "[layout]") {
  REQUIRE(reconstructTextFromBoxes("<doc><page width=\"1\" height=\"1\"></page></doc>").empty());
}
