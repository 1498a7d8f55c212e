#include <catch2/catch_all.hpp>

#include "errors.hpp"
#include "extractor.hpp"
#include "format_sniffer.hpp"
#include "text_decode.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("classifyDocument trusts the PDF magic, not the name", "[sniff]") {
  REQUIRE(classifyDocument("%PDF-1.7\n%\xE2\xE3\xCF\xD3\n1 0 obj") == DocumentKind::RealDocument);
  REQUIRE(classifyDocument("%PDF-") == DocumentKind::RealDocument);

  // Plain-text payloads shipped with a .pdf name by the payroll system.
  REQUIRE(classifyDocument("LIQUIDACION DE HABERES\nId. Hr: 1\n") == DocumentKind::PlainText);
  REQUIRE(classifyDocument("  %PDF-1.4") == DocumentKind::PlainText);
  REQUIRE(classifyDocument("%PDF") == DocumentKind::PlainText);
}

TEST_CASE("classifyDocument treats empty input as plain text", "[sniff]") {
  REQUIRE(classifyDocument("") == DocumentKind::PlainText);
  REQUIRE(extractDocumentText("", DocumentKind::PlainText).empty());
}

TEST_CASE("plain text keeps valid UTF-8 and drops the BOM", "[decode]") {
  const std::string utf8 = "Apellido y Nombre: NU\xC3\x91" "EZ JOS\xC3\x89";
  REQUIRE(isValidUtf8(utf8));
  REQUIRE(decodePlainText(utf8) == utf8);
  REQUIRE(decodePlainText("\xEF\xBB\xBF" + utf8) == utf8);
}

TEST_CASE("plain text in Windows-1252 is transcoded to UTF-8", "[decode]") {
  const std::string latin1 = "NU\xD1" "EZ JOS\xC9 \x80";
  REQUIRE_FALSE(isValidUtf8(latin1));
  REQUIRE(decodePlainText(latin1) == "NU\xC3\x91" "EZ JOS\xC3\x89 \xE2\x82\xAC");
  REQUIRE(isValidUtf8(windows1252ToUtf8("\x81\x9D")));
}

TEST_CASE("isValidUtf8 rejects overlong and truncated sequences", "[decode]") {
  REQUIRE_FALSE(isValidUtf8("\xC0\xAF"));
  REQUIRE_FALSE(isValidUtf8("\xE2\x82"));
  REQUIRE_FALSE(isValidUtf8("\xED\xA0\x80"));
  REQUIRE(isValidUtf8("\xF0\x9F\x98\x80"));
}

TEST_CASE("a corrupt PDF fails both decoding strategies", "[extract]") {
  REQUIRE_THROWS_AS(extractDocumentText("%PDF-1.4\nthis is not a pdf body\n", DocumentKind::RealDocument),
                    ExtractionError);
}

TEST_CASE("blank word layout output falls back to raw text", "[extract]") {
  std::string seenByFallback;
  std::string text = extractPdfTextWith(
    "/tmp/statement.pdf",
    [](const std::string&) { return std::string(" \n\t\n"); },
    [&seenByFallback](const std::string& path) {
      seenByFallback = path;
      return std::string("Id. Hr: 1\nApellido y Nombre: RIOS ANA\n");
    });

  REQUIRE(seenByFallback == "/tmp/statement.pdf");
  REQUIRE(text == "Id. Hr: 1\nApellido y Nombre: RIOS ANA\n");
}

TEST_CASE("any failure of the word layout strategy falls back to raw text", "[extract]") {
  auto raw = [](const std::string&) { return std::string("Liq. Pesos: 10,00\n"); };

  REQUIRE(extractPdfTextWith("a.pdf", [](const std::string&) -> std::string {
    throw ExtractionError("pdftotext -bbox-layout returned non-zero exit code");
  }, raw) == "Liq. Pesos: 10,00\n");

  // Malformed coordinates surface as std::stod errors.
  REQUIRE(extractPdfTextWith("a.pdf", [](const std::string&) -> std::string {
    return std::to_string(std::stod("."));
  }, raw) == "Liq. Pesos: 10,00\n");
}

TEST_CASE("the word layout result wins when it has text", "[extract]") {
  bool fallbackRan = false;
  std::string text = extractPdfTextWith(
    "a.pdf",
    [](const std::string&) { return std::string("Rem c/ Aporte   216881,97\n"); },
    [&fallbackRan](const std::string&) {
      fallbackRan = true;
      return std::string("unused");
    });
  REQUIRE(text == "Rem c/ Aporte   216881,97\n");
  REQUIRE_FALSE(fallbackRan);
}

TEST_CASE("a failure of both strategies reports both reasons", "[extract]") {
  using Catch::Matchers::ContainsSubstring;
  auto broken = [](const std::string&) -> std::string { throw std::runtime_error("layout broke"); };
  auto empty = [](const std::string&) { return std::string(); };

  REQUIRE_THROWS_AS(extractPdfTextWith("a.pdf", broken, empty), ExtractionError);
  REQUIRE_THROWS_WITH(extractPdfTextWith("a.pdf", broken, empty),
                      ContainsSubstring("layout broke") &&
                      ContainsSubstring("raw extraction produced no text"));
}
