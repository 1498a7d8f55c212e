#include <catch2/catch_all.hpp>

#include "record_parser.hpp"
#include "sample_statement.hpp"

#include <string>

TEST_CASE("RecordParser extracts employee blocks and their fields", "[parse]") {
  RecordParser parser;
  ParsedDocument doc = parser.parse(sampleStatement(), "marzo.pdf");

  REQUIRE(doc.blocks.size() == 3);
  REQUIRE(doc.skippedBlocks == 1);
  REQUIRE(doc.warnings.size() == 1);
  REQUIRE(doc.warnings[0].blockIndex == 3);
  REQUIRE(doc.warnings[0].document == "marzo.pdf");

  const RawEmployeeBlock& perez = doc.blocks[0];
  REQUIRE(perez.name == "PEREZ JUAN CARLOS");
  REQUIRE(perez.sourceDocument == "marzo.pdf");
  REQUIRE(perez.blockIndex == 0);
  REQUIRE(perez.hrId == "10001");
  REQUIRE(perez.position == "120");
  REQUIRE(perez.role == "1");
  REQUIRE(perez.daysWorked == "30");
  REQUIRE(perez.startDate == "01/03/2010");
  REQUIRE(perez.amount(Field::RemunerationWithContribution) == 16234567);
  REQUIRE(perez.amount(Field::RemunerationWithoutContribution) == 162661);
  REQUIRE(perez.amount(Field::NetPayable) == 13878457);
  REQUIRE(perez.amount(Field::RemunerativeSupplement) == 1234567);
  REQUIRE(perez.amount(Field::HealthFundAdjustment) == 150000);
  REQUIRE(perez.amount(Field::FamilyHealthFundDeduction) == 225050);

  REQUIRE(perez.concepts.size() == 4);
  REQUIRE(perez.concepts[0].key() == "DV 100 Sueldo Basico");
  REQUIRE(perez.concepts[0].amount == 15000000);
  REQUIRE(perez.concepts[2].kind == "RT");
  REQUIRE(perez.concepts[2].label == "Ajuste Dif. Aporte Minimo APROSS");

  // Document order is kept; the second role prints the name differently.
  REQUIRE(doc.blocks[1].name == "LOPEZ MARIA");
  REQUIRE(doc.blocks[1].amount(Field::NetPayable) == 6500000);
  REQUIRE(doc.blocks[2].name == "Perez  Juan Carlos");
  REQUIRE(doc.blocks[2].blockIndex == 2);
  REQUIRE(doc.blocks[2].amount(Field::RemunerationWithoutContribution) == 0);
}

TEST_CASE("a named block without amounts is kept with zeros", "[parse]") {
  RecordParser parser;
  ParsedDocument doc = parser.parse(
    "Id. Hr: 30001  Cargo: 7  Rol: 2\n"
    "Apellido y Nombre: GOMEZ ANA   Centro Pago: 12\n"
    "Dias Trab: 0\n", "abril.pdf");

  REQUIRE(doc.blocks.size() == 1);
  REQUIRE(doc.skippedBlocks == 0);
  REQUIRE(doc.warnings.empty());
  for (Field f : amountFields()) {
    REQUIRE(doc.blocks[0].amount(f) == 0);
  }
  REQUIRE(doc.blocks[0].daysWorked == "0");
}

TEST_CASE("locale figures and signs are normalized while parsing", "[parse]") {
  RecordParser parser;
  ParsedDocument doc = parser.parse(
    "Id. Hr: 1\nApellido y Nombre: ALVAREZ RAUL\nLiq. Pesos: 1.234.567,89\nRem c/ Aporte -2.000,10\n"
    "Id. Hr: 2\nApellido y Nombre: BRITOS LUZ\nLiq. Pesos: 1.000,00-\n", "x");

  REQUIRE(doc.blocks.size() == 2);
  REQUIRE(doc.blocks[0].name == "ALVAREZ RAUL");
  REQUIRE(doc.blocks[0].amount(Field::NetPayable) == 123456789);
  REQUIRE(doc.blocks[0].amount(Field::RemunerationWithContribution) == -200010);
  REQUIRE(doc.blocks[1].amount(Field::NetPayable) == -100000);
}

TEST_CASE("an empty name field counts as a skipped block", "[parse]") {
  RecordParser parser;
  ParsedDocument doc = parser.parse(
    "Id. Hr: 1\nApellido y Nombre:    Centro Pago: 3\nLiq. Pesos: 10,00\n", "x");
  REQUIRE(doc.blocks.empty());
  REQUIRE(doc.skippedBlocks == 1);
}

TEST_CASE("underscore rules split blocks when Id. Hr headers are absent", "[parse]") {
  const std::string rule(120, '_');
  RecordParser parser;
  ParsedDocument doc = parser.parse(
    "LIQUIDACION\n" + rule + "\n"
    "Apellido y Nombre: RIOS ANA   Centro Pago: 1\nLiq. Pesos: 100,00\n" + rule + "\n"
    "Apellido y Nombre: SOSA LEO   Centro Pago: 1\nLiq. Pesos: 200,00\n" + rule + "\n"
    "Liq. Pesos: 300,00\n", "y");

  REQUIRE(doc.blocks.size() == 2);
  REQUIRE(doc.blocks[0].name == "RIOS ANA");
  REQUIRE(doc.blocks[1].name == "SOSA LEO");
  REQUIRE(doc.blocks[1].amount(Field::NetPayable) == 20000);
  REQUIRE(doc.skippedBlocks == 1);
}

TEST_CASE("text without payroll entries yields nothing", "[parse]") {
  RecordParser parser;
  ParsedDocument doc = parser.parse("Lorem ipsum dolor sit amet\n", "z");
  REQUIRE(doc.blocks.empty());
  REQUIRE(doc.skippedBlocks == 0);
}

TEST_CASE("availableFields offers optional columns only when present", "[parse]") {
  RecordParser parser;
  ParsedDocument plain = parser.parse(
    "Id. Hr: 1\nApellido y Nombre: ALVAREZ RAUL\nLiq. Pesos: 10,00\n", "x");
  REQUIRE(availableFields(plain.blocks) ==
          std::vector<Field>{Field::Name, Field::RemunerationWithContribution, Field::NetPayable});

  ParsedDocument full = parser.parse(sampleStatement(), "marzo.pdf");
  REQUIRE(availableFields(full.blocks) == allFields());
}
