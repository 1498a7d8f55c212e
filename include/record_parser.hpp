#pragma once

#include <regex>
#include <string>
#include <vector>

#include "amount.hpp"
#include "fields.hpp"

// One itemised line of a payroll block: "DV" accruals and "RT" withholdings.
struct ConceptLine {
  std::string kind;
  std::string code;
  std::string label;
  Cents amount = 0;

  // "DV 120 Complemento Remunerativo"
  std::string key() const;
};

// One employee entry (one role/appointment) as printed in a document.
// Monetary fields not found in the block are zero.
struct RawEmployeeBlock {
  std::string name;
  Amounts amounts{};
  std::string sourceDocument;
  size_t blockIndex = 0;

  std::string hrId;
  std::string position;
  std::string role;
  std::string daysWorked;
  std::string startDate;
  std::vector<ConceptLine> concepts;

  Cents amount(Field field) const { return amounts[amountSlot(field)]; }
  void setAmount(Field field, Cents value) { amounts[amountSlot(field)] = value; }
};

struct ParseWarning {
  std::string document;
  size_t blockIndex;
  std::string reason;
};

struct ParsedDocument {
  std::vector<RawEmployeeBlock> blocks;
  size_t skippedBlocks = 0;
  std::vector<ParseWarning> warnings;
};

// Splits payroll text into employee blocks and extracts their fields.
// Patterns are compiled once, in the constructor; one parser is meant to be
// shared by every document of a run. parse() is const and may be called from
// several threads at once.
class RecordParser {
public:
  RecordParser();

  ParsedDocument parse(const std::string& text, const std::string& sourceId) const;

private:
  struct Segment {
    size_t begin;
    size_t end;
    bool preamble;
  };

  struct AmountRule {
    Field field;
    std::string anchor;
    std::regex pattern;
  };

  struct IdentityRule {
    std::string RawEmployeeBlock::*member;
    std::string anchor;
    std::regex pattern;
  };

  std::vector<Segment> splitBlocks(const std::string& text) const;
  bool parseBlock(const std::vector<std::string>& lines, RawEmployeeBlock& block,
                  std::vector<std::string>& problems) const;

  std::regex blockHeader_;
  std::regex blockRule_;
  std::regex name_;
  std::regex concept_;
  std::vector<AmountRule> amountRules_;
  std::vector<IdentityRule> identityRules_;
};

// Columns worth offering for a set of blocks: name, remuneration with
// contribution and net payable always, other monetary fields only when at
// least one block carries a non-zero value.
std::vector<Field> availableFields(const std::vector<RawEmployeeBlock>& blocks);
