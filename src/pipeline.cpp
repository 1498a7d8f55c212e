#include "pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "extractor.hpp"
#include "logger.hpp"
#include "record_parser.hpp"

namespace {

struct DocumentOutcome {
  DocumentSummary summary;
  ParsedDocument parsed;
  bool failed = false;
  std::string error;
};

bool isCancelled(const PipelineOptions& options) {
  return options.cancellation && options.cancellation->cancelled();
}

DocumentOutcome processDocument(const InputDocument& doc, const RecordParser& parser) {
  DocumentOutcome out;
  out.summary.document = doc.filename;
  out.summary.kind = classifyDocument(doc.bytes);
  Logger::info(doc.filename + ": " + documentKindName(out.summary.kind) + ", " +
               std::to_string(doc.bytes.size()) + " bytes");

  try {
    std::string text = extractDocumentText(doc.bytes, out.summary.kind);
    out.parsed = parser.parse(text, doc.filename);
  } catch (const ExtractionError& ex) {
    out.failed = true;
    out.error = ex.what();
  } catch (const std::regex_error& ex) {
    out.failed = true;
    out.error = std::string("text could not be scanned: ") + ex.what();
  } catch (const std::exception& ex) {
    // One unreadable document never stops the others.
    out.failed = true;
    out.error = ex.what();
  }

  if (!out.failed && out.parsed.blocks.empty()) {
    out.failed = true;
    out.error = "no employee records found; is this a payroll statement?";
  }
  out.summary.blocks = out.parsed.blocks.size();
  out.summary.skippedBlocks = out.parsed.skippedBlocks;
  if (out.failed) Logger::error(doc.filename + ": " + out.error);
  return out;
}

std::vector<DocumentOutcome> processSequential(const std::vector<InputDocument>& documents,
                                               const RecordParser& parser,
                                               const PipelineOptions& options) {
  std::vector<DocumentOutcome> outcomes;
  const size_t total = documents.size();
  for (size_t i = 0; i < total; ++i) {
    if (isCancelled(options)) throw PipelineCancelled();
    const std::string& name = documents[i].filename;
    if (options.progress.onDocumentStarted) options.progress.onDocumentStarted(i, total, name);

    outcomes.push_back(processDocument(documents[i], parser));

    if (options.progress.onDocumentFinished) {
      options.progress.onDocumentFinished(i, total, name, outcomes.back().parsed.blocks.size());
    }
  }
  return outcomes;
}

// One worker per document; each owns nothing but its own outcome. Results
// are collected in input order. Documents are announced as they are handed
// to a worker, so every onDocumentStarted precedes the first
// onDocumentFinished; callbacks stay on the calling thread.
std::vector<DocumentOutcome> processParallel(const std::vector<InputDocument>& documents,
                                             const RecordParser& parser,
                                             const PipelineOptions& options) {
  const size_t total = documents.size();
  std::vector<std::future<DocumentOutcome>> pending;
  pending.reserve(total);
  for (size_t i = 0; i < total; ++i) {
    if (options.progress.onDocumentStarted) options.progress.onDocumentStarted(i, total, documents[i].filename);
    pending.push_back(std::async(std::launch::async, [&documents, &parser, &options, i]() {
      if (isCancelled(options)) return DocumentOutcome{};
      return processDocument(documents[i], parser);
    }));
  }

  std::vector<DocumentOutcome> outcomes;
  outcomes.reserve(total);
  for (size_t i = 0; i < total; ++i) {
    outcomes.push_back(pending[i].get());
    if (isCancelled(options)) {
      // drain the remaining workers before unwinding; they only read `documents`
      for (size_t j = i + 1; j < total; ++j) pending[j].wait();
      throw PipelineCancelled();
    }
    if (options.progress.onDocumentFinished) {
      options.progress.onDocumentFinished(i, total, documents[i].filename, outcomes.back().parsed.blocks.size());
    }
  }
  return outcomes;
}

PipelineResult assemble(std::vector<DocumentOutcome> outcomes, const PipelineOptions& options) {
  if (isCancelled(options)) throw PipelineCancelled();

  PipelineResult result;

  std::vector<RawEmployeeBlock> blocks;
  std::set<std::string> seenConcepts;
  for (DocumentOutcome& o : outcomes) {
    result.documents.push_back(o.summary);
    result.skippedBlocks += o.parsed.skippedBlocks;
    if (o.failed) {
      result.documentErrors.push_back(DocumentError{o.summary.document, o.error});
      continue;
    }
    for (RawEmployeeBlock& b : o.parsed.blocks) {
      for (const ConceptLine& c : b.concepts) {
        std::string key = c.key();
        if (seenConcepts.insert(key).second) result.conceptKeys.push_back(key);
      }
      blocks.push_back(std::move(b));
    }
  }

  if (blocks.empty()) {
    std::string message = "no document yielded any employee record";
    for (const DocumentError& e : result.documentErrors) {
      message += "\n  " + e.document + ": " + e.message;
    }
    throw PipelineError(message);
  }

  result.columns = options.fields.empty() ? availableFields(blocks) : options.fields;
  result.totalBlocks = blocks.size();
  result.employees = orderEmployees(consolidate(std::move(blocks)), options.ordering);
  result.uniqueEmployees = result.employees.size();

  for (Field f : result.columns) {
    if (!isAmountField(f)) continue;
    Cents sum = 0;
    for (const ConsolidatedEmployee& e : result.employees) sum += e.amount(f);
    result.grandTotals.emplace_back(f, sum);
  }
  return result;
}

bool sameErrors(const std::vector<DocumentError>& a, const std::vector<DocumentError>& b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const DocumentError& x, const DocumentError& y) {
    return x.document == y.document && x.message == y.message;
  });
}

bool sameSummaries(const std::vector<DocumentSummary>& a, const std::vector<DocumentSummary>& b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const DocumentSummary& x, const DocumentSummary& y) {
    return x.document == y.document && x.kind == y.kind && x.blocks == y.blocks &&
           x.skippedBlocks == y.skippedBlocks;
  });
}

} // namespace

Cents PipelineResult::grandTotal(Field field) const {
  for (const auto& t : grandTotals) {
    if (t.first == field) return t.second;
  }
  throw std::out_of_range("field '" + fieldId(field) + "' is not a selected monetary column");
}

std::string PipelineResult::cell(const ConsolidatedEmployee& employee, Field field) const {
  if (field == Field::Name) return employee.displayName;
  return formatCanonical(employee.amount(field));
}

bool operator==(const PipelineResult& a, const PipelineResult& b) {
  return a.employees == b.employees &&
         a.columns == b.columns &&
         a.grandTotals == b.grandTotals &&
         a.totalBlocks == b.totalBlocks &&
         a.uniqueEmployees == b.uniqueEmployees &&
         a.skippedBlocks == b.skippedBlocks &&
         sameErrors(a.documentErrors, b.documentErrors) &&
         sameSummaries(a.documents, b.documents) &&
         a.conceptKeys == b.conceptKeys;
}

PipelineResult runPipeline(std::vector<InputDocument> documents, const PipelineOptions& options) {
  try {
    if (documents.empty()) throw PipelineError("no documents to process");

    // Compiled once for the whole run.
    const RecordParser parser;

    std::vector<DocumentOutcome> outcomes = options.parallel
      ? processParallel(documents, parser, options)
      : processSequential(documents, parser, options);

    PipelineResult result = assemble(std::move(outcomes), options);
    Logger::info("run finished: " + std::to_string(result.totalBlocks) + " records, " +
                 std::to_string(result.uniqueEmployees) + " employees, " +
                 std::to_string(result.documentErrors.size()) + " failed document(s)");
    if (options.progress.onCompleted) options.progress.onCompleted(result);
    return result;
  } catch (const std::exception& ex) {
    if (options.progress.onFailed) options.progress.onFailed(ex.what());
    throw;
  }
}

PipelineTask::PipelineTask(std::future<PipelineResult> future, std::shared_ptr<CancellationFlag> flag)
  : future_(std::move(future)), flag_(std::move(flag)) {}

void PipelineTask::cancel() {
  if (flag_) flag_->cancel();
}

bool PipelineTask::ready() const {
  return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PipelineTask::wait() const {
  future_.wait();
}

PipelineResult PipelineTask::get() {
  return future_.get();
}

PipelineTask runPipelineAsync(std::vector<InputDocument> documents, PipelineOptions options) {
  auto flag = std::make_shared<CancellationFlag>();
  options.cancellation = flag;
  std::future<PipelineResult> future = std::async(
    std::launch::async,
    [docs = std::move(documents), opts = std::move(options)]() mutable {
      return runPipeline(std::move(docs), opts);
    });
  return PipelineTask(std::move(future), std::move(flag));
}
