#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "consolidator.hpp"
#include "fields.hpp"
#include "format_sniffer.hpp"

struct InputDocument {
  std::string bytes;
  std::string filename; // labels diagnostics only, never decides the format
};

struct DocumentError {
  std::string document;
  std::string message;
};

struct DocumentSummary {
  std::string document;
  DocumentKind kind = DocumentKind::PlainText;
  size_t blocks = 0;
  size_t skippedBlocks = 0;
};

// Cooperative cancellation, checked by the pipeline between documents.
class CancellationFlag {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

struct PipelineResult;

// Document-boundary notifications, always invoked on the thread running the
// pipeline. Any member may be left empty. In parallel mode onDocumentStarted
// means the document was dispatched to a worker; all of them are dispatched
// before the first onDocumentFinished.
struct ProgressObserver {
  std::function<void(size_t index, size_t total, const std::string& document)> onDocumentStarted;
  std::function<void(size_t index, size_t total, const std::string& document, size_t blocks)> onDocumentFinished;
  std::function<void(const PipelineResult& result)> onCompleted;
  std::function<void(const std::string& message)> onFailed;
};

struct PipelineOptions {
  // Projected columns in order. Empty selects availableFields() of the run.
  std::vector<Field> fields;
  Ordering ordering = Ordering::Alphabetical;
  // Sniff, extract and parse each document on its own worker.
  bool parallel = false;
  std::shared_ptr<const CancellationFlag> cancellation;
  ProgressObserver progress;
};

struct PipelineResult {
  std::vector<ConsolidatedEmployee> employees;
  std::vector<Field> columns;
  // One entry per monetary column, in column order.
  std::vector<std::pair<Field, Cents>> grandTotals;
  size_t totalBlocks = 0;
  size_t uniqueEmployees = 0;
  size_t skippedBlocks = 0;
  std::vector<DocumentError> documentErrors;
  std::vector<DocumentSummary> documents;
  std::vector<std::string> conceptKeys;

  Cents grandTotal(Field field) const;

  // Text of one projected cell: the display name or the canonical amount.
  std::string cell(const ConsolidatedEmployee& employee, Field field) const;
};

bool operator==(const PipelineResult& a, const PipelineResult& b);

// Sniffs, extracts and parses every document, consolidates all blocks in one
// pass and projects the result on options.fields. A document that fails or
// yields no block is listed in documentErrors. Throws PipelineError when no
// document yields a block and PipelineCancelled when cancelled.
PipelineResult runPipeline(std::vector<InputDocument> documents, const PipelineOptions& options);

// runPipeline on a dedicated worker thread.
class PipelineTask {
public:
  PipelineTask(std::future<PipelineResult> future, std::shared_ptr<CancellationFlag> flag);

  PipelineTask(PipelineTask&&) = default;
  PipelineTask& operator=(PipelineTask&&) = default;

  void cancel();
  bool ready() const;
  void wait() const;
  // Result of the run; rethrows PipelineError / PipelineCancelled.
  PipelineResult get();

private:
  std::future<PipelineResult> future_;
  std::shared_ptr<CancellationFlag> flag_;
};

// options.cancellation is replaced by the task's own flag.
PipelineTask runPipelineAsync(std::vector<InputDocument> documents, PipelineOptions options);
