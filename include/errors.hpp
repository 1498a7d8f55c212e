#pragma once

#include <stdexcept>
#include <string>

// Both PDF decoding strategies failed, or the document is unreadable.
class ExtractionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No document in the run produced a single employee block.
class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The run observed a cancellation request at a document boundary.
class PipelineCancelled : public std::runtime_error {
public:
  PipelineCancelled() : std::runtime_error("pipeline run cancelled") {}
};

// Invalid field identifier or ordering name supplied by configuration.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
