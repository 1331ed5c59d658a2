// flowplan/io/workflow_reader.hpp - Workflow documents from JSON
//
// The core compiler consumes WorkflowInput records and a ContentTable; this
// is the loader that produces both from a single JSON document.
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "flowplan/graph/workflow_input.hpp"

namespace flowplan
{

/**
 * Malformed workflow document.
 *
 * `where()` is a JSON-pointer-like path to the offending value
 * (e.g. "/regions/0/nodes/3/id"); empty for document-level problems.
 */
class WorkflowFormatError : public std::runtime_error
{
public:
  WorkflowFormatError(const std::string & message, std::string where = {})
  : std::runtime_error(where.empty() ? message : where + ": " + message), where_(std::move(where))
  {
  }

  [[nodiscard]] const std::string & where() const noexcept { return where_; }

private:
  std::string where_;
};

struct WorkflowDocument
{
  WorkflowInput input;
  ContentTable content;
};

/**
 * Parse a workflow document.
 *
 * @throws WorkflowFormatError on invalid JSON or a document of the wrong shape
 */
[[nodiscard]] WorkflowDocument read_workflow_json(std::string_view text);

/**
 * Read and parse a workflow file.
 *
 * Content references of prompt, context and tool nodes that the document does
 * not embed are read from files relative to the workflow's directory, when
 * such files exist.
 *
 * @throws WorkflowFormatError if the file cannot be read or is malformed
 */
[[nodiscard]] WorkflowDocument load_workflow_file(const std::filesystem::path & path);

}  // namespace flowplan
