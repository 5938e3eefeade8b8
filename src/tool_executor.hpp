#pragma once

#include "cancellation.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace toolrt {

constexpr size_t kMaxToolResultBytes = 24000;

// Renders a tools/call result as text: text parts joined by newlines, other typed parts as
// "[<type> result]", the whole result as JSON when nothing textual remains. isError results are
// prefixed with "Tool error:\n".
std::string FlattenToolResult(const nlohmann::json& result);

// Routes model-issued calls to their provider. Every outcome, failures included, comes back as text
// for the model to read.
class ToolExecutor {
 public:
  explicit ToolExecutor(const ToolRegistry* registry) : registry_(registry) {}

  std::string Execute(const std::string& call_name, const std::string& raw_arguments, const CancellationToken& cancel) const;

 private:
  const ToolRegistry* registry_;
};

}  // namespace toolrt
