#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "pipeline/result_cache.hpp"
#include "protocol/execution_contract.hpp"

namespace wasmbox::pipeline {

// Text stdout up to this many bytes is returned inline
constexpr std::size_t kInlineStdoutLimit = 4096;

// Shapes a tool result for the model. Long text and binary stdout are parked
// in `cache`; the response then carries a resultId plus a bounded preview or
// the base64 form of the bytes.
nlohmann::json format_for_llm(const std::string& tool_name,
                              const protocol::ToolExecutionResult& result,
                              ResultCache& cache);

// Human readable block for a formatted result object.
std::string format_tool_result_summary(const nlohmann::json& result);

}  // namespace wasmbox::pipeline
