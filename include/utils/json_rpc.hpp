#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, int id = 1);
  // Returns the "result" field as string (raw JSON when not a string), throws std::runtime_error on error
  std::string ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
