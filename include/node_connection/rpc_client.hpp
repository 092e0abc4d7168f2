#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

// Minimal Ethereum JSON-RPC client. Transport and JSON-RPC errors throw std::runtime_error.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Sends raw JSON-RPC payload, returns the response body
  std::string Send(const std::string& json_payload, int timeout_ms = 3000);
  // Returns the "result" of method(params)
  std::string Call(const std::string& method, const nlohmann::json& params, int timeout_ms = 3000);

  // Returns 0x-hex return data
  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt, int timeout_ms = 3000);
  unsigned long long EthChainId(int timeout_ms = 3000);
  unsigned long long EthBlockNumber(int timeout_ms = 3000);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::unordered_map<std::string, std::string> default_headers_;
};
