#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <stdexcept>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header, anything else is sent as Authorization
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers, const std::string& raw) {
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

static unsigned long long ParseHexQuantity(const std::string& q) {
  std::string s = Strip0x(q);
  if (s.empty() || s.size() > 16) throw std::runtime_error("bad hex quantity: " + q);
  for (char c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) throw std::runtime_error("bad hex quantity: " + q);
  }
  return std::stoull(s, nullptr, 16);
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url) {
  default_headers_["Content-Type"] = "application/json";
  if (auth_header) ApplyAuthHeader(default_headers_, *auth_header);
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    throw std::runtime_error("HTTP POST to " + endpoint_ + " failed with status " + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::Call(const std::string& method, const nlohmann::json& params, int timeout_ms) {
  return JsonRpcUtil::ExtractResult(Send(JsonRpcUtil::BuildRequest(method, params), timeout_ms));
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block, int timeout_ms) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back(nlohmann::json{{"to", to}, {"data", data}});
  params.push_back(block ? *block : std::string("latest"));
  return Call("eth_call", params, timeout_ms);
}

unsigned long long RpcClient::EthChainId(int timeout_ms) {
  return ParseHexQuantity(Call("eth_chainId", nlohmann::json::array(), timeout_ms));
}

unsigned long long RpcClient::EthBlockNumber(int timeout_ms) {
  return ParseHexQuantity(Call("eth_blockNumber", nlohmann::json::array(), timeout_ms));
}
