#include "config/network.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/mainnet.hpp"
#include "uniswap_v2/flash_swap_abi.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

void NetworkRegistry::Register(NetworkConfig cfg) {
  const std::string id = std::to_string(cfg.chain_id);
  if (cfg.wrapped_native.IsZero() || cfg.reference_stable.IsZero() || cfg.factory.IsZero()) {
    throw std::invalid_argument("network " + id + ": zero address in config");
  }
  if (cfg.wrapped_native == cfg.reference_stable) {
    throw std::invalid_argument("network " + id + ": wrapped native and reference stable must differ");
  }
  if (cfg.callback_signature.empty()) {
    throw std::invalid_argument("network " + id + ": empty callback signature");
  }
  networks_[cfg.chain_id] = std::move(cfg);
}

const NetworkConfig* NetworkRegistry::Find(unsigned long long chain_id) const {
  auto it = networks_.find(chain_id);
  return it == networks_.end() ? nullptr : &it->second;
}

const NetworkConfig& NetworkRegistry::Get(unsigned long long chain_id) const {
  const NetworkConfig* cfg = Find(chain_id);
  if (!cfg) throw FlashSwapError(ErrorCode::UNSUPPORTED_NETWORK, "no config for chain " + std::to_string(chain_id));
  return *cfg;
}

NetworkRegistry DefaultNetworkRegistry() {
  NetworkRegistry registry;
  NetworkConfig mainnet;
  mainnet.chain_id = MainnetConstants::CHAIN_ID;
  mainnet.name = "mainnet";
  mainnet.wrapped_native = Address::FromHex(MainnetConstants::WETH);
  mainnet.reference_stable = Address::FromHex(MainnetConstants::DAI);
  mainnet.factory = Address::FromHex(MainnetConstants::UNISWAP_V2_FACTORY);
  mainnet.callback_signature = FlashSwapABI::CALLBACK_SIGNATURE;
  registry.Register(mainnet);
  return registry;
}

NetworkRegistry ParseNetworkRegistry(const std::string& json_text) {
  NetworkRegistry registry;
  try {
    auto j = nlohmann::json::parse(json_text);
    const auto& list = j.at("networks");
    if (!list.is_array()) throw std::runtime_error("\"networks\" must be an array");
    for (const auto& n : list) {
      NetworkConfig cfg;
      cfg.chain_id = n.at("chain_id").get<unsigned long long>();
      cfg.name = n.value("name", std::string());
      cfg.wrapped_native = Address::FromHex(n.at("wrapped_native").get<std::string>());
      cfg.reference_stable = Address::FromHex(n.at("reference_stable").get<std::string>());
      cfg.factory = Address::FromHex(n.at("factory").get<std::string>());
      cfg.callback_signature = n.value("callback_signature", FlashSwapABI::CALLBACK_SIGNATURE);
      registry.Register(std::move(cfg));
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("network registry: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("network registry: ") + e.what());
  }
  return registry;
}

NetworkRegistry LoadNetworkRegistry(const std::string& json_path) {
  std::ifstream file(json_path);
  if (!file.is_open()) throw std::runtime_error("cannot open network registry: " + json_path);
  std::stringstream buf;
  buf << file.rdbuf();
  auto registry = ParseNetworkRegistry(buf.str());
  Logger::Info("Loaded " + std::to_string(registry.Size()) + " network(s) from " + json_path);
  return registry;
}

void ApplyNetworkOverrides(NetworkRegistry& registry, unsigned long long chain_id) {
  const NetworkConfig* current = registry.Find(chain_id);
  NetworkConfig cfg = current ? *current : NetworkConfig{};
  cfg.chain_id = chain_id;
  if (cfg.callback_signature.empty()) cfg.callback_signature = FlashSwapABI::CALLBACK_SIGNATURE;
  bool touched = false;
  if (auto v = ConfigManager::Get("WRAPPED_NATIVE")) { cfg.wrapped_native = Address::FromHex(*v); touched = true; }
  if (auto v = ConfigManager::Get("REFERENCE_STABLE")) { cfg.reference_stable = Address::FromHex(*v); touched = true; }
  if (auto v = ConfigManager::Get("FACTORY_ADDRESS")) { cfg.factory = Address::FromHex(*v); touched = true; }
  if (auto v = ConfigManager::Get("CALLBACK_SIGNATURE")) { cfg.callback_signature = *v; touched = true; }
  if (!touched) return;
  registry.Register(std::move(cfg));
  Logger::Info("Applied config overrides to chain " + std::to_string(chain_id));
}
