#pragma once
#include <map>
#include <string>
#include "primitives/address.hpp"

// Per-network constants a flash swap needs. Read-only once registered.
struct NetworkConfig {
  unsigned long long chain_id = 0;
  std::string name;
  Address wrapped_native;
  Address reference_stable;
  Address factory;
  // Canonical signature of the callback the pairs of this network invoke
  std::string callback_signature;
};

class NetworkRegistry {
public:
  // Adds or replaces the entry for cfg.chain_id. Throws std::invalid_argument on
  // zero addresses, wrapped_native == reference_stable or an empty callback signature.
  void Register(NetworkConfig cfg);
  const NetworkConfig* Find(unsigned long long chain_id) const;
  // Throws FlashSwapError(UNSUPPORTED_NETWORK)
  const NetworkConfig& Get(unsigned long long chain_id) const;
  size_t Size() const { return networks_.size(); }
private:
  std::map<unsigned long long, NetworkConfig> networks_;
};

// Ethereum mainnet with WETH, DAI and the Uniswap V2 factory.
NetworkRegistry DefaultNetworkRegistry();

// JSON document: {"networks":[{"chain_id":1,"name":"mainnet","wrapped_native":"0x..",
// "reference_stable":"0x..","factory":"0x..","callback_signature":"..."}]}.
// callback_signature is optional. Throws std::runtime_error on any parse or schema error.
NetworkRegistry ParseNetworkRegistry(const std::string& json_text);
NetworkRegistry LoadNetworkRegistry(const std::string& json_path);

// Overrides the chain_id entry from WRAPPED_NATIVE, REFERENCE_STABLE,
// FACTORY_ADDRESS and CALLBACK_SIGNATURE config keys when present.
void ApplyNetworkOverrides(NetworkRegistry& registry, unsigned long long chain_id);
