#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "config/network.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {
  // Resets the process-wide config around each test
  struct ConfigScope {
    ConfigScope() { ConfigManager::Clear(); }
    ~ConfigScope() { ConfigManager::Clear(); }
  };

  std::string WriteTempFile(const std::string& name, const std::string& contents) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
  }

  const char* kTwoNetworks = R"json({
    "networks": [
      {"chain_id": 1, "name": "mainnet",
       "wrapped_native": "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2",
       "reference_stable": "0x6B175474E89094C44Da98b954EedeAC495271d0F",
       "factory": "0x5C69bEe701ef814a2B6a3EDD4B1652CB9cc5aA6f"},
      {"chain_id": 56, "name": "bsc",
       "wrapped_native": "0xbb4CdB9CBd36B01bD1cBaEBF2De08d9173bc095c",
       "reference_stable": "0xe9e7CEA3DedcA5984780Bafc599bD69ADd087D56",
       "factory": "0xcA143Ce32Fe78f1f7019d7d551a6402fC5350c73",
       "callback_signature": "pancakeCall(address,uint256,uint256,bytes)"}
    ]
  })json";
}

TEST_CASE("ConfigManager reads .env files", "[config]") {
  ConfigScope scope;
  auto path = WriteTempFile("flashswap_test.env",
    "# comment\n"
    "FLASHSWAP_TEST_URL = http://localhost:8545\n"
    "export FLASHSWAP_TEST_CHAIN=1\n"
    "FLASHSWAP_TEST_QUOTED=\"a b\"\n"
    "FLASHSWAP_TEST_EMPTY=\n"
    "not a pair\n");
  ConfigManager::Initialize(path);

  REQUIRE(ConfigManager::Get("FLASHSWAP_TEST_URL") == std::optional<std::string>("http://localhost:8545"));
  REQUIRE(ConfigManager::GetUint64Or("FLASHSWAP_TEST_CHAIN", 0) == 1);
  REQUIRE(ConfigManager::GetOrThrow("FLASHSWAP_TEST_QUOTED") == "a b");
  REQUIRE_THROWS_AS(ConfigManager::GetOrThrow("FLASHSWAP_TEST_EMPTY"), std::runtime_error);
  REQUIRE_FALSE(ConfigManager::Get("FLASHSWAP_TEST_MISSING").has_value());
  std::remove(path.c_str());
}

TEST_CASE("ConfigManager numeric and boolean accessors", "[config]") {
  ConfigScope scope;
  ConfigManager::Set("FLASHSWAP_TEST_N", "3000");
  ConfigManager::Set("FLASHSWAP_TEST_BAD", "12abc");
  ConfigManager::Set("FLASHSWAP_TEST_NEG", "-5");
  ConfigManager::Set("FLASHSWAP_TEST_FLAG", "Yes");

  REQUIRE(ConfigManager::GetIntOr("FLASHSWAP_TEST_N", 1) == 3000);
  REQUIRE(ConfigManager::GetIntOr("FLASHSWAP_TEST_UNSET", 7) == 7);
  REQUIRE(ConfigManager::GetIntOr("FLASHSWAP_TEST_NEG", 0) == -5);
  REQUIRE_THROWS_AS(ConfigManager::GetIntOr("FLASHSWAP_TEST_BAD", 0), std::runtime_error);
  REQUIRE_THROWS_AS(ConfigManager::GetUint64Or("FLASHSWAP_TEST_NEG", 0), std::runtime_error);
  REQUIRE(ConfigManager::GetBoolOr("FLASHSWAP_TEST_FLAG", false));
  REQUIRE_FALSE(ConfigManager::GetBoolOr("FLASHSWAP_TEST_UNSET", false));
}

TEST_CASE("Log level names", "[config]") {
  REQUIRE(ParseLogLevel("DEBUG") == LogLevel::DEBUG);
  REQUIRE(ParseLogLevel("warn") == LogLevel::WARNING);
  REQUIRE(ParseLogLevel("Critical") == LogLevel::CRITICAL);
  REQUIRE(ParseLogLevel("verbose") == LogLevel::INFO);
}

TEST_CASE("Default registry knows mainnet only", "[config]") {
  NetworkRegistry registry = DefaultNetworkRegistry();
  REQUIRE(registry.Size() == 1);
  const NetworkConfig& mainnet = registry.Get(MainnetConstants::CHAIN_ID);
  REQUIRE(mainnet.wrapped_native == Addr(MainnetConstants::WETH));
  REQUIRE(mainnet.reference_stable == Addr(MainnetConstants::DAI));
  REQUIRE(mainnet.factory == Addr(MainnetConstants::UNISWAP_V2_FACTORY));
  REQUIRE(mainnet.callback_signature == FlashSwapABI::CALLBACK_SIGNATURE);
  REQUIRE(registry.Find(137) == nullptr);
  REQUIRE(CaughtCode([&]{ registry.Get(137); }) == ErrorCode::UNSUPPORTED_NETWORK);
}

TEST_CASE("Register validates the config", "[config]") {
  NetworkRegistry registry;
  NetworkConfig cfg;
  cfg.chain_id = 5;
  cfg.wrapped_native = AddrWithLead(0x01);
  cfg.reference_stable = AddrWithLead(0x02);
  cfg.factory = AddrWithLead(0x03);
  cfg.callback_signature = FlashSwapABI::CALLBACK_SIGNATURE;

  SECTION("zero factory") {
    cfg.factory = Address();
    REQUIRE_THROWS_AS(registry.Register(cfg), std::invalid_argument);
  }
  SECTION("stable equals wrapped native") {
    cfg.reference_stable = cfg.wrapped_native;
    REQUIRE_THROWS_AS(registry.Register(cfg), std::invalid_argument);
  }
  SECTION("no callback signature") {
    cfg.callback_signature.clear();
    REQUIRE_THROWS_AS(registry.Register(cfg), std::invalid_argument);
  }
  SECTION("valid config replaces the previous entry") {
    registry.Register(cfg);
    cfg.factory = AddrWithLead(0x04);
    registry.Register(cfg);
    REQUIRE(registry.Size() == 1);
    REQUIRE(registry.Get(5).factory == AddrWithLead(0x04));
  }
}

TEST_CASE("Network registry from JSON", "[config]") {
  NetworkRegistry registry = ParseNetworkRegistry(kTwoNetworks);
  REQUIRE(registry.Size() == 2);
  REQUIRE(registry.Get(1).callback_signature == FlashSwapABI::CALLBACK_SIGNATURE);
  REQUIRE(registry.Get(56).name == "bsc");
  REQUIRE(registry.Get(56).callback_signature == "pancakeCall(address,uint256,uint256,bytes)");

  SECTION("from a file") {
    auto path = WriteTempFile("flashswap_networks.json", kTwoNetworks);
    REQUIRE(LoadNetworkRegistry(path).Size() == 2);
    std::remove(path.c_str());
  }
  SECTION("bad documents") {
    REQUIRE_THROWS_AS(ParseNetworkRegistry("{"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseNetworkRegistry(R"({"chains": []})"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseNetworkRegistry(R"({"networks": {}})"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseNetworkRegistry(R"({"networks": [{"chain_id": 1}]})"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseNetworkRegistry(R"({"networks": [{"chain_id": 1, "wrapped_native": "0x12",
      "reference_stable": "0x6B175474E89094C44Da98b954EedeAC495271d0F",
      "factory": "0x5C69bEe701ef814a2B6a3EDD4B1652CB9cc5aA6f"}]})"), std::runtime_error);
    REQUIRE_THROWS_AS(LoadNetworkRegistry("/nonexistent/flashswap_networks.json"), std::runtime_error);
  }
}

TEST_CASE("Config keys override a network", "[config]") {
  ConfigScope scope;
  NetworkRegistry registry = DefaultNetworkRegistry();

  SECTION("nothing set leaves the registry alone") {
    ApplyNetworkOverrides(registry, MainnetConstants::CHAIN_ID);
    REQUIRE(registry.Get(1).factory == Addr(MainnetConstants::UNISWAP_V2_FACTORY));
  }
  SECTION("single key on a known network") {
    ConfigManager::Set("FACTORY_ADDRESS", "0x00000000000000000000000000000000000000fa");
    ApplyNetworkOverrides(registry, MainnetConstants::CHAIN_ID);
    REQUIRE(registry.Get(1).factory == Addr("0x00000000000000000000000000000000000000fa"));
    REQUIRE(registry.Get(1).wrapped_native == Addr(MainnetConstants::WETH));
  }
  SECTION("full set registers a new network") {
    ConfigManager::Set("WRAPPED_NATIVE", "0x00000000000000000000000000000000000000a1");
    ConfigManager::Set("REFERENCE_STABLE", "0x00000000000000000000000000000000000000a2");
    ConfigManager::Set("FACTORY_ADDRESS", "0x00000000000000000000000000000000000000a3");
    ConfigManager::Set("CALLBACK_SIGNATURE", "hook(address,uint256,uint256,bytes)");
    ApplyNetworkOverrides(registry, 31337);
    REQUIRE(registry.Size() == 2);
    REQUIRE(registry.Get(31337).callback_signature == "hook(address,uint256,uint256,bytes)");
  }
  SECTION("partial set on an unknown network is rejected") {
    ConfigManager::Set("FACTORY_ADDRESS", "0x00000000000000000000000000000000000000a3");
    REQUIRE_THROWS_AS(ApplyNetworkOverrides(registry, 31337), std::invalid_argument);
  }
}
