#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/network.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "telemetry/structured_logger.hpp"
#include "uniswap_v2/fee_calculator.hpp"
#include "uniswap_v2/loan_request_builder.hpp"
#include "uniswap_v2/pair_resolver.hpp"
#include "uniswap_v2/rpc_pair_gateway.hpp"
#include <iostream>
#include <optional>

// Plans a flash swap against a live node: resolves the pair, prints the
// swap() calldata the borrower contract must send and what it will owe.
int main(int argc, char** argv) {
  const std::string env_path = argc > 1 ? argv[1] : ".env";
  ConfigManager::Initialize(env_path);
  int rc = 0;
  try {
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("flashswap.log"),
                       ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info")),
                       ConfigManager::GetBoolOr("LOG_STDERR", true));
    if (auto events = ConfigManager::Get("EVENTS_FILE")) StructuredLogger::Instance().Initialize(*events);

    NetworkRegistry networks = DefaultNetworkRegistry();
    if (auto path = ConfigManager::Get("NETWORKS_FILE")) networks = LoadNetworkRegistry(*path);

    HttpClientTuning tuning;
    tuning.verify_tls = ConfigManager::GetBoolOr("RPC_VERIFY_TLS", true);
    auto http = CreateCurlHttpClient(tuning);
    RpcClient rpc(*http, ConfigManager::GetOrThrow("RPC_URL"), ConfigManager::Get("RPC_AUTH_HEADER"));
    const int timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 3000);

    unsigned long long chain_id = ConfigManager::GetUint64Or("CHAIN_ID", 0);
    if (chain_id == 0) chain_id = rpc.EthChainId(timeout_ms);
    ApplyNetworkOverrides(networks, chain_id);
    const NetworkConfig& net = networks.Get(chain_id);
    Logger::Info("Network " + std::to_string(chain_id) + " (" + net.name + ") factory=" + net.factory.ToHex());

    const Address borrower = Address::FromHex(ConfigManager::GetOrThrow("BORROWER_ADDRESS"));
    const Address asset = Address::FromHex(ConfigManager::GetOrThrow("BORROW_ASSET"));
    const Amount amount = ParseAmount(ConfigManager::GetOrThrow("BORROW_AMOUNT"));
    std::optional<PoolHandle> explicit_pool;
    if (auto p = ConfigManager::Get("POOL_ADDRESS")) explicit_pool = PoolHandle::FromExplicit(Address::FromHex(*p));
    Bytes user_data;
    if (auto d = ConfigManager::Get("USER_DATA")) user_data = HexToBytes(*d);

    RpcPairGateway gateway(rpc, timeout_ms);
    PairResolver resolver(networks, gateway);
    LoanRequestBuilder builder(resolver, gateway, borrower);
    BorrowCall call = builder.BuildLoan(chain_id, explicit_pool, asset, amount, user_data);
    const Amount fee = FeeCalculator::Fee(amount);
    const Amount repay = FeeCalculator::RepayAmount(amount);

    std::cout << "pair:        " << call.pool.Pair().ToChecksumHex() << "\n"
              << "borrow slot: " << (call.slot == PairSlot::SLOT0 ? "token0" : "token1") << "\n"
              << "amount0Out:  " << AmountToString(call.amount0_out) << "\n"
              << "amount1Out:  " << AmountToString(call.amount1_out) << "\n"
              << "recipient:   " << call.recipient.ToChecksumHex() << "\n"
              << "fee:         " << AmountToString(fee) << "\n"
              << "repay:       " << AmountToString(repay) << "\n"
              << "calldata:    " << BytesToHex0x(LoanRequestBuilder::EncodeSwapCall(call)) << std::endl;
    StructuredLogger::Instance().LogEvent("loan_planned", {
      {"chain_id", chain_id}, {"pair", call.pool.Pair().ToHex()}, {"asset", asset.ToHex()},
      {"amount", AmountToString(amount)}, {"repay", AmountToString(repay)}});
  } catch (const FlashSwapError& e) {
    Logger::Critical(std::string("Planning failed [") + ErrorCodeName(e.Code()) + "]: " + e.what());
    std::cerr << e.what() << std::endl;
    rc = 1;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("Fatal: ") + e.what());
    std::cerr << e.what() << std::endl;
    rc = 1;
  }
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return rc;
}
