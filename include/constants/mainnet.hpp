#pragma once
#include <string>

namespace MainnetConstants {
  inline constexpr unsigned long long CHAIN_ID = 1;
  // Uniswap V2 factory
  inline const std::string UNISWAP_V2_FACTORY = "0x5C69bEe701ef814a2B6a3EDD4B1652CB9cc5aA6f";
  inline const std::string WETH = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2"; // Wrapped native
  inline const std::string DAI = "0x6B175474E89094C44Da98b954EedeAC495271d0F"; // Reference stable
  inline const std::string USDC = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
  // Well-known pairs, token0 listed first
  inline const std::string USDC_WETH_PAIR = "0xB4e16d0168e52d35CaCD2c6185b44281Ec28C9Dc";
  inline const std::string DAI_WETH_PAIR = "0xA478c2975Ab1Ea89e8196811F51A7B7Ade33eB11";
}
