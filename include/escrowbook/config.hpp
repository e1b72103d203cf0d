#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "escrowbook/exchange.hpp"
#include "escrowbook/ledger.hpp"
#include "escrowbook/types.hpp"

namespace escrowbook {

struct PairConfig {
    std::string name;      // defaults to "<asset_a>/<asset_b>"
    AssetId     asset_a;
    AssetId     asset_b;
};

struct BalanceConfig {
    AccountId account;
    AssetId   asset;
    Quantity  amount{0};
};

// {
//   "pairs":    [ { "name": "SUI/USDC", "asset_a": "USDC", "asset_b": "SUI" } ],
//   "balances": [ { "account": "alice", "asset": "USDC", "amount": 1000 } ],
//   "strict":   false
// }
struct ExchangeConfig {
    std::vector<PairConfig>    pairs;
    std::vector<BalanceConfig> balances;
    bool                       strict{false};   // replay stops on the first rejected event
};

/// Throws ConfigError on a malformed document.
ExchangeConfig parse_config(const nlohmann::json& j);
ExchangeConfig parse_config_string(const std::string& text);
ExchangeConfig load_config(const std::string& path);

/// Create the configured pairs and fund the accounts.
/// Returns pair name -> id.
std::map<std::string, PairId> apply_config(const ExchangeConfig& config,
                                           Exchange&             exchange,
                                           InMemoryLedger&       ledger);

} // namespace escrowbook
