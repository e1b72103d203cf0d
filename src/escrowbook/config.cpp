#include "escrowbook/config.hpp"

#include "escrowbook/error.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>

using nlohmann::json;

namespace {

std::string require_string(const json& obj, const char* key, const std::string& where)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        throw escrowbook::ConfigError(where + ": '" + key + "' must be a string");

    auto value = it->get<std::string>();
    if (value.empty())
        throw escrowbook::ConfigError(where + ": '" + key + "' must not be empty");
    return value;
}

const json& array_or_empty(const json& j, const char* key)
{
    static const json empty = json::array();

    auto it = j.find(key);
    if (it == j.end())
        return empty;
    if (!it->is_array())
        throw escrowbook::ConfigError(std::string("'") + key + "' must be an array");
    return *it;
}

} // namespace

namespace escrowbook {

ExchangeConfig parse_config(const json& j)
{
    if (!j.is_object())
        throw ConfigError("top level must be an object");

    ExchangeConfig cfg;

    std::set<std::string> names;
    std::size_t           idx = 0;
    for (const auto& p : array_or_empty(j, "pairs"))
    {
        const std::string where = "pairs[" + std::to_string(idx++) + "]";
        if (!p.is_object())
            throw ConfigError(where + " must be an object");

        PairConfig pc;
        pc.asset_a = require_string(p, "asset_a", where);
        pc.asset_b = require_string(p, "asset_b", where);
        pc.name    = p.contains("name") ? require_string(p, "name", where)
                                        : pc.asset_a + "/" + pc.asset_b;

        if (!names.insert(pc.name).second)
            throw ConfigError(where + ": duplicate pair name '" + pc.name + "'");

        cfg.pairs.push_back(std::move(pc));
    }

    idx = 0;
    for (const auto& b : array_or_empty(j, "balances"))
    {
        const std::string where = "balances[" + std::to_string(idx++) + "]";
        if (!b.is_object())
            throw ConfigError(where + " must be an object");

        BalanceConfig bc;
        bc.account = require_string(b, "account", where);
        bc.asset   = require_string(b, "asset", where);

        auto amount = b.find("amount");
        if (amount == b.end() || !amount->is_number_unsigned())
            throw ConfigError(where + ": 'amount' must be a non-negative integer");
        bc.amount = amount->get<Quantity>();

        cfg.balances.push_back(std::move(bc));
    }

    auto strict = j.find("strict");
    if (strict != j.end())
    {
        if (!strict->is_boolean())
            throw ConfigError("'strict' must be a boolean");
        cfg.strict = strict->get<bool>();
    }

    return cfg;
}

ExchangeConfig parse_config_string(const std::string& text)
{
    try
    {
        return parse_config(json::parse(text));
    }
    catch (const json::exception& ex)
    {
        throw ConfigError(ex.what());
    }
}

ExchangeConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("failed to open " + path);

    std::stringstream ss;
    ss << in.rdbuf();
    return parse_config_string(ss.str());
}

std::map<std::string, PairId> apply_config(const ExchangeConfig& config,
                                           Exchange&             exchange,
                                           InMemoryLedger&       ledger)
{
    std::map<std::string, PairId> ids;

    for (const auto& pc : config.pairs)
        ids[pc.name] = exchange.create_pair(pc.asset_a, pc.asset_b);

    for (const auto& bc : config.balances)
        ledger.deposit(bc.asset, bc.account, bc.amount);

    return ids;
}

} // namespace escrowbook
