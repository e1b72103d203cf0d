#include "escrowbook/replay.hpp"

#include "escrowbook/log.hpp"
#include "utils/checked_math.hpp"

#include <cctype>
#include <cstdint>
#include <istream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split_fields(const std::string& line)
{
    std::vector<std::string> fields;
    std::stringstream        ss(line);
    std::string              token;
    while (std::getline(ss, token, ','))
        fields.push_back(trim(token));
    return fields;
}

// std::stoull accepts a leading '-' and wraps; only plain digits pass here.
std::optional<std::uint64_t> parse_u64(const std::string& s)
{
    if (s.empty())
        return std::nullopt;
    for (char c : s)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }

    try
    {
        return static_cast<std::uint64_t>(std::stoull(s));
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

} // namespace

namespace escrowbook {

std::optional<Event> parse_event_line(const std::string& line)
{
    auto t = trim(line);
    if (t.empty() || t[0] == '#')
        return std::nullopt;

    auto fields = split_fields(t);
    for (const auto& f : fields)
    {
        if (f.empty())
            return std::nullopt;
    }

    const auto type = to_upper(fields[0]);
    Event      ev;

    if (type == "PAIR")
    {
        if (fields.size() != 4)
            return std::nullopt;

        ev.type    = EventType::Pair;
        ev.name    = fields[1];
        ev.asset_a = fields[2];
        ev.asset_b = fields[3];
        return ev;
    }

    if (type == "FUND")
    {
        if (fields.size() != 4)
            return std::nullopt;

        auto amount = parse_u64(fields[3]);
        if (!amount)
            return std::nullopt;

        ev.type    = EventType::Fund;
        ev.name    = fields[1];
        ev.account = fields[2];
        ev.qty     = *amount;
        return ev;
    }

    if (type == "BID" || type == "ASK")
    {
        if (fields.size() != 5 && fields.size() != 6)
            return std::nullopt;

        auto price = parse_u64(fields[2]);
        auto qty   = parse_u64(fields[3]);
        if (!price || !qty)
            return std::nullopt;

        ev.type        = (type == "BID") ? EventType::Bid : EventType::Ask;
        ev.name        = fields[1];
        ev.price       = *price;
        ev.qty         = *qty;
        ev.account     = fields[4];
        ev.beneficiary = (fields.size() == 6) ? fields[5] : fields[4];
        return ev;
    }

    return std::nullopt;
}

std::size_t ReplayStats::rejected_total() const noexcept
{
    std::size_t total = 0;
    for (const auto& [kind, count] : rejected)
        total += count;
    return total;
}

Replayer::Replayer(Exchange& exchange, InMemoryLedger& ledger,
                   std::map<std::string, PairId> pairs, bool strict)
    : exchange_(exchange),
      ledger_(ledger),
      pairs_(std::move(pairs)),
      strict_(strict)
{
}

PairId Replayer::resolve(const std::string& name) const
{
    auto it = pairs_.find(name);
    if (it == pairs_.end())
        throw Error(ErrorKind::PairNotFound, "unknown pair '" + name + "'");
    return it->second;
}

void Replayer::apply(const Event& ev)
{
    try
    {
        switch (ev.type)
        {
        case EventType::Pair:
            pairs_[ev.name] = exchange_.create_pair(ev.asset_a, ev.asset_b);
            ++stats_.pairs_created;
            break;

        case EventType::Fund:
            ledger_.deposit(ev.name, ev.account, ev.qty);
            ++stats_.fundings;
            break;

        case EventType::Bid:
        case EventType::Ask: {
            const PairId id  = resolve(ev.name);
            SubmitResult res = (ev.type == EventType::Bid)
                ? exchange_.submit_bid(id, ev.price, ev.beneficiary, ev.qty, ev.account)
                : exchange_.submit_ask(id, ev.price, ev.beneficiary, ev.qty, ev.account);

            if (ev.type == EventType::Bid)
                ++stats_.bids;
            else
                ++stats_.asks;

            for (const auto& tr : res.trades)
            {
                ++stats_.trades;
                stats_.volume_a = utils::saturating_add(stats_.volume_a, tr.quantity_a);
                stats_.volume_b = utils::saturating_add(stats_.volume_b, tr.quantity_b);
                stats_.dust_b   = utils::saturating_add(stats_.dust_b, tr.dust_b);
            }
            break;
        }
        }
    }
    catch (const Error& ex)
    {
        ++stats_.rejected[ex.kind()];
        ESCROWBOOK_LOG("replay rejected: " << ex.what());
        if (strict_)
            throw;
    }
}

const ReplayStats& Replayer::run(std::istream& in)
{
    std::string line;
    while (std::getline(in, line))
    {
        ++stats_.lines;
        auto ev = parse_event_line(line);
        if (!ev)
        {
            ++stats_.skipped;
            continue;
        }
        apply(*ev);
    }
    return stats_;
}

} // namespace escrowbook
