#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

#include "escrowbook/error.hpp"
#include "escrowbook/event.hpp"
#include "escrowbook/exchange.hpp"
#include "escrowbook/ledger.hpp"

namespace escrowbook {

/// Parse one CSV line. Comments ('#'), blank and malformed lines yield
/// std::nullopt.
std::optional<Event> parse_event_line(const std::string& line);

struct ReplayStats {
    std::size_t lines   = 0;
    std::size_t skipped = 0;   // comments, blanks, malformed

    std::size_t pairs_created = 0;
    std::size_t fundings      = 0;
    std::size_t bids          = 0;
    std::size_t asks          = 0;

    std::size_t trades     = 0;
    Quantity    volume_a   = 0;
    Quantity    volume_b   = 0;
    Quantity    dust_b     = 0;

    std::map<ErrorKind, std::size_t> rejected;

    std::size_t rejected_total() const noexcept;
};

/**
 * Drives an Exchange from replay events.
 *
 * Rejected submissions (engine errors) are counted by kind and the replay
 * goes on, unless strict is set, in which case the error propagates.
 */
class Replayer
{
public:
    Replayer(Exchange& exchange, InMemoryLedger& ledger,
             std::map<std::string, PairId> pairs = {}, bool strict = false);

    void apply(const Event& ev);

    /// Read and apply every line of `in`.
    const ReplayStats& run(std::istream& in);

    const ReplayStats& stats() const noexcept { return stats_; }
    const std::map<std::string, PairId>& pairs() const noexcept { return pairs_; }

private:
    PairId resolve(const std::string& name) const;

    Exchange&                     exchange_;
    InMemoryLedger&               ledger_;
    std::map<std::string, PairId> pairs_;
    bool                          strict_;
    ReplayStats                   stats_;
};

} // namespace escrowbook
