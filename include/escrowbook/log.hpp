#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>

namespace escrowbook {

inline std::uint64_t now_ns()
{
    using clock = std::chrono::steady_clock;
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now().time_since_epoch()).count());
}

} // namespace escrowbook

// Library code is silent unless built with ESCROWBOOK_VERBOSE_LOG.
#ifdef ESCROWBOOK_VERBOSE_LOG
#define ESCROWBOOK_LOG(msg) do { std::cout << ::escrowbook::now_ns() << " | " << msg << std::endl; } while (0)
#else
#define ESCROWBOOK_LOG(msg) do {} while (0)
#endif
