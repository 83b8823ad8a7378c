/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <cstdint>

namespace CloudDefenders {

    /**
     * @brief Per-owner counter handing out 64-bit entity identifiers.
     *
     * Owned by value (one per EntityManager), so independent sessions and
     * test fixtures number their entities from 1 without interfering.
     * The simulation is single-threaded; no atomics are needed.
     */
    class UniqueIDGenerator {
    public:
        using IDType = uint64_t;

        // Never returned by generate()
        static constexpr IDType INVALID_ID = 0;

        IDType generate() { return m_next++; }

    private:
        IDType m_next{INVALID_ID + 1};
    };

} // namespace CloudDefenders

#endif // UNIQUE_ID_HPP
