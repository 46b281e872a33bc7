/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace Strata {
    /**
     * @brief Process-wide generator for 64-bit entity and group identifiers.
     *
     * Identifiers read back from an archive are fed to reserve() so that
     * freshly generated ids never collide with restored ones.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        /**
         * @brief Generates a new unique ID. The first ID generated is 1.
         */
        static IDType generate() {
            return m_nextID++;
        }

        /**
         * @brief Marks @p usedId as taken so generate() only returns larger ids.
         */
        static void reserve(IDType usedId) {
            IDType current = m_nextID.load();
            while (current <= usedId &&
                   !m_nextID.compare_exchange_weak(current, usedId + 1)) {
            }
        }

        static constexpr IDType INVALID_ID = 0;

    private:
        // Starts at 1, so that INVALID_ID (0) is never generated.
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace Strata

#endif // UNIQUE_ID_HPP
