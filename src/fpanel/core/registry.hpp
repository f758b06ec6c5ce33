#pragma once

#include "types.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace fpanel {

/**
 * @brief Ordered list of the floating window ids this process created.
 *
 * Insertion order is preserved. Every entry corresponds to a window that was
 * successfully created and not yet closed or destroyed. All members are safe
 * to call concurrently; the lock is only held for the in-memory operation.
 */
class WindowRegistry
{
public:
    WindowRegistry() = default;

    WindowRegistry(WindowRegistry const&) = delete;
    WindowRegistry& operator=(WindowRegistry const&) = delete;

    void add(WindowId id);

    /// Removes every entry equal to id. Returns the number of entries removed.
    size_t remove(WindowId const& id);

    bool contains(WindowId const& id) const;
    std::vector<WindowId> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<WindowId> ids_;
};

} // namespace fpanel
