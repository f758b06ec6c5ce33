#include "registry.hpp"
#include <algorithm>

namespace fpanel {

void WindowRegistry::add(WindowId id)
{
    std::lock_guard lock(mutex_);
    ids_.push_back(std::move(id));
}

size_t WindowRegistry::remove(WindowId const& id)
{
    std::lock_guard lock(mutex_);
    return std::erase(ids_, id);
}

bool WindowRegistry::contains(WindowId const& id) const
{
    std::lock_guard lock(mutex_);
    return std::ranges::find(ids_, id) != ids_.end();
}

std::vector<WindowId> WindowRegistry::snapshot() const
{
    std::lock_guard lock(mutex_);
    return ids_;
}

size_t WindowRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return ids_.size();
}

} // namespace fpanel
