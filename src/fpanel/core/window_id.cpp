#include "window_id.hpp"
#include <chrono>
#include <string>

namespace fpanel {

WindowIdGenerator::WindowIdGenerator()
    : clock_(&WindowIdGenerator::system_clock_millis)
{
}

WindowIdGenerator::WindowIdGenerator(Clock clock)
    : clock_(std::move(clock))
{
}

WindowId WindowIdGenerator::next()
{
    int64_t now = clock_();

    int64_t stamp = 0;
    {
        std::lock_guard lock(mutex_);
        stamp = (issued_ && now <= last_) ? last_ + 1 : now;
        last_ = stamp;
        issued_ = true;
    }

    return std::string(FLOATING_ID_PREFIX) + std::to_string(stamp);
}

int64_t WindowIdGenerator::system_clock_millis()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

} // namespace fpanel
