#pragma once

#include "types.hpp"
#include <cstdint>
#include <functional>
#include <mutex>

namespace fpanel {

/**
 * @brief Issues "floating-<epoch ms>" ids.
 *
 * The timestamp is made strictly increasing: a reading that is not greater
 * than the last issued value is replaced by last + 1, so ids created within
 * the same millisecond stay distinct.
 */
class WindowIdGenerator
{
public:
    using Clock = std::function<int64_t()>;

    WindowIdGenerator();
    explicit WindowIdGenerator(Clock clock);

    WindowId next();

    static int64_t system_clock_millis();

private:
    Clock clock_;
    std::mutex mutex_;
    int64_t last_ = 0;
    bool issued_ = false;
};

} // namespace fpanel
