#include "fpanel/commands/worker_pool.hpp"
#include "fpanel/core/wake_pipe.hpp"
#include <catch2/catch_test_macros.hpp>
#include <poll.h>

using namespace fpanel;

namespace {

bool readable(WakePipe const& wake, int timeout_ms)
{
    pollfd fd = {};
    fd.fd = wake.file_descriptor();
    fd.events = POLLIN;
    return poll(&fd, 1, timeout_ms) == 1 && (fd.revents & POLLIN);
}

} // namespace

TEST_CASE("Wake pipe is quiet until notified", "[wake_pipe]")
{
    WakePipe wake;
    REQUIRE(wake.file_descriptor() >= 0);
    REQUIRE_FALSE(readable(wake, 0));

    wake.notify();
    REQUIRE(readable(wake, 0));

    wake.drain();
    REQUIRE_FALSE(readable(wake, 0));
}

TEST_CASE("Wake pipe never blocks the notifier", "[wake_pipe][edge]")
{
    WakePipe wake;

    // Far more than a pipe buffer holds
    for (int i = 0; i < 200000; ++i)
        wake.notify();

    REQUIRE(readable(wake, 0));
    wake.drain();
    REQUIRE_FALSE(readable(wake, 0));
}

TEST_CASE("Wake pipe drain with nothing pending returns", "[wake_pipe][edge]")
{
    WakePipe wake;
    REQUIRE_NOTHROW(wake.drain());
    REQUIRE_FALSE(readable(wake, 0));
}

TEST_CASE("A finished worker job wakes a blocked poll", "[wake_pipe][worker_pool]")
{
    WakePipe wake;
    WorkerPool pool(1);

    REQUIRE(pool.submit([&wake] { wake.notify(); }));

    REQUIRE(readable(wake, 2000));
    pool.shutdown();
}
