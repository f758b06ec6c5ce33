#include "fpanel/core/window_id.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace fpanel;

TEST_CASE("Ids are the prefix followed by the clock reading", "[window_id]")
{
    WindowIdGenerator ids([]() -> int64_t { return 1700000000000; });
    REQUIRE(ids.next() == "floating-1700000000000");
}

TEST_CASE("Ids from the system clock carry the prefix", "[window_id]")
{
    WindowIdGenerator ids;
    auto id = ids.next();
    REQUIRE(id.starts_with("floating-"));
    REQUIRE(id.size() > std::string("floating-").size());
}

TEST_CASE("Ids issued within the same millisecond are distinct", "[window_id][edge]")
{
    WindowIdGenerator ids([]() -> int64_t { return 1700000000000; });

    REQUIRE(ids.next() == "floating-1700000000000");
    REQUIRE(ids.next() == "floating-1700000000001");
    REQUIRE(ids.next() == "floating-1700000000002");
}

TEST_CASE("Ids never go backwards when the clock does", "[window_id][edge]")
{
    std::vector<int64_t> readings{ 1000, 2000, 1500, 2500 };
    size_t index = 0;
    WindowIdGenerator ids([&]() { return readings[index++]; });

    REQUIRE(ids.next() == "floating-1000");
    REQUIRE(ids.next() == "floating-2000");
    REQUIRE(ids.next() == "floating-2001");
    REQUIRE(ids.next() == "floating-2500");
}

TEST_CASE("Concurrent id generation yields unique ids", "[window_id][concurrency]")
{
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 100;

    WindowIdGenerator ids([]() -> int64_t { return 42; });
    std::vector<std::vector<WindowId>> results(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t)
    {
        threads.emplace_back(
            [&ids, &results, t]()
            {
                for (int i = 0; i < PER_THREAD; ++i)
                    results[t].push_back(ids.next());
            }
        );
    }
    for (auto& thread : threads)
        thread.join();

    std::set<WindowId> unique;
    for (auto const& batch : results)
        unique.insert(batch.begin(), batch.end());
    REQUIRE(unique.size() == THREADS * PER_THREAD);
}
