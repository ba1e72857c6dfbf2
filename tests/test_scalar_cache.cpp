#include <tilecache/cache/scalar_cache.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace tilecache;
using namespace tilecache::cache;

TEST_CASE("fetch before precompute is NotInitialized", "[cache][scalar]") {
    ScalarCache cache("gpu buffer cache");

    REQUIRE_FALSE(cache.initialized());
    REQUIRE(cache.version() == 0);

    auto fetched = cache.fetch();
    REQUIRE_FALSE(fetched.has_value());
    REQUIRE(fetched.error().kind == ErrorKind::NotInitialized);
    REQUIRE(fetched.error().message.find("gpu buffer cache") != std::string::npos);
}

TEST_CASE("precompute stores the producer's buffer", "[cache][scalar]") {
    ScalarCache cache("raw column cache");

    auto elapsed = cache.precompute([]() -> Result<codec::Bytes> {
        return codec::Bytes{1, 0, 0, 0, 7};
    });
    REQUIRE(elapsed.has_value());
    REQUIRE(elapsed->count() >= 0);
    REQUIRE(cache.initialized());
    REQUIRE(cache.version() == 1);

    auto fetched = cache.fetch();
    REQUIRE(fetched.has_value());
    REQUIRE(*fetched == codec::Bytes{1, 0, 0, 0, 7});
}

TEST_CASE("a later store replaces the slot wholesale", "[cache][scalar]") {
    ScalarCache cache("slot");
    cache.store(codec::Bytes{1, 2, 3});
    cache.store(codec::Bytes{9});

    REQUIRE(cache.version() == 2);
    REQUIRE(cache.fetch().value() == codec::Bytes{9});
}

TEST_CASE("an empty buffer is still a stored value", "[cache][scalar]") {
    ScalarCache cache("slot");
    cache.store({});

    auto fetched = cache.fetch();
    REQUIRE(fetched.has_value());
    REQUIRE(fetched->empty());
}

TEST_CASE("a failed precompute leaves the slot untouched", "[cache][scalar]") {
    ScalarCache cache("slot");
    cache.store(codec::Bytes{4, 4});

    auto elapsed = cache.precompute([]() -> Result<codec::Bytes> {
        return make_error(ErrorKind::Engine, "no such table: tiles");
    });
    REQUIRE_FALSE(elapsed.has_value());
    REQUIRE(elapsed.error().kind == ErrorKind::Engine);
    REQUIRE(cache.version() == 1);
    REQUIRE(cache.fetch().value() == codec::Bytes{4, 4});
}

TEST_CASE("concurrent stores are last-write-wins", "[cache][scalar]") {
    ScalarCache cache("slot");
    std::vector<std::thread> writers;
    for (std::uint8_t i = 0; i < 8; ++i) {
        writers.emplace_back([&cache, i] { cache.store(codec::Bytes{i, i}); });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    REQUIRE(cache.version() == 8);
    auto fetched = cache.fetch();
    REQUIRE(fetched.has_value());
    REQUIRE(fetched->size() == 2);
    REQUIRE((*fetched)[0] == (*fetched)[1]);
}
