#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <wamp/uri_map.hpp>

using namespace wamp;

TEST(uri_map, Resolve) {
    uri_map<int> map;
    map.insert(as_uri("com.example.a"), 1);

    EXPECT_EQ(1, map.resolve(as_uri("com.example.a")));
    EXPECT_EQ(1u, map.size());
    EXPECT_TRUE(map.contains(as_uri("com.example.a")));
}

TEST(uri_map, InsertOverwrites) {
    uri_map<int> map;
    map.insert(as_uri("com.example.a"), 1);
    map.insert(as_uri("com.example.a"), 2);

    EXPECT_EQ(2, map.resolve(as_uri("com.example.a")));
    EXPECT_EQ(1u, map.size());
}

TEST(uri_map, ThrowsLookupErrorOnUnknown) {
    uri_map<int> map;
    map.insert(as_uri("com.example"), 1);

    try {
        map.resolve(as_uri("com.example.a"));
        FAIL();
    } catch (const lookup_error& err) {
        EXPECT_EQ(error::uri_not_found, err.code());
    }
}

TEST(uri_map, LookupErrorIsNotWampError) {
    EXPECT_FALSE((std::is_base_of<wamp::error_t, lookup_error>::value));
}

TEST(uri_map, PrefixPolicyResolvesLongestPrefix) {
    uri_map<int> map(match_policy::prefix);
    map.insert(as_uri("com"), 1);
    map.insert(as_uri("com.example"), 2);

    EXPECT_EQ(2, map.resolve(as_uri("com.example.bad_arg")));
    EXPECT_EQ(2, map.resolve(as_uri("com.example")));
    EXPECT_EQ(1, map.resolve(as_uri("com.examples")));
    EXPECT_THROW(map.resolve(as_uri("org.example")), lookup_error);
}

TEST(uri_map, ExactPolicyDoesNotMatchPrefix) {
    uri_map<int> map;
    map.insert(as_uri("com.example"), 1);

    EXPECT_EQ(match_policy::exact, map.policy());
    EXPECT_THROW(map.resolve(as_uri("com.example.bad_arg")), lookup_error);
}

TEST(uri_map, Erase) {
    uri_map<int> map;
    map.insert(as_uri("com.example"), 1);

    EXPECT_TRUE(map.erase(as_uri("com.example")));
    EXPECT_FALSE(map.erase(as_uri("com.example")));
    EXPECT_TRUE(map.empty());
}

TEST(uri_map, ConcurrentInsertAndResolve) {
    uri_map<int> map;
    map.insert(as_uri("com.example.stable"), 42);

    std::atomic<bool> failed(false);
    std::vector<std::thread> threads;

    for (int id = 0; id < 4; ++id) {
        threads.emplace_back([&map, &failed, id] {
            for (int i = 0; i < 1000; ++i) {
                map.insert(as_uri("com.example.t" + std::to_string(id)), i);

                if (map.resolve(as_uri("com.example.stable")) != 42) {
                    failed = true;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(failed);
    EXPECT_EQ(5u, map.size());
}
