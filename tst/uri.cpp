#include <unordered_set>

#include <gtest/gtest.h>

#include <wamp/error.hpp>
#include <wamp/uri.hpp>

using namespace wamp;

TEST(uri_t, Constructor) {
    uri_t uri("com.example.bad_arg");
    EXPECT_EQ("com.example.bad_arg", uri.string());
}

TEST(uri_t, ThrowsOnEmpty) {
    try {
        uri_t uri("");
        FAIL();
    } catch (const std::system_error& err) {
        EXPECT_EQ(error::empty_uri, err.code());
    }
}

TEST(uri_t, ThrowsOnEmptyComponent) {
    for (auto uri : { ".com", "com.", "com..example", "." }) {
        try {
            as_uri(uri);
            FAIL() << uri;
        } catch (const std::system_error& err) {
            EXPECT_EQ(error::empty_component, err.code()) << uri;
        }
    }
}

TEST(uri_t, ThrowsOnInvalidCharacter) {
    for (auto uri : { "com.exa mple", "com.#", "com.\texample" }) {
        try {
            as_uri(uri);
            FAIL() << uri;
        } catch (const std::system_error& err) {
            EXPECT_EQ(error::invalid_character, err.code()) << uri;
        }
    }
}

TEST(uri_t, Components) {
    EXPECT_EQ((std::vector<std::string> { "com", "example", "bad_arg" }),
        as_uri("com.example.bad_arg").components());
    EXPECT_EQ(std::vector<std::string> { "single" }, as_uri("single").components());
}

TEST(uri_t, IsPrefixOf) {
    EXPECT_TRUE(as_uri("com.example").is_prefix_of(as_uri("com.example.bad_arg")));
    EXPECT_TRUE(as_uri("com.example").is_prefix_of(as_uri("com.example")));
    EXPECT_FALSE(as_uri("com.example").is_prefix_of(as_uri("com.examples")));
    EXPECT_FALSE(as_uri("com.example.bad_arg").is_prefix_of(as_uri("com.example")));
}

TEST(uri_t, Comparison) {
    EXPECT_EQ(as_uri("a.b"), as_uri("a.b"));
    EXPECT_NE(as_uri("a.b"), as_uri("a.c"));
    EXPECT_TRUE(as_uri("a.b") < as_uri("a.c"));
}

TEST(uri_t, Hashable) {
    std::unordered_set<uri_t> uris { as_uri("a.b"), as_uri("a.b"), as_uri("a.c") };
    EXPECT_EQ(2u, uris.size());
}

TEST(uri_t, WellKnown) {
    EXPECT_STREQ("wamp.error.runtime_error", uris::runtime_error);
    EXPECT_NO_THROW(as_uri(uris::canceled));
}
