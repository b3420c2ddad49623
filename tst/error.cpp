#include <sstream>

#include <gtest/gtest.h>

#include <wamp/error.hpp>

using namespace wamp;

TEST(error_t, WhatIsDescriptionOnly) {
    transport_error err("connection reset");
    EXPECT_STREQ("connection reset", err.what());
    EXPECT_EQ(error::transport_failure, err.code());
}

TEST(error_t, Categories) {
    EXPECT_STREQ("wamp category", error::wamp_category().name());
    EXPECT_STREQ("wamp registry category", error::registry_category().name());
    EXPECT_STREQ("wamp uri category", error::uri_category().name());
    EXPECT_STREQ("wamp codec category", error::codec_category().name());

    std::error_code ec = error::insufficient_bytes;
    EXPECT_EQ(&error::codec_category(), &ec.category());
}

TEST(error_t, CatchableAsRoot) {
    try {
        throw client_closed();
    } catch (const wamp::error_t& err) {
        EXPECT_EQ(error::client_closed, err.code());
        EXPECT_STREQ("the client is closed", err.what());
    }
}

TEST(abort_error, Constructor) {
    abort_error err(abort_message_t(as_uri(uris::no_such_realm), object_t { { "message", "no realm" } }));

    EXPECT_EQ(uris::no_such_realm, err.reason());
    EXPECT_EQ((object_t { { "message", "no realm" } }), err.details());
    EXPECT_STREQ("wamp.error.no_such_realm (details = {\"message\": \"no realm\"})", err.what());
    EXPECT_EQ(error::session_aborted, err.code());
}

TEST(abort_error, FromMessage) {
    const message_t message(message_type::abort, array_t { object_t(), "wamp.error.not_authorized" });

    auto err = make_abort_error(message);
    EXPECT_EQ(uris::not_authorized, err.reason());
    EXPECT_TRUE(err.details().empty());
}

TEST(auth_error, Constructor) {
    auth_error err("invalid ticket");
    EXPECT_STREQ("invalid ticket", err.what());
    EXPECT_EQ(error::authentication_failed, err.code());
}

TEST(unexpected_message_error, What) {
    unexpected_message_error err(message_t(message_type::welcome, array_t { 1u, object_t() }), message_type::error);

    EXPECT_STREQ("received message WELCOME[1, {}] but expected message of type ERROR", err.what());
    EXPECT_EQ(message_type::error, err.expected());
    EXPECT_EQ(message_type::welcome, err.received().type);
    EXPECT_EQ(error::unexpected_message, err.code());
}

TEST(unexpected_message_error, IsInvalidMessage) {
    try {
        throw unexpected_message_error(message_t(message_type::hello, array_t()), message_type::abort);
    } catch (const invalid_message& err) {
        EXPECT_EQ(error::unexpected_message, err.code());
    }
}

TEST(error_response, WhatWithArgsAndKwargs) {
    error_response err(error_message_t(
        message_type::call, 1, as_uri("com.example.error"),
        array_t { 1, "a" },
        object_t { { "x", 3 }, { "y", "z" } }
    ));

    EXPECT_STREQ("com.example.error 1, \"a\" (x=3, y=\"z\")", err.what());
    EXPECT_EQ(as_uri("com.example.error"), err.uri());
}

TEST(error_response, WhatOmitsEmptyKwargs) {
    error_response err(error_message_t(message_type::call, 1, as_uri("com.example.error"), array_t { 1, 2 }));
    EXPECT_STREQ("com.example.error 1, 2", err.what());
}

TEST(error_response, WhatOmitsEmptyArgs) {
    error_response empty(error_message_t(message_type::call, 1, as_uri("com.example.error")));
    EXPECT_STREQ("com.example.error", empty.what());

    error_response kwargs(error_message_t(
        message_type::call, 1, as_uri("com.example.error"), array_t(), object_t { { "x", 3 } }
    ));
    EXPECT_STREQ("com.example.error (x=3)", kwargs.what());
}

TEST(error_response, StreamIncludesDetails) {
    error_response err(error_message_t(
        message_type::call, 42, as_uri("com.example.error"),
        array_t { 1 },
        object_t(),
        object_t { { "trace", "abc" } }
    ));

    std::ostringstream stream;
    stream << err;
    EXPECT_EQ("error_response(ERROR[48, 42, {\"trace\": \"abc\"}, \"com.example.error\", [1]])", stream.str());
}

TEST(interrupt, CancelMode) {
    interrupt err(object_t { { "mode", "kill" } });

    ASSERT_TRUE(err.cancel_mode());
    EXPECT_EQ("kill", *err.cancel_mode());
    EXPECT_STREQ("interrupt (options = {\"mode\": \"kill\"})", err.what());
}

TEST(interrupt, CancelModeAbsent) {
    EXPECT_FALSE(interrupt(object_t()).cancel_mode());
    EXPECT_FALSE(interrupt(object_t { { "mode", 1 } }).cancel_mode());
}

TEST(interrupt, FromMessage) {
    auto err = make_interrupt(message_t(message_type::interrupt, array_t { 7u, object_t { { "mode", "skip" } } }));
    EXPECT_EQ("skip", err.cancel_mode().get());
}

TEST(invocation_error_t, WhatExcludesKwargs) {
    invocation_error_t err("com.example.bad_arg", array_t { 1, 2 }, object_t { { "x", 3 } });
    EXPECT_STREQ("com.example.bad_arg 1, 2", err.what());
}

TEST(invocation_error_t, WhatWithoutArgs) {
    EXPECT_STREQ("com.example.bad_arg", invocation_error_t("com.example.bad_arg").what());
    EXPECT_STREQ("com.example.bad_arg", invocation_error_t("com.example.bad_arg", array_t()).what());
}

TEST(invocation_error_t, WhatWritesStringArgsRaw) {
    invocation_error_t err("com.example.bad_arg", array_t { "value is too large" });
    EXPECT_STREQ("com.example.bad_arg value is too large", err.what());
}

TEST(invocation_error_t, StreamIncludesEverything) {
    invocation_error_t err("com.example.bad_arg", array_t { 1 }, object_t { { "x", 3 } }, object_t());

    std::ostringstream stream;
    stream << err;
    EXPECT_EQ("invocation_error(\"com.example.bad_arg\", [1], kwargs={\"x\": 3}, details={})", stream.str());
}

TEST(invocation_error_t, OptionalFieldsAbsentByDefault) {
    invocation_error_t err("com.example.bad_arg");

    EXPECT_FALSE(err.args());
    EXPECT_FALSE(err.kwargs());
    EXPECT_FALSE(err.details());
    EXPECT_EQ(error::invocation_failed, err.code());
}

TEST(invocation_error_t, SuppliedEmptyFieldStaysPresent) {
    invocation_error_t err("com.example.bad_arg", boost::none, object_t());

    EXPECT_FALSE(err.args());
    ASSERT_TRUE(err.kwargs());
    EXPECT_TRUE(err.kwargs()->empty());
}

TEST(invocation_error_t, ThrowsOnInvalidUri) {
    EXPECT_THROW(invocation_error_t("com..example"), std::system_error);
}

TEST(invocation_error_t, ToMessageOmitsAbsentFields) {
    EXPECT_EQ(
        message_t(message_type::error, array_t { 68u, 5u, object_t(), "com.example.bad_arg" }),
        invocation_error_t("com.example.bad_arg").to_message(5)
    );

    EXPECT_EQ(
        message_t(message_type::error, array_t { 68u, 5u, object_t(), "com.example.bad_arg", array_t { 1 } }),
        invocation_error_t("com.example.bad_arg", array_t { 1 }).to_message(5)
    );
}

TEST(invocation_error_t, ToMessageWritesArgsBeforeKwargs) {
    invocation_error_t err("com.example.bad_arg", boost::none, object_t { { "x", 3 } }, object_t { { "a", true } });

    EXPECT_EQ(
        message_t(message_type::error, array_t {
            68u, 5u, object_t { { "a", true } }, "com.example.bad_arg", array_t(), object_t { { "x", 3 } }
        }),
        err.to_message(5)
    );
}

TEST(invocation_error_t, Equality) {
    EXPECT_EQ(invocation_error_t("a.b", array_t { 1 }), invocation_error_t("a.b", array_t { 1 }));
    EXPECT_NE(invocation_error_t("a.b", array_t { 1 }), invocation_error_t("a.b", array_t { 2 }));
    EXPECT_NE(invocation_error_t("a.b"), invocation_error_t("a.b", array_t()));
}
