#include <sstream>

#include <gtest/gtest.h>

#include <wamp/error.hpp>
#include <wamp/message.hpp>

using namespace wamp;

TEST(message_type, Name) {
    EXPECT_STREQ("ERROR", name(message_type::error));
    EXPECT_STREQ("REGISTER", name(message_type::enroll));
    EXPECT_STREQ("UNKNOWN", name(static_cast<message_type>(100)));
}

TEST(message_t, Stream) {
    std::ostringstream stream;
    stream << message_t(message_type::goodbye, array_t { object_t(), "wamp.close.goodbye_and_out" });
    EXPECT_EQ("GOODBYE[{}, \"wamp.close.goodbye_and_out\"]", stream.str());
}

TEST(error_message_t, From) {
    const message_t message(message_type::error, array_t {
        48u, 42u, object_t { { "a", 1 } }, "com.example.error", array_t { "x" }, object_t { { "k", 2 } }
    });

    const auto result = error_message_t::from(message);

    EXPECT_EQ(message_type::call, result.request_type);
    EXPECT_EQ(42u, result.request_id);
    EXPECT_EQ((object_t { { "a", 1 } }), result.details);
    EXPECT_EQ(as_uri("com.example.error"), result.error);
    EXPECT_EQ(array_t { "x" }, result.args);
    EXPECT_EQ((object_t { { "k", 2 } }), result.kwargs);
}

TEST(error_message_t, FromWithoutArguments) {
    const auto result = error_message_t::from(
        message_t(message_type::error, array_t { 48u, 42u, object_t(), "com.example.error" })
    );

    EXPECT_TRUE(result.args.empty());
    EXPECT_TRUE(result.kwargs.empty());
}

TEST(error_message_t, FromThrowsOnOtherType) {
    const message_t message(message_type::result, array_t { 42u, object_t() });

    try {
        error_message_t::from(message);
        FAIL();
    } catch (const unexpected_message_error& err) {
        EXPECT_EQ(message, err.received());
        EXPECT_EQ(message_type::error, err.expected());
    }
}

TEST(error_message_t, FromThrowsOnMalformed) {
    // Too few fields.
    EXPECT_THROW(error_message_t::from(message_t(message_type::error, array_t { 48u, 42u, object_t() })),
        invalid_message);

    // Details is not a dictionary.
    EXPECT_THROW(error_message_t::from(message_t(message_type::error, array_t { 48u, 42u, "x", "a.b" })),
        invalid_message);

    // Error is not a valid URI.
    EXPECT_THROW(error_message_t::from(message_t(message_type::error, array_t { 48u, 42u, object_t(), "a..b" })),
        invalid_message);

    // Negative request id.
    EXPECT_THROW(error_message_t::from(message_t(message_type::error, array_t { 48u, -1, object_t(), "a.b" })),
        invalid_message);

    // Arguments is not a list.
    EXPECT_THROW(
        error_message_t::from(message_t(message_type::error, array_t { 48u, 42u, object_t(), "a.b", object_t() })),
        invalid_message
    );
}

TEST(error_message_t, ToMessageOmitsTrailingEmptyArguments) {
    error_message_t message(message_type::call, 42, as_uri("com.example.error"));
    EXPECT_EQ(message_t(message_type::error, array_t { 48u, 42u, object_t(), "com.example.error" }),
        message.to_message());

    message.kwargs = object_t { { "k", 1 } };
    EXPECT_EQ(
        message_t(message_type::error, array_t { 48u, 42u, object_t(), "com.example.error", array_t(), object_t { { "k", 1 } } }),
        message.to_message()
    );
}

TEST(error_message_t, ToMessageIsInverseOfFrom) {
    error_message_t message(message_type::call, 42, as_uri("com.example.error"), array_t { 1, "a" });
    EXPECT_EQ(message, error_message_t::from(message.to_message()));
}

TEST(abort_message_t, From) {
    const auto result = abort_message_t::from(
        message_t(message_type::abort, array_t { object_t { { "message", "bye" } }, "wamp.error.no_such_realm" })
    );

    EXPECT_EQ(as_uri(uris::no_such_realm), result.reason);
    EXPECT_EQ(1u, result.details.size());
}

TEST(interrupt_message_t, From) {
    const auto result = interrupt_message_t::from(
        message_t(message_type::interrupt, array_t { 7u, object_t { { "mode", "kill" } } })
    );

    EXPECT_EQ(7u, result.request_id);
    EXPECT_EQ("kill", result.options.at("mode").as_string());
}

TEST(interrupt_message_t, ToMessage) {
    EXPECT_EQ(message_t(message_type::interrupt, array_t { 7u, object_t() }), interrupt_message_t(7).to_message());
}

TEST(event_message_t, From) {
    const auto result = event_message_t::from(
        message_t(message_type::event, array_t { 1u, 2u, object_t(), array_t { "hello" } })
    );

    EXPECT_EQ(1u, result.subscription_id);
    EXPECT_EQ(2u, result.publication_id);
    EXPECT_EQ(array_t { "hello" }, result.args);
    EXPECT_TRUE(result.kwargs.empty());
}

TEST(event_message_t, FromThrowsOnTooManyFields) {
    EXPECT_THROW(
        event_message_t::from(message_t(message_type::event, array_t { 1u, 2u, object_t(), array_t(), object_t(), 1 })),
        invalid_message
    );
}
