#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <wamp/registry.hpp>

using namespace wamp;

using ::testing::Return;

namespace {

/// Application exception, which knows how to be constructed from the ERROR message.
class bad_argument : public std::runtime_error {
public:
    error_message_t message;

    explicit bad_argument(const error_message_t& message) :
        std::runtime_error("bad argument"),
        message(message)
    {}
};

class not_found : public std::runtime_error {
public:
    explicit not_found(const std::string& what) :
        std::runtime_error(what)
    {}
};

error_message_t
make_message(const std::string& uri) {
    return error_message_t(message_type::call, 42, as_uri(uri), array_t { 1, "a" }, object_t { { "k", 2 } });
}

} // namespace

TEST(registry_t, ErrorToExceptionReturnsFactoryResult) {
    registry_t registry;

    const auto message = make_message("com.example.bad_arg");
    const auto expected = std::make_exception_ptr(std::logic_error("expected"));

    ::testing::MockFunction<std::exception_ptr(const error_message_t&)> factory;
    EXPECT_CALL(factory, Call(message))
        .WillOnce(Return(expected));

    registry.register_error_response("com.example.bad_arg", factory.AsStdFunction());

    EXPECT_EQ(expected, registry.error_to_exception(message));
}

TEST(registry_t, ErrorToExceptionFallsBackToErrorResponse) {
    registry_t registry;
    registry.register_error_response<bad_argument>("com.example.bad_arg");

    const auto message = make_message("com.example.unknown");

    std::exception_ptr result;
    EXPECT_NO_THROW(result = registry.error_to_exception(message));

    try {
        std::rethrow_exception(result);
    } catch (const error_response& err) {
        EXPECT_EQ(message, err.message());
        EXPECT_EQ(error::error_response, err.code());
    }
}

TEST(registry_t, ErrorToExceptionFallsBackOnNullFactoryResult) {
    registry_t registry;
    registry.register_error_response("com.example.null", [](const error_message_t&) -> std::exception_ptr {
        return nullptr;
    });

    EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.example.null"))),
        error_response);
}

TEST(registry_t, RegisterErrorResponseTemplate) {
    registry_t registry;
    registry.register_error_response<bad_argument>("com.example.bad_arg");

    const auto message = make_message("com.example.bad_arg");

    try {
        std::rethrow_exception(registry.error_to_exception(message));
        FAIL();
    } catch (const bad_argument& err) {
        EXPECT_EQ(message, err.message);
    }
}

TEST(registry_t, RegisterErrorResponseOverwrites) {
    registry_t registry;
    registry.register_error_response<bad_argument>("com.example.error");
    registry.register_error_response("com.example.error", [](const error_message_t&) {
        return std::make_exception_ptr(not_found("overwritten"));
    });

    EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.example.error"))),
        not_found);
}

TEST(registry_t, RegisterErrorResponseThrowsOnInvalidUri) {
    registry_t registry;

    try {
        registry.register_error_response<bad_argument>("com..bad");
        FAIL();
    } catch (const std::system_error& err) {
        EXPECT_EQ(error::empty_component, err.code());
        EXPECT_NE(std::string::npos, std::string(err.what()).find("com..bad"));
    }
}

TEST(registry_t, RegisterErrorResponseThrowsOnEmptyFactory) {
    registry_t registry;

    try {
        registry.register_error_response("com.example.bad_arg", registry_t::factory_type());
        FAIL();
    } catch (const std::system_error& err) {
        EXPECT_EQ(error::invalid_factory, err.code());
    }
}

TEST(registry_t, GetExceptionFactoryThrowsLookupError) {
    registry_t registry;

    try {
        registry.get_exception_factory(as_uri("com.example.unknown"));
        FAIL();
    } catch (const lookup_error& err) {
        EXPECT_EQ(error::uri_not_found, err.code());
    }
}

TEST(registry_t, PrefixPolicy) {
    registry_t registry(match_policy::prefix);
    registry.register_error_response<bad_argument>("com.example");

    EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.example.bad_arg"))),
        bad_argument);
    EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.examples"))),
        error_response);
}

TEST(registry_t, GetExceptionUri) {
    registry_t registry;
    registry.register_exception_uri<not_found>("com.example.not_found");

    EXPECT_EQ(as_uri("com.example.not_found"), registry.get_exception_uri(typeid(not_found)));
}

TEST(registry_t, GetExceptionUriThrowsLookupError) {
    registry_t registry;

    try {
        registry.get_exception_uri(typeid(not_found));
        FAIL();
    } catch (const lookup_error& err) {
        EXPECT_EQ(error::kind_not_found, err.code());
    }
}

TEST(registry_t, GetExceptionUriIsExact) {
    registry_t registry;
    registry.register_exception_uri<std::runtime_error>("com.example.runtime");

    EXPECT_THROW(registry.get_exception_uri(typeid(not_found)), lookup_error);
}

TEST(registry_t, RegisterErrorBothDirections) {
    registry_t registry;
    registry.register_error<bad_argument>("com.example.bad_arg");

    EXPECT_EQ(as_uri("com.example.bad_arg"), registry.get_exception_uri(typeid(bad_argument)));
    EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.example.bad_arg"))),
        bad_argument);
}

TEST(registry_t, ExceptionToInvocationErrorPreservesIdentity) {
    registry_t registry;
    auto failure = make_failure(invocation_error_t("com.example.bad_arg", array_t { 1 }));

    auto result = registry.exception_to_invocation_error(failure);
    EXPECT_EQ(failure.invocation_error().get(), result.get());

    try {
        failure.rethrow();
    } catch (const invocation_error_t& err) {
        EXPECT_EQ(&err, result.get());
    }
}

TEST(registry_t, ExceptionToInvocationErrorReturnsAttachment) {
    registry_t registry;
    registry.register_exception_uri<not_found>("com.example.not_found");

    auto failure = make_failure(not_found("missing"));
    set_invocation_error(failure, invocation_error_t("com.example.attached", boost::none, object_t { { "x", 1 } }));

    auto result = registry.exception_to_invocation_error(failure);
    EXPECT_EQ(failure.attachment().get(), result.get());
    EXPECT_EQ(invocation_error_t("com.example.attached", boost::none, object_t { { "x", 1 } }), *result);
}

TEST(registry_t, ExceptionToInvocationErrorFindsAttachmentAfterRethrow) {
    registry_t registry;

    auto failure = make_failure(std::runtime_error("bad"));
    set_invocation_error(failure, invocation_error_t("com.example.attached", boost::none, object_t { { "x", 1 } }));

    std::shared_ptr<const invocation_error_t> result;
    try {
        failure.rethrow();
    } catch (...) {
        result = registry.exception_to_invocation_error(failure_t::current());
    }

    ASSERT_TRUE(result);
    EXPECT_EQ(invocation_error_t("com.example.attached", boost::none, object_t { { "x", 1 } }), *result);
}

TEST(registry_t, ExceptionToInvocationErrorFindsAttachmentOfThrownFailure) {
    registry_t registry;

    auto handler = [] {
        try {
            throw std::runtime_error("bad");
        } catch (const std::exception&) {
            auto failure = failure_t::current();
            set_invocation_error(failure, invocation_error_t("com.example.attached", array_t { "bad" }));
            throw failure;
        }
    };

    std::shared_ptr<const invocation_error_t> result;
    try {
        handler();
    } catch (...) {
        result = registry.exception_to_invocation_error(failure_t::current());
    }

    ASSERT_TRUE(result);
    EXPECT_EQ(invocation_error_t("com.example.attached", array_t { "bad" }), *result);
}

TEST(registry_t, ExceptionToInvocationErrorUsesRegisteredUri) {
    registry_t registry;
    registry.register_exception_uri<not_found>("com.example.not_found");

    auto result = registry.exception_to_invocation_error(make_failure(not_found("missing")));

    EXPECT_EQ(invocation_error_t("com.example.not_found", array_t { "missing" }), *result);
    EXPECT_FALSE(result->kwargs());
    EXPECT_FALSE(result->details());
}

TEST(registry_t, ExceptionToInvocationErrorFallsBackToRuntimeError) {
    registry_t registry;

    auto result = registry.exception_to_invocation_error(make_failure(std::out_of_range("index 5")));

    EXPECT_EQ(as_uri(uris::runtime_error), result->uri());
    EXPECT_EQ(array_t { "index 5" }, *result->args());
    EXPECT_STREQ("wamp.error.runtime_error index 5", result->what());
}

TEST(registry_t, ExceptionToInvocationErrorFallsBackForForeignException) {
    registry_t registry;

    auto result = registry.exception_to_invocation_error(failure_t(std::make_exception_ptr(42)));

    EXPECT_EQ(as_uri(uris::runtime_error), result->uri());
    EXPECT_FALSE(result->args());
}

TEST(registry_t, ConcurrentRegistrationAndLookup) {
    registry_t registry;
    registry.register_error_response<bad_argument>("com.example.stable");

    std::thread writer([&registry] {
        for (int i = 0; i < 1000; ++i) {
            registry.register_error_response<bad_argument>("com.example.e" + std::to_string(i));
            registry.register_exception_uri<not_found>("com.example.e" + std::to_string(i));
        }
    });

    for (int i = 0; i < 1000; ++i) {
        EXPECT_THROW(std::rethrow_exception(registry.error_to_exception(make_message("com.example.stable"))),
            bad_argument);
    }

    writer.join();

    EXPECT_EQ(as_uri("com.example.e999"), registry.get_exception_uri(typeid(not_found)));
}

TEST(registry, ProcessWideInstance) {
    register_error_response("com.example.global", [](const error_message_t& message) {
        return std::make_exception_ptr(bad_argument(message));
    });
    register_exception_uri<not_found>("com.example.global_not_found");

    EXPECT_EQ(&registry_t::instance(), &registry_t::instance());
    EXPECT_THROW(std::rethrow_exception(error_to_exception(make_message("com.example.global"))), bad_argument);
    EXPECT_EQ(as_uri("com.example.global_not_found"), get_exception_uri(typeid(not_found)));

    auto result = exception_to_invocation_error(make_failure(not_found("global")));
    EXPECT_EQ(as_uri("com.example.global_not_found"), result->uri());
}
