#include <stdexcept>

#include <gtest/gtest.h>

#include <wamp/failure.hpp>

using namespace wamp;

TEST(failure_t, ThrowsOnNullException) {
    EXPECT_THROW(failure_t(std::exception_ptr(nullptr)), std::invalid_argument);
}

TEST(failure_t, Current) {
    try {
        throw std::logic_error("broken");
    } catch (const std::logic_error&) {
        auto failure = failure_t::current();

        ASSERT_TRUE(failure.kind());
        EXPECT_EQ(std::type_index(typeid(std::logic_error)), *failure.kind());
        ASSERT_TRUE(failure.args());
        EXPECT_EQ(array_t { "broken" }, *failure.args());
        EXPECT_THROW(failure.rethrow(), std::logic_error);
    }
}

TEST(failure_t, KindIsDynamicType) {
    std::exception_ptr exception;
    try {
        throw std::out_of_range("index");
    } catch (const std::exception&) {
        exception = std::current_exception();
    }

    failure_t failure(exception);
    EXPECT_EQ(std::type_index(typeid(std::out_of_range)), *failure.kind());
    EXPECT_EQ(exception, failure.exception());
}

TEST(failure_t, EmptyWhatHasNoArgs) {
    auto failure = make_failure(std::runtime_error(""));
    EXPECT_TRUE(failure.kind());
    EXPECT_FALSE(failure.args());
}

TEST(failure_t, ForeignExceptionHasNoKind) {
    failure_t failure(std::make_exception_ptr(std::string("foreign")));

    EXPECT_FALSE(failure.kind());
    EXPECT_FALSE(failure.args());
    EXPECT_FALSE(failure.invocation_error());
    EXPECT_THROW(failure.rethrow(), std::string);
}

TEST(failure_t, NoAttachmentByDefault) {
    auto failure = make_failure(std::runtime_error("error"));

    EXPECT_FALSE(failure.attachment());
    EXPECT_FALSE(failure.invocation_error());
}

TEST(failure_t, InvocationErrorPointsIntoException) {
    auto failure = make_failure(invocation_error_t("com.example.bad_arg"));

    auto err = failure.invocation_error();
    ASSERT_TRUE(err);

    try {
        failure.rethrow();
    } catch (const invocation_error_t& thrown) {
        EXPECT_EQ(&thrown, err.get());
    }
}

TEST(failure_t, InvocationErrorOutlivesFailure) {
    std::shared_ptr<const invocation_error_t> err;

    {
        auto failure = make_failure(invocation_error_t("com.example.bad_arg", array_t { 1 }));
        err = failure.invocation_error();
    }

    ASSERT_TRUE(err);
    EXPECT_EQ(as_uri("com.example.bad_arg"), err->uri());
}

TEST(set_invocation_error, AttachesToOtherException) {
    auto failure = make_failure(std::runtime_error("error"));
    const invocation_error_t expected("com.example.attached", array_t { 1 }, object_t { { "x", 2 } });

    set_invocation_error(failure, expected);

    ASSERT_TRUE(failure.attachment());
    EXPECT_EQ(expected, *failure.attachment());

    // The exception itself is left untouched.
    EXPECT_EQ(std::type_index(typeid(std::runtime_error)), *failure.kind());
    EXPECT_THROW(failure.rethrow(), std::runtime_error);
}

TEST(set_invocation_error, AttachmentWithAbsentFieldsIsPresent) {
    auto failure = make_failure(std::runtime_error("error"));
    set_invocation_error(failure, invocation_error_t("com.example.attached"));

    ASSERT_TRUE(failure.attachment());
    EXPECT_FALSE(failure.attachment()->args());
}

TEST(set_invocation_error, LastAttachmentWins) {
    auto failure = make_failure(std::runtime_error("error"));

    set_invocation_error(failure, invocation_error_t("com.example.first"));
    set_invocation_error(failure, invocation_error_t("com.example.second"));

    EXPECT_EQ(as_uri("com.example.second"), failure.attachment()->uri());
}

TEST(set_invocation_error, CopiesShareAttachment) {
    auto failure = make_failure(std::runtime_error("error"));
    auto copy = failure;

    set_invocation_error(copy, invocation_error_t("com.example.attached"));

    ASSERT_TRUE(failure.attachment());
    EXPECT_EQ(copy.attachment().get(), failure.attachment().get());
}

TEST(set_invocation_error, OverwritesInvocationErrorInPlace) {
    auto failure = make_failure(invocation_error_t("com.example.initial"));
    const auto identity = failure.invocation_error().get();

    set_invocation_error(failure, invocation_error_t("com.example.first", array_t { 1 }));

    const invocation_error_t second("com.example.second", array_t { 2 }, object_t { { "x", 3 } }, object_t());
    set_invocation_error(failure, second);

    EXPECT_EQ(identity, failure.invocation_error().get());
    EXPECT_EQ(second, *failure.invocation_error());
    EXPECT_STREQ("com.example.second 2", failure.invocation_error()->what());
    EXPECT_FALSE(failure.attachment());

    try {
        failure.rethrow();
    } catch (const invocation_error_t& err) {
        EXPECT_EQ(identity, &err);
        EXPECT_EQ(as_uri("com.example.second"), err.uri());
    }
}

TEST(failure_t, CarriersOfSameExceptionShareAttachment) {
    const auto exception = std::make_exception_ptr(std::runtime_error("error"));

    failure_t first(exception);
    failure_t second(exception);

    set_invocation_error(first, invocation_error_t("com.example.attached"));

    ASSERT_TRUE(second.attachment());
    EXPECT_EQ(first.attachment().get(), second.attachment().get());
}

TEST(failure_t, AttachmentIsReleasedWithLastCarrier) {
    const auto exception = std::make_exception_ptr(std::runtime_error("error"));

    {
        failure_t failure(exception);
        set_invocation_error(failure, invocation_error_t("com.example.attached"));
    }

    failure_t failure(exception);
    EXPECT_FALSE(failure.attachment());
}

TEST(failure_t, CurrentSharesAttachmentOfRethrownException) {
    auto failure = make_failure(std::runtime_error("error"));
    set_invocation_error(failure, invocation_error_t("com.example.attached"));

    try {
        failure.rethrow();
    } catch (const std::runtime_error&) {
        auto caught = failure_t::current();

        ASSERT_TRUE(caught.attachment());
        EXPECT_EQ(failure.attachment().get(), caught.attachment().get());
    }
}

TEST(failure_t, ThrownFailureIsUnwrapped) {
    auto failure = make_failure(std::runtime_error("error"));

    try {
        throw failure;
    } catch (const failure_t&) {
        auto caught = failure_t::current();

        EXPECT_EQ(failure.exception(), caught.exception());
        EXPECT_EQ(std::type_index(typeid(std::runtime_error)), *caught.kind());
        EXPECT_THROW(caught.rethrow(), std::runtime_error);
    }
}

TEST(failure_t, ForeignExceptionsAreNotShared) {
    const auto exception = std::make_exception_ptr(42);

    failure_t first(exception);
    failure_t second(exception);

    set_invocation_error(first, invocation_error_t("com.example.attached"));
    EXPECT_FALSE(second.attachment());
}
