#include <chrono>
#include <future>
#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <wamp/event.hpp>

using namespace wamp;

using ::testing::Return;

namespace {

class client_mock {
public:
    MOCK_METHOD1(unsubscribe, std::shared_future<void>(const uri_t&));
};

std::shared_future<void>
make_ready_future() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future().share();
}

} // namespace

TEST(subscription_event, Constructor) {
    auto client = std::make_shared<client_mock>();
    const event_message_t message(1, 2, array_t { "hello" }, object_t { { "k", 1 } }, object_t { { "publisher", 7u } });

    subscription_event<client_mock> event(client, message, as_uri("com.example.topic"));

    EXPECT_EQ(client, event.client());
    EXPECT_EQ(2u, event.publication_id());
    EXPECT_EQ(as_uri("com.example.topic"), event.subscribed_topic());
    EXPECT_EQ(array_t { "hello" }, event.args());
    EXPECT_EQ((object_t { { "k", 1 } }), event.kwargs());
    EXPECT_EQ((object_t { { "publisher", 7u } }), event.details());
}

TEST(subscription_event, Unsubscribe) {
    auto client = std::make_shared<client_mock>();
    subscription_event<client_mock> event(client, event_message_t(1, 2), as_uri("com.example.topic"));

    EXPECT_CALL(*client, unsubscribe(as_uri("com.example.topic")))
        .WillOnce(Return(make_ready_future()));

    auto future = event.unsubscribe();
    EXPECT_EQ(std::future_status::ready, future.wait_for(std::chrono::seconds(0)));
    EXPECT_NO_THROW(future.get());
}
