#include <gtest/gtest.h>

#include <msgpack.hpp>

#include <wamp/decoder.hpp>
#include <wamp/encoder.hpp>
#include <wamp/error.hpp>

using namespace wamp;

namespace {

std::string
pack(const msgpack::sbuffer& buffer) {
    return std::string(buffer.data(), buffer.size());
}

} // namespace

TEST(encoder_t, Encode) {
    const auto data = encoder_t().encode(
        message_t(message_type::error, array_t { 68u, 5u, object_t(), "a.b" })
    );

    msgpack::sbuffer expected;
    msgpack::packer<msgpack::sbuffer> packer(expected);
    packer.pack_array(5);
    packer.pack_uint64(8);
    packer.pack_uint64(68);
    packer.pack_uint64(5);
    packer.pack_map(0);
    packer.pack_str(3);
    packer.pack_str_body("a.b", 3);

    EXPECT_EQ(pack(expected), data);
}

TEST(decoder_t, Decode) {
    const message_t message(message_type::error, array_t {
        48u, 42u, object_t { { "a", true } }, "com.example.error", array_t { -1, 1.5, "x", value_t() }
    });
    const auto data = encoder_t().encode(message);

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    EXPECT_EQ(data.size(), decoder.decode(data.data(), data.size(), result, ec));
    EXPECT_FALSE(ec);
    ASSERT_TRUE(result);
    EXPECT_EQ(message, *result);
}

TEST(decoder_t, DecodeSignedValuesAsEqual) {
    const message_t message(message_type::event, array_t { 1u, 2u, object_t(), array_t { 1, 2 } });
    const auto data = encoder_t().encode(message);

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    decoder.decode(data.data(), data.size(), result, ec);
    ASSERT_TRUE(result);
    EXPECT_EQ(message, *result);
}

TEST(decoder_t, DecodeMultipleFrames) {
    encoder_t encoder;
    const auto data =
        encoder.encode(message_t(message_type::interrupt, array_t { 1u, object_t() })) +
        encoder.encode(message_t(message_type::interrupt, array_t { 2u, object_t() }));

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    const auto consumed = decoder.decode(data.data(), data.size(), result, ec);
    EXPECT_FALSE(ec);
    ASSERT_TRUE(result);
    EXPECT_EQ(1u, interrupt_message_t::from(*result).request_id);

    decoder.decode(data.data() + consumed, data.size() - consumed, result, ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(2u, interrupt_message_t::from(*result).request_id);
}

TEST(decoder_t, InsufficientBytes) {
    const auto data = encoder_t().encode(message_t(message_type::interrupt, array_t { 1u, object_t() }));

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    EXPECT_EQ(0u, decoder.decode(data.data(), data.size() - 1, result, ec));
    EXPECT_EQ(error::insufficient_bytes, ec);
    EXPECT_FALSE(result);
}

TEST(decoder_t, ParseError) {
    // 0xc1 is never used in MessagePack.
    const char data[] = { '\xc1' };

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    decoder.decode(data, sizeof(data), result, ec);
    EXPECT_EQ(error::parse_error, ec);
    EXPECT_FALSE(result);
}

TEST(decoder_t, FrameFormatErrorOnNonArray) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);
    packer.pack_map(0);

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    decoder.decode(buffer.data(), buffer.size(), result, ec);
    EXPECT_EQ(error::frame_format_error, ec);
    EXPECT_FALSE(result);
}

TEST(decoder_t, FrameFormatErrorOnEmptyArray) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);
    packer.pack_array(0);

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    decoder.decode(buffer.data(), buffer.size(), result, ec);
    EXPECT_EQ(error::frame_format_error, ec);
}

TEST(decoder_t, FrameFormatErrorOnNonStringKey) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);
    packer.pack_array(3);
    packer.pack_uint64(69);
    packer.pack_uint64(1);
    packer.pack_map(1);
    packer.pack_uint64(1);
    packer.pack_uint64(2);

    decoder_t decoder;
    boost::optional<message_t> result;
    std::error_code ec;

    decoder.decode(buffer.data(), buffer.size(), result, ec);
    EXPECT_EQ(error::frame_format_error, ec);
    EXPECT_FALSE(result);
}
