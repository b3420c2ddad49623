/*
    Copyright (c) 2015 Evgeny Safronov <division494@gmail.com>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.
    This file is part of Cocaine.
    Cocaine is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.
    Cocaine is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.
    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#include "wamp/decoder.hpp"

#include <stdexcept>

#include "wamp/error.hpp"

#include "wamp/detail/log.hpp"

using namespace wamp;

namespace {

/// The exception is thrown during conversion when the frame contains something, that cannot be
/// represented as a WAMP value.
struct unsupported_type : public std::runtime_error {
    unsupported_type() :
        std::runtime_error("unsupported MessagePack type")
    {}
};

value_t
convert(const msgpack::object& object) {
    switch (object.type) {
    case msgpack::type::NIL:
        return value_t();
    case msgpack::type::BOOLEAN:
        return value_t(object.via.boolean);
    case msgpack::type::POSITIVE_INTEGER:
        return value_t(object.via.u64);
    case msgpack::type::NEGATIVE_INTEGER:
        return value_t(object.via.i64);
    case msgpack::type::STR:
        return value_t(std::string(object.via.str.ptr, object.via.str.size));
    case msgpack::type::BIN:
        return value_t(std::string(object.via.bin.ptr, object.via.bin.size));
    case msgpack::type::ARRAY: {
        array_t result;
        result.reserve(object.via.array.size);
        for (uint32_t id = 0; id < object.via.array.size; ++id) {
            result.push_back(convert(object.via.array.ptr[id]));
        }

        return value_t(std::move(result));
    }
    case msgpack::type::MAP: {
        object_t result;
        for (uint32_t id = 0; id < object.via.map.size; ++id) {
            const msgpack::object_kv& pair = object.via.map.ptr[id];

            if (pair.key.type != msgpack::type::STR) {
                throw unsupported_type();
            }

            result[std::string(pair.key.via.str.ptr, pair.key.via.str.size)] = convert(pair.val);
        }

        return value_t(std::move(result));
    }
    case msgpack::type::EXT:
        throw unsupported_type();
    default:
        // Floating point types are named differently across msgpack versions.
        return value_t(object.as<double>());
    }
}

} // namespace

size_t decoder_t::decode(const char* data, size_t size, boost::optional<message_t>& message, std::error_code& ec) {
    WAMP_CTX("D");

    size_t offset = 0;
    ec.clear();

    msgpack::object object;
    msgpack::unpack_return rv = msgpack::unpack(data, size, &offset, &zone, &object);

    if(rv == msgpack::UNPACK_SUCCESS || rv == msgpack::UNPACK_EXTRA_BYTES) {
        bool malformed = false;
        malformed = malformed || object.type != msgpack::type::ARRAY;
        malformed = malformed || object.via.array.size < 1;
        malformed = malformed || object.via.array.ptr[0].type != msgpack::type::POSITIVE_INTEGER;

        if (!malformed) {
            try {
                array_t fields;
                fields.reserve(object.via.array.size - 1);
                for (uint32_t id = 1; id < object.via.array.size; ++id) {
                    fields.push_back(convert(object.via.array.ptr[id]));
                }

                message = message_t(static_cast<message_type>(object.via.array.ptr[0].via.u64), std::move(fields));
            } catch (const unsupported_type& err) {
                WAMP_DBG("failed to convert frame: %s", err.what());
                malformed = true;
            }
        }

        if(malformed) {
            ec = error::frame_format_error;
        }
    } else if(rv == msgpack::UNPACK_CONTINUE) {
        // Incomplete frames are decoded from scratch when more bytes arrive.
        offset = 0;
        ec = error::insufficient_bytes;
    } else if(rv == msgpack::UNPACK_PARSE_ERROR) {
        ec = error::parse_error;
    }

    zone.clear();

    WAMP_DBG("decoded %lu of %lu bytes: %s", offset, size, WAMP_EC(ec));

    return offset;
}
