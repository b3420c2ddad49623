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

#include "wamp/encoder.hpp"

#include <msgpack.hpp>

#include "wamp/detail/log.hpp"

using namespace wamp;

namespace {

template<class Stream>
struct packer_t : public boost::static_visitor<> {
    msgpack::packer<Stream>& packer;

    explicit packer_t(msgpack::packer<Stream>& packer) :
        packer(packer)
    {}

    void operator()(const value_t::null_t&) const {
        packer.pack_nil();
    }

    void operator()(bool value) const {
        if (value) {
            packer.pack_true();
        } else {
            packer.pack_false();
        }
    }

    void operator()(std::int64_t value) const {
        packer.pack_int64(value);
    }

    void operator()(std::uint64_t value) const {
        packer.pack_uint64(value);
    }

    void operator()(double value) const {
        packer.pack_double(value);
    }

    void operator()(const std::string& value) const {
        packer.pack_str(static_cast<uint32_t>(value.size()));
        packer.pack_str_body(value.data(), static_cast<uint32_t>(value.size()));
    }

    void operator()(const array_t& value) const {
        packer.pack_array(static_cast<uint32_t>(value.size()));
        for (auto it = value.begin(); it != value.end(); ++it) {
            boost::apply_visitor(*this, it->get());
        }
    }

    void operator()(const object_t& value) const {
        packer.pack_map(static_cast<uint32_t>(value.size()));
        for (auto it = value.begin(); it != value.end(); ++it) {
            (*this)(it->first);
            boost::apply_visitor(*this, it->second.get());
        }
    }
};

} // namespace

std::string encoder_t::encode(const message_t& message) const {
    WAMP_CTX("E");

    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);

    packer.pack_array(static_cast<uint32_t>(message.fields.size() + 1));
    packer.pack_uint64(static_cast<std::uint64_t>(message.type));

    const packer_t<msgpack::sbuffer> visitor(packer);
    for (auto it = message.fields.begin(); it != message.fields.end(); ++it) {
        boost::apply_visitor(visitor, it->get());
    }

    WAMP_DBG("encoded %s message into %lu bytes", name(message.type), buffer.size());

    return std::string(buffer.data(), buffer.size());
}
