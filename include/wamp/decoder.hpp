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

#pragma once

#include <stddef.h>
#include <system_error>

#include <boost/optional.hpp>

#include <msgpack.hpp>

#include "wamp/message.hpp"

namespace wamp {

/// The decoder represents streaming MessagePack decoding of WAMP frames.
///
/// Decoding never throws, all failures are reported through the error code given.
struct decoder_t {
    msgpack::zone zone;

    /// Decodes the first frame in the buffer.
    ///
    /// \returns the number of bytes consumed. The message is set only when the error code is
    /// cleared.
    size_t decode(const char* data, size_t size, boost::optional<message_t>& message, std::error_code& ec);
};

} // namespace wamp
