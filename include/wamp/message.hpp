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

#include <cstdint>
#include <iosfwd>
#include <string>

#include "wamp/uri.hpp"
#include "wamp/value.hpp"

namespace wamp {

/// WAMP message type codes.
enum class message_type : std::uint64_t {
    hello        = 1,
    welcome      = 2,
    abort        = 3,
    challenge    = 4,
    authenticate = 5,
    goodbye      = 6,
    error        = 8,
    publish      = 16,
    published    = 17,
    subscribe    = 32,
    subscribed   = 33,
    unsubscribe  = 34,
    unsubscribed = 35,
    event        = 36,
    call         = 48,
    cancel       = 49,
    result       = 50,
    enroll       = 64,
    registered   = 65,
    unregister   = 66,
    unregistered = 67,
    invocation   = 68,
    interrupt    = 69,
    yield        = 70
};

/// Returns the protocol name of the given message type, for example "ERROR", or "UNKNOWN".
const char*
name(message_type type) noexcept;

std::ostream&
operator<<(std::ostream& stream, message_type type);

/// The message class represents a generic decoded WAMP frame: the message type code followed by
/// the rest of the array elements.
struct message_t {
    message_type type;
    array_t fields;

    message_t(message_type type, array_t fields);

    bool operator==(const message_t& other) const;
};

/// Writes the message as `NAME[field, ...]`.
std::ostream&
operator<<(std::ostream& stream, const message_t& message);

/// ERROR message: `[ERROR, REQUEST.Type, REQUEST.Request, Details, Error, Arguments?, ArgumentsKw?]`.
///
/// Absent arguments are represented by empty containers.
struct error_message_t {
    message_type request_type;
    std::uint64_t request_id;
    object_t details;
    uri_t error;
    array_t args;
    object_t kwargs;

    error_message_t(message_type request_type,
                    std::uint64_t request_id,
                    uri_t error,
                    array_t args = array_t(),
                    object_t kwargs = object_t(),
                    object_t details = object_t());

    /// Extracts the ERROR message from the generic one.
    ///
    /// \throw unexpected_message_error if the message has another type.
    /// \throw invalid_message if the message fields are malformed.
    static
    error_message_t
    from(const message_t& message);

    /// Converts back to the generic form, omitting trailing empty arguments.
    message_t
    to_message() const;

    bool operator==(const error_message_t& other) const;
};

/// ABORT message: `[ABORT, Details, Reason]`.
struct abort_message_t {
    object_t details;
    uri_t reason;

    abort_message_t(uri_t reason, object_t details = object_t());

    static
    abort_message_t
    from(const message_t& message);

    message_t
    to_message() const;
};

/// INTERRUPT message: `[INTERRUPT, INVOCATION.Request, Options]`.
struct interrupt_message_t {
    std::uint64_t request_id;
    object_t options;

    interrupt_message_t(std::uint64_t request_id, object_t options = object_t());

    static
    interrupt_message_t
    from(const message_t& message);

    message_t
    to_message() const;
};

/// EVENT message: `[EVENT, SUBSCRIBED.Subscription, PUBLISHED.Publication, Details, Arguments?,
/// ArgumentsKw?]`.
struct event_message_t {
    std::uint64_t subscription_id;
    std::uint64_t publication_id;
    object_t details;
    array_t args;
    object_t kwargs;

    event_message_t(std::uint64_t subscription_id,
                    std::uint64_t publication_id,
                    array_t args = array_t(),
                    object_t kwargs = object_t(),
                    object_t details = object_t());

    static
    event_message_t
    from(const message_t& message);

    message_t
    to_message() const;
};

} // namespace wamp
