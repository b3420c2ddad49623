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

#include "wamp/message.hpp"

#include <ostream>

#include <boost/format.hpp>

#include "wamp/error.hpp"

using namespace wamp;

namespace {

void
expect(const message_t& message, message_type type, std::size_t min, std::size_t max) {
    if (message.type != type) {
        throw unexpected_message_error(message, type);
    }

    const auto size = message.fields.size();
    if (size < min || size > max) {
        throw invalid_message(boost::str(
            boost::format("%s message must have from %d to %d fields, but %d given")
                % name(type) % min % max % size
        ));
    }
}

std::uint64_t
as_id(const message_t& message, std::size_t id, const char* field) {
    const value_t& value = message.fields[id];

    if (value.is_uint()) {
        return value.as_uint();
    }

    if (value.is_int() && value.as_int() >= 0) {
        return static_cast<std::uint64_t>(value.as_int());
    }

    throw invalid_message(boost::str(
        boost::format("%s message field '%s' must be an unsigned integer") % name(message.type) % field
    ));
}

const object_t&
as_object(const message_t& message, std::size_t id, const char* field) {
    const value_t& value = message.fields[id];

    if (!value.is_object()) {
        throw invalid_message(boost::str(
            boost::format("%s message field '%s' must be a dictionary") % name(message.type) % field
        ));
    }

    return value.as_object();
}

const array_t&
as_array(const message_t& message, std::size_t id, const char* field) {
    const value_t& value = message.fields[id];

    if (!value.is_array()) {
        throw invalid_message(boost::str(
            boost::format("%s message field '%s' must be a list") % name(message.type) % field
        ));
    }

    return value.as_array();
}

uri_t
parse_uri(const message_t& message, std::size_t id, const char* field) {
    const value_t& value = message.fields[id];

    if (!value.is_string()) {
        throw invalid_message(boost::str(
            boost::format("%s message field '%s' must be an URI") % name(message.type) % field
        ));
    }

    try {
        return wamp::as_uri(value.as_string());
    } catch (const std::system_error& err) {
        throw invalid_message(boost::str(
            boost::format("%s message field '%s' is not a valid URI: %s")
                % name(message.type) % field % err.what()
        ));
    }
}

/// Appends trailing positional and keyword arguments, omitting empty ones.
void
append(array_t& fields, const array_t& args, const object_t& kwargs) {
    if (!args.empty() || !kwargs.empty()) {
        fields.push_back(args);
    }

    if (!kwargs.empty()) {
        fields.push_back(kwargs);
    }
}

} // namespace

const char*
wamp::name(message_type type) noexcept {
    switch (type) {
    case message_type::hello:
        return "HELLO";
    case message_type::welcome:
        return "WELCOME";
    case message_type::abort:
        return "ABORT";
    case message_type::challenge:
        return "CHALLENGE";
    case message_type::authenticate:
        return "AUTHENTICATE";
    case message_type::goodbye:
        return "GOODBYE";
    case message_type::error:
        return "ERROR";
    case message_type::publish:
        return "PUBLISH";
    case message_type::published:
        return "PUBLISHED";
    case message_type::subscribe:
        return "SUBSCRIBE";
    case message_type::subscribed:
        return "SUBSCRIBED";
    case message_type::unsubscribe:
        return "UNSUBSCRIBE";
    case message_type::unsubscribed:
        return "UNSUBSCRIBED";
    case message_type::event:
        return "EVENT";
    case message_type::call:
        return "CALL";
    case message_type::cancel:
        return "CANCEL";
    case message_type::result:
        return "RESULT";
    case message_type::enroll:
        return "REGISTER";
    case message_type::registered:
        return "REGISTERED";
    case message_type::unregister:
        return "UNREGISTER";
    case message_type::unregistered:
        return "UNREGISTERED";
    case message_type::invocation:
        return "INVOCATION";
    case message_type::interrupt:
        return "INTERRUPT";
    case message_type::yield:
        return "YIELD";
    default:
        return "UNKNOWN";
    }
}

std::ostream&
wamp::operator<<(std::ostream& stream, message_type type) {
    return stream << name(type);
}

message_t::message_t(message_type type, array_t fields) :
    type(type),
    fields(std::move(fields))
{}

bool message_t::operator==(const message_t& other) const {
    return type == other.type && fields == other.fields;
}

std::ostream&
wamp::operator<<(std::ostream& stream, const message_t& message) {
    stream << name(message.type) << '[';
    for (auto it = message.fields.begin(); it != message.fields.end(); ++it) {
        if (it != message.fields.begin()) {
            stream << ", ";
        }

        stream << *it;
    }

    return stream << ']';
}

error_message_t::error_message_t(message_type request_type,
                                 std::uint64_t request_id,
                                 uri_t error,
                                 array_t args,
                                 object_t kwargs,
                                 object_t details) :
    request_type(request_type),
    request_id(request_id),
    details(std::move(details)),
    error(std::move(error)),
    args(std::move(args)),
    kwargs(std::move(kwargs))
{}

error_message_t
error_message_t::from(const message_t& message) {
    expect(message, message_type::error, 4, 6);

    error_message_t result(
        static_cast<message_type>(as_id(message, 0, "REQUEST.Type")),
        as_id(message, 1, "REQUEST.Request"),
        parse_uri(message, 3, "Error")
    );

    result.details = as_object(message, 2, "Details");

    if (message.fields.size() > 4) {
        result.args = as_array(message, 4, "Arguments");
    }

    if (message.fields.size() > 5) {
        result.kwargs = as_object(message, 5, "ArgumentsKw");
    }

    return result;
}

message_t
error_message_t::to_message() const {
    array_t fields {
        static_cast<std::uint64_t>(request_type),
        request_id,
        details,
        error.string()
    };

    append(fields, args, kwargs);

    return message_t(message_type::error, std::move(fields));
}

bool error_message_t::operator==(const error_message_t& other) const {
    return request_type == other.request_type &&
        request_id == other.request_id &&
        details == other.details &&
        error == other.error &&
        args == other.args &&
        kwargs == other.kwargs;
}

abort_message_t::abort_message_t(uri_t reason, object_t details) :
    details(std::move(details)),
    reason(std::move(reason))
{}

abort_message_t
abort_message_t::from(const message_t& message) {
    expect(message, message_type::abort, 2, 2);

    return abort_message_t(parse_uri(message, 1, "Reason"), as_object(message, 0, "Details"));
}

message_t
abort_message_t::to_message() const {
    return message_t(message_type::abort, array_t { details, reason.string() });
}

interrupt_message_t::interrupt_message_t(std::uint64_t request_id, object_t options) :
    request_id(request_id),
    options(std::move(options))
{}

interrupt_message_t
interrupt_message_t::from(const message_t& message) {
    expect(message, message_type::interrupt, 2, 2);

    return interrupt_message_t(as_id(message, 0, "INVOCATION.Request"), as_object(message, 1, "Options"));
}

message_t
interrupt_message_t::to_message() const {
    return message_t(message_type::interrupt, array_t { request_id, options });
}

event_message_t::event_message_t(std::uint64_t subscription_id,
                                 std::uint64_t publication_id,
                                 array_t args,
                                 object_t kwargs,
                                 object_t details) :
    subscription_id(subscription_id),
    publication_id(publication_id),
    details(std::move(details)),
    args(std::move(args)),
    kwargs(std::move(kwargs))
{}

event_message_t
event_message_t::from(const message_t& message) {
    expect(message, message_type::event, 3, 5);

    event_message_t result(
        as_id(message, 0, "SUBSCRIBED.Subscription"),
        as_id(message, 1, "PUBLISHED.Publication")
    );

    result.details = as_object(message, 2, "Details");

    if (message.fields.size() > 3) {
        result.args = as_array(message, 3, "Arguments");
    }

    if (message.fields.size() > 4) {
        result.kwargs = as_object(message, 4, "ArgumentsKw");
    }

    return result;
}

message_t
event_message_t::to_message() const {
    array_t fields {
        subscription_id,
        publication_id,
        details
    };

    append(fields, args, kwargs);

    return message_t(message_type::event, std::move(fields));
}
