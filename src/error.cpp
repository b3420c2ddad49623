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

#include "wamp/error.hpp"

#include <ostream>

#include <boost/format.hpp>

using namespace wamp;

/// Extended description formatting patterns.
static const char ERROR_ABORT[]      = "%s (details = %s)";
static const char ERROR_UNEXPECTED[] = "received message %s but expected message of type %s";
static const char ERROR_INTERRUPT[]  = "interrupt (options = %s)";
static const char ERROR_CLOSED[]     = "the client is closed";

namespace {

struct wamp_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "wamp category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::transport_failure):
            return "transport failure";
        case static_cast<int>(error::session_aborted):
            return "the session join was aborted by the router";
        case static_cast<int>(error::authentication_failed):
            return "authentication failed";
        case static_cast<int>(error::invalid_message):
            return "invalid message";
        case static_cast<int>(error::unexpected_message):
            return "unexpected message received";
        case static_cast<int>(error::error_response):
            return "error response from the remote peer";
        case static_cast<int>(error::client_closed):
            return "the client is closed";
        case static_cast<int>(error::interrupted):
            return "the invocation was interrupted";
        case static_cast<int>(error::invocation_failed):
            return "the invocation has failed";
        default:
            return "unexpected wamp error";
        }
    }
};

struct registry_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "wamp registry category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::uri_not_found):
            return "no error factory is registered for the URI";
        case static_cast<int>(error::kind_not_found):
            return "no URI is registered for the exception type";
        case static_cast<int>(error::invalid_factory):
            return "error factory must be callable";
        default:
            return "unexpected registry error";
        }
    }
};

struct uri_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "wamp uri category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::empty_uri):
            return "the URI is empty";
        case static_cast<int>(error::empty_component):
            return "the URI contains an empty component";
        case static_cast<int>(error::invalid_character):
            return "the URI contains an invalid character";
        default:
            return "unexpected uri error";
        }
    }
};

struct codec_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "wamp codec category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::frame_format_error):
            return "the frame has invalid format";
        case static_cast<int>(error::insufficient_bytes):
            return "insufficient bytes provided to decode the frame";
        case static_cast<int>(error::parse_error):
            return "unable to parse the frame";
        default:
            return "unexpected codec error";
        }
    }
};

std::string
describe(const error_message_t& message) {
    std::string result = message.error.string();

    if (!message.args.empty()) {
        result += " " + join(message.args, &repr);
    }

    if (!message.kwargs.empty()) {
        std::string kwargs;
        for (auto it = message.kwargs.begin(); it != message.kwargs.end(); ++it) {
            if (it != message.kwargs.begin()) {
                kwargs += ", ";
            }

            kwargs += it->first + "=" + repr(it->second);
        }

        result += " (" + kwargs + ")";
    }

    return result;
}

std::string
describe(const uri_t& uri, const boost::optional<array_t>& args) {
    if (args && !args->empty()) {
        return uri.string() + " " + join(*args, &to_string);
    }

    return uri.string();
}

} // namespace

const std::error_category&
error::wamp_category() {
    static wamp_category_t category;
    return category;
}

const std::error_category&
error::registry_category() {
    static registry_category_t category;
    return category;
}

const std::error_category&
error::uri_category() {
    static uri_category_t category;
    return category;
}

const std::error_category&
error::codec_category() {
    static codec_category_t category;
    return category;
}

std::error_code
error::make_error_code(error::wamp_errors err) {
    return std::error_code(static_cast<int>(err), error::wamp_category());
}

std::error_code
error::make_error_code(error::registry_errors err) {
    return std::error_code(static_cast<int>(err), error::registry_category());
}

std::error_code
error::make_error_code(error::uri_errors err) {
    return std::error_code(static_cast<int>(err), error::uri_category());
}

std::error_code
error::make_error_code(error::codec_errors err) {
    return std::error_code(static_cast<int>(err), error::codec_category());
}

wamp::error_t::error_t(const std::error_code& ec, std::string description) :
    std::system_error(ec, description),
    description(std::move(description))
{}

wamp::error_t::~error_t() noexcept {}

const char* wamp::error_t::what() const noexcept {
    return description.c_str();
}

transport_error::transport_error(std::string description) :
    error_t(error::transport_failure, std::move(description))
{}

abort_error::abort_error(const abort_message_t& message) :
    error_t(error::session_aborted,
            boost::str(boost::format(ERROR_ABORT) % message.reason % value_t(message.details))),
    reason_(message.reason.string()),
    details_(message.details)
{}

const std::string& abort_error::reason() const noexcept {
    return reason_;
}

const object_t& abort_error::details() const noexcept {
    return details_;
}

auth_error::auth_error(std::string description) :
    error_t(error::authentication_failed, std::move(description))
{}

invalid_message::invalid_message(std::string description) :
    error_t(error::invalid_message, std::move(description))
{}

invalid_message::invalid_message(const std::error_code& ec, std::string description) :
    error_t(ec, std::move(description))
{}

unexpected_message_error::unexpected_message_error(message_t received, message_type expected) :
    invalid_message(error::unexpected_message,
                    boost::str(boost::format(ERROR_UNEXPECTED) % received % name(expected))),
    received_(std::move(received)),
    expected_(expected)
{}

const message_t& unexpected_message_error::received() const noexcept {
    return received_;
}

message_type unexpected_message_error::expected() const noexcept {
    return expected_;
}

error_response::error_response(error_message_t message) :
    error_t(error::error_response, describe(message)),
    message_(std::move(message))
{}

const error_message_t& error_response::message() const noexcept {
    return message_;
}

const uri_t& error_response::uri() const noexcept {
    return message_.error;
}

std::ostream&
wamp::operator<<(std::ostream& stream, const error_response& err) {
    return stream << "error_response(" << err.message().to_message() << ")";
}

client_closed::client_closed() :
    error_t(error::client_closed, ERROR_CLOSED)
{}

interrupt::interrupt(object_t options) :
    error_t(error::interrupted, boost::str(boost::format(ERROR_INTERRUPT) % value_t(options))),
    options_(std::move(options))
{}

const object_t& interrupt::options() const noexcept {
    return options_;
}

boost::optional<std::string> interrupt::cancel_mode() const {
    auto it = options_.find("mode");

    if (it == options_.end() || !it->second.is_string()) {
        return boost::none;
    }

    return it->second.as_string();
}

invocation_error_t::invocation_error_t(const std::string& uri,
                                       boost::optional<array_t> args,
                                       boost::optional<object_t> kwargs,
                                       boost::optional<object_t> details) :
    invocation_error_t(as_uri(uri), std::move(args), std::move(kwargs), std::move(details))
{}

invocation_error_t::invocation_error_t(uri_t uri,
                                       boost::optional<array_t> args,
                                       boost::optional<object_t> kwargs,
                                       boost::optional<object_t> details) :
    error_t(error::invocation_failed, describe(uri, args)),
    uri_(std::move(uri)),
    args_(std::move(args)),
    kwargs_(std::move(kwargs)),
    details_(std::move(details))
{}

const uri_t& invocation_error_t::uri() const noexcept {
    return uri_;
}

const boost::optional<array_t>& invocation_error_t::args() const noexcept {
    return args_;
}

const boost::optional<object_t>& invocation_error_t::kwargs() const noexcept {
    return kwargs_;
}

const boost::optional<object_t>& invocation_error_t::details() const noexcept {
    return details_;
}

message_t invocation_error_t::to_message(std::uint64_t request_id) const {
    array_t fields {
        static_cast<std::uint64_t>(message_type::invocation),
        request_id,
        details_ ? *details_ : object_t(),
        uri_.string()
    };

    // Positional arguments must precede the keyword ones on the wire, even when empty.
    if (args_ || kwargs_) {
        fields.push_back(args_ ? *args_ : array_t());
    }

    if (kwargs_) {
        fields.push_back(*kwargs_);
    }

    return message_t(message_type::error, std::move(fields));
}

bool invocation_error_t::operator==(const invocation_error_t& other) const {
    return uri_ == other.uri_ &&
        args_ == other.args_ &&
        kwargs_ == other.kwargs_ &&
        details_ == other.details_;
}

bool invocation_error_t::operator!=(const invocation_error_t& other) const {
    return !(*this == other);
}

std::ostream&
wamp::operator<<(std::ostream& stream, const invocation_error_t& err) {
    stream << "invocation_error(" << value_t(err.uri().string());

    if (err.args()) {
        stream << ", " << value_t(*err.args());
    }

    if (err.kwargs()) {
        stream << ", kwargs=" << value_t(*err.kwargs());
    }

    if (err.details()) {
        stream << ", details=" << value_t(*err.details());
    }

    return stream << ")";
}

lookup_error::lookup_error(error::registry_errors err, const std::string& key) :
    std::system_error(error::make_error_code(err), key)
{}

abort_error
wamp::make_abort_error(const message_t& message) {
    return abort_error(abort_message_t::from(message));
}

interrupt
wamp::make_interrupt(const message_t& message) {
    return interrupt(interrupt_message_t::from(message).options);
}
