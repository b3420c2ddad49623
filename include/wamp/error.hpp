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

#include <iosfwd>
#include <string>
#include <system_error>

#include <boost/optional.hpp>

#include "wamp/message.hpp"
#include "wamp/uri.hpp"
#include "wamp/value.hpp"

/// This module provides access to the error codes and the exception hierarchy of the library.

namespace wamp {

namespace error {

/// Protocol level error codes, each of them corresponds to the exception class of the same name.
enum wamp_errors {
    /// The transport has failed.
    transport_failure = 1,
    /// The peer has aborted the session establishment.
    session_aborted,
    /// The authentication was rejected.
    authentication_failed,
    /// Malformed or unparseable message.
    invalid_message,
    /// A message of another kind was received where a specific kind was required.
    unexpected_message,
    /// A remote call has failed with an error, which has no exception registered.
    error_response,
    /// An operation was attempted after the client shutdown.
    client_closed,
    /// The remote side requested the invocation cancellation.
    interrupted,
    /// The failure to be reported back to a remote caller.
    invocation_failed
};

/// Error registry specific error codes.
enum registry_errors {
    /// There is no error factory registered for the URI.
    uri_not_found = 1,
    /// There is no URI registered for the exception type.
    kind_not_found,
    /// The error factory is not callable.
    invalid_factory
};

/// URI validation error codes.
enum uri_errors {
    empty_uri = 1,
    empty_component,
    invalid_character
};

/// Frame decoding error codes.
enum codec_errors {
    /// The frame is not an array beginning with the message type code.
    frame_format_error = 1,
    /// More bytes are required to decode the frame.
    insufficient_bytes,
    /// The buffer does not contain valid MessagePack.
    parse_error
};

/// Identifies the protocol error category by returning an const lvalue reference to it.
const std::error_category& wamp_category();

/// Identifies the registry error category by returning an const lvalue reference to it.
const std::error_category& registry_category();

/// Identifies the URI error category by returning an const lvalue reference to it.
const std::error_category& uri_category();

/// Identifies the codec error category by returning an const lvalue reference to it.
const std::error_category& codec_category();

std::error_code make_error_code(wamp_errors err);
std::error_code make_error_code(registry_errors err);
std::error_code make_error_code(uri_errors err);
std::error_code make_error_code(codec_errors err);

} // namespace error

/*!
 * The error class represents the root of WAMP error hierarchy.
 *
 * Unlike plain std::system_error the `what()` method returns the description only, which is the
 * canonical human-readable rendering of the error.
 */
class error_t : public std::system_error {
    std::string description;

public:
    error_t(const std::error_code& ec, std::string description);

    ~error_t() noexcept;

    const char*
    what() const noexcept;
};

/// Transport level error.
class transport_error : public error_t {
public:
    explicit transport_error(std::string description);
};

/// The exception class, that is thrown when the router aborts the session join.
class abort_error : public error_t {
    std::string reason_;
    object_t details_;

public:
    explicit abort_error(const abort_message_t& message);

    /// Returns the reason URI of the abort as string.
    const std::string&
    reason() const noexcept;

    const object_t&
    details() const noexcept;
};

class auth_error : public error_t {
public:
    explicit auth_error(std::string description);
};

/// Exception for invalid messages.
class invalid_message : public error_t {
public:
    explicit invalid_message(std::string description);

protected:
    invalid_message(const std::error_code& ec, std::string description);
};

/// The exception class, that is thrown when a message of unexpected type is received.
class unexpected_message_error : public invalid_message {
    message_t received_;
    message_type expected_;

public:
    unexpected_message_error(message_t received, message_type expected);

    /// Returns the message that was received.
    const message_t&
    received() const noexcept;

    /// Returns the message type that was expected.
    message_type
    expected() const noexcept;
};

/*!
 * The exception class represents an ERROR message received from the router, for which there is no
 * specific exception registered.
 *
 * Rendered as `<uri> <args...> (<key>=<value>, ...)`, where both arguments sections are omitted
 * when empty.
 */
class error_response : public error_t {
    error_message_t message_;

public:
    explicit error_response(error_message_t message);

    /// Returns the error message.
    const error_message_t&
    message() const noexcept;

    /// Returns the error URI.
    const uri_t&
    uri() const noexcept;
};

/// Writes the complete representation of the error response: the whole ERROR message including
/// details.
std::ostream&
operator<<(std::ostream& stream, const error_response& err);

/// The exception class, that is thrown on any operation attempted after the client was closed.
class client_closed : public error_t {
public:
    client_closed();
};

/// The interrupt is raised inside the invocation handler when the caller cancels the call.
///
/// It is never reported as the invocation result, the handler decides whether to cooperate.
class interrupt : public error_t {
    object_t options_;

public:
    explicit interrupt(object_t options);

    /// Returns options sent with the interrupt.
    const object_t&
    options() const noexcept;

    /// Returns the cancel mode ("skip", "kill" or "killnowait") sent with the interrupt, if any.
    boost::optional<std::string>
    cancel_mode() const;
};

/*!
 * The invocation error is the failure, which is reported to the remote caller as an ERROR message.
 *
 * Optional fields stay absent unless explicitly supplied, absent fields are omitted from the wire.
 *
 * Rendered as `<uri> <args...>` or just `<uri>` without arguments. Keyword arguments and details
 * are available only through the stream operator.
 */
class invocation_error_t : public error_t {
    uri_t uri_;
    boost::optional<array_t> args_;
    boost::optional<object_t> kwargs_;
    boost::optional<object_t> details_;

public:
    /// \throw std::system_error if the given URI is invalid.
    explicit invocation_error_t(const std::string& uri,
                                boost::optional<array_t> args = boost::none,
                                boost::optional<object_t> kwargs = boost::none,
                                boost::optional<object_t> details = boost::none);

    invocation_error_t(uri_t uri,
                       boost::optional<array_t> args = boost::none,
                       boost::optional<object_t> kwargs = boost::none,
                       boost::optional<object_t> details = boost::none);

    const uri_t&
    uri() const noexcept;

    const boost::optional<array_t>&
    args() const noexcept;

    const boost::optional<object_t>&
    kwargs() const noexcept;

    const boost::optional<object_t>&
    details() const noexcept;

    /// Builds an ERROR message replying to the INVOCATION with the given request id.
    message_t
    to_message(std::uint64_t request_id) const;

    bool operator==(const invocation_error_t& other) const;
    bool operator!=(const invocation_error_t& other) const;
};

/// Writes the complete representation of the invocation error, including keyword arguments and
/// details.
std::ostream&
operator<<(std::ostream& stream, const invocation_error_t& err);

/*!
 * The exception class, that is thrown by registries when the requested key was never registered.
 *
 * It does not belong to the WAMP error hierarchy, callers are expected to catch it and to fall back
 * to the default behavior.
 */
class lookup_error : public std::system_error {
public:
    lookup_error(error::registry_errors err, const std::string& key);
};

/// Translates an ABORT message to the corresponding exception.
abort_error
make_abort_error(const message_t& message);

/// Translates an INTERRUPT message to the corresponding exception.
interrupt
make_interrupt(const message_t& message);

} // namespace wamp

namespace std {

template<>
struct is_error_code_enum<wamp::error::wamp_errors> : public true_type {};

template<>
struct is_error_code_enum<wamp::error::registry_errors> : public true_type {};

template<>
struct is_error_code_enum<wamp::error::uri_errors> : public true_type {};

template<>
struct is_error_code_enum<wamp::error::codec_errors> : public true_type {};

} // namespace std
