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

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include <boost/thread/shared_mutex.hpp>

#include "wamp/error.hpp"
#include "wamp/failure.hpp"
#include "wamp/message.hpp"
#include "wamp/uri.hpp"
#include "wamp/uri_map.hpp"

/// This module provides the error registry, which translates ERROR messages to exceptions and
/// exceptions back to invocation errors.

namespace wamp {

/*!
 * The registry class holds two independent tables: URI to error factory used to translate incoming
 * ERROR messages and exception type to URI used to report failed invocations.
 *
 * Both tables are safe to be modified and read concurrently, however registrations are expected to
 * be done once at the application startup.
 */
class registry_t {
public:
    /// Creates an exception from the ERROR message.
    typedef std::function<std::exception_ptr(const error_message_t&)> factory_type;

private:
    uri_map<factory_type> factories;

    std::unordered_map<std::type_index, uri_t> kinds;
    mutable boost::shared_mutex mutex;

public:
    /// Constructs an empty registry with the given policy of error factories lookup.
    explicit registry_t(match_policy policy = match_policy::exact);

    registry_t(const registry_t&) = delete;
    registry_t& operator=(const registry_t&) = delete;

    /// Returns the process-wide registry instance.
    static
    registry_t&
    instance();

    /// Registers the error factory for the given URI, overwriting the previous one.
    ///
    /// \throw std::system_error if the URI is invalid or the factory is empty.
    void
    register_error_response(const std::string& uri, factory_type factory);

    /// Registers the exception type, which is constructible from the ERROR message, as the factory
    /// for the given URI.
    template<class E>
    void
    register_error_response(const std::string& uri) {
        static_assert(std::is_constructible<E, const error_message_t&>::value,
            "exception must be constructible from the error message");

        register_error_response(uri, [](const error_message_t& message) -> std::exception_ptr {
            return std::make_exception_ptr(E(message));
        });
    }

    /// Returns the error factory for the given URI.
    ///
    /// \throw lookup_error if there is no factory registered.
    factory_type
    get_exception_factory(const uri_t& uri) const;

    /// Translates the ERROR message to the exception.
    ///
    /// Messages with unregistered URIs are wrapped into \sa error_response. Never throws on lookup
    /// failure.
    std::exception_ptr
    error_to_exception(const error_message_t& message) const;

    /// Registers the URI, which is used to report invocation failures of the given exception type.
    ///
    /// \throw std::system_error if the URI is invalid.
    void
    register_exception_uri(std::type_index kind, const std::string& uri);

    template<class E>
    void
    register_exception_uri(const std::string& uri) {
        register_exception_uri(std::type_index(typeid(E)), uri);
    }

    /// Registers the exception type in both directions.
    template<class E>
    void
    register_error(const std::string& uri) {
        register_error_response<E>(uri);
        register_exception_uri<E>(uri);
    }

    /// Returns the URI registered for the given exception type.
    ///
    /// \throw lookup_error if there is no URI registered.
    uri_t
    get_exception_uri(std::type_index kind) const;

    /*!
     * Converts the failure to the invocation error to be sent to the caller.
     *
     * The following sources are checked in order:
     *  - the exception itself if it is an invocation error;
     *  - the invocation error attached to the failure;
     *  - the URI registered for the exception type with the exception arguments;
     *  - the generic `wamp.error.runtime_error` URI with the exception arguments.
     */
    std::shared_ptr<const invocation_error_t>
    exception_to_invocation_error(const failure_t& failure) const;
};

/// Process-wide registry shortcuts.

void
register_error_response(const std::string& uri, registry_t::factory_type factory);

template<class E>
void
register_error_response(const std::string& uri) {
    registry_t::instance().register_error_response<E>(uri);
}

std::exception_ptr
error_to_exception(const error_message_t& message);

void
register_exception_uri(std::type_index kind, const std::string& uri);

template<class E>
void
register_exception_uri(const std::string& uri) {
    registry_t::instance().register_exception_uri<E>(uri);
}

uri_t
get_exception_uri(std::type_index kind);

std::shared_ptr<const invocation_error_t>
exception_to_invocation_error(const failure_t& failure);

} // namespace wamp
