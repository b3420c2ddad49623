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
#include <memory>
#include <typeindex>
#include <utility>

#include <boost/optional.hpp>

#include "wamp/error.hpp"
#include "wamp/value.hpp"

namespace wamp {

/*!
 * The failure class carries an exception raised while handling an invocation together with the
 * invocation error attached to it.
 *
 * The attachment allows to annotate any exception, including third-party ones, with the precise
 * wire-level error (URI, keyword arguments and details) without requiring the exception type to
 * know anything about the protocol.
 *
 * Failures are cheap to copy, all copies share the same exception and the same attachment, which
 * lives until the last copy is destroyed. Failures constructed from the same exception object while
 * another failure for it is alive share the attachment too, so an annotated exception may be
 * rethrown and caught again with \sa current. A thrown failure is unwrapped the same way.
 * Exceptions, which are not derived from std::exception, are never shared this way.
 *
 * The attachment is released together with the last failure, so to annotate an exception in a
 * nested scope and handle it elsewhere, throw the failure itself:
 *
 * \code
 * } catch (const std::exception&) {
 *     auto failure = failure_t::current();
 *     set_invocation_error(failure, invocation_error_t("com.example.bad_arg"));
 *     throw failure;
 * }
 * \endcode
 *
 * Attaching is not thread-safe: a failure is expected to be owned by a single task until its error
 * metadata is finalized.
 */
class failure_t {
    class state_t;
    std::shared_ptr<state_t> d;

public:
    /// Constructs the failure from the given exception.
    ///
    /// \throw std::invalid_argument if the exception pointer is null.
    explicit failure_t(std::exception_ptr exception);

    /// Constructs the failure from the exception currently being handled.
    static
    failure_t
    current();

    const std::exception_ptr&
    exception() const noexcept;

    /// Returns the dynamic type of the exception, if it derives from std::exception.
    const boost::optional<std::type_index>&
    kind() const noexcept;

    /// Returns positional arguments of the exception: its non-empty `what()` message.
    const boost::optional<array_t>&
    args() const noexcept;

    /// Returns the exception object itself if it is an invocation error, null otherwise.
    ///
    /// The pointer returned shares the ownership of the exception.
    std::shared_ptr<const invocation_error_t>
    invocation_error() const noexcept;

    /// Returns the attached invocation error or null if nothing is attached.
    std::shared_ptr<const invocation_error_t>
    attachment() const noexcept;

    /// Rethrows the exception.
    void
    rethrow() const;

    friend void set_invocation_error(failure_t& failure, invocation_error_t err);
};

/// Constructs the failure from the given exception object.
template<class E>
failure_t
make_failure(E&& err) {
    return failure_t(std::make_exception_ptr(std::forward<E>(err)));
}

/*!
 * Attaches the invocation error to the failure.
 *
 * If the failure is an invocation error itself, its fields are overwritten in place, the exception
 * object stays the same. Otherwise the error is stored aside, the exception is left untouched.
 */
void
set_invocation_error(failure_t& failure, invocation_error_t err);

} // namespace wamp
