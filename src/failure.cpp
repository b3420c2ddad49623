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

#include "wamp/failure.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "wamp/detail/log.hpp"

using namespace wamp;

/*!
 * Failure state is shared between all carriers created for the same exception object, so the
 * attachment follows the exception when it is thrown and caught again.
 *
 * Live states are tracked by the address of their exception object. The entry is removed when the
 * last carrier is destroyed, while the object itself is still kept alive by the state.
 */
class failure_t::state_t {
public:
    const std::exception_ptr exception;

    /// Address of the exception object, null for foreign exceptions.
    const void* const object;

    /// Points into the exception object, which is kept alive by the pointer above.
    invocation_error_t* self;

    boost::optional<std::type_index> kind;
    boost::optional<array_t> args;

    std::shared_ptr<const invocation_error_t> attachment;

    state_t(std::exception_ptr exception, const void* object) :
        exception(std::move(exception)),
        object(object),
        self(nullptr)
    {}

    ~state_t() {
        if (object == nullptr) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex());
        auto it = states().find(object);

        if (it != states().end() && it->second.first == this) {
            states().erase(it);
        }
    }

    /// Returns the state of the given exception, creating it if there is no live one.
    static
    std::shared_ptr<state_t>
    acquire(std::exception_ptr exception) {
        if (!exception) {
            throw std::invalid_argument("failure must hold an exception");
        }

        try {
            std::rethrow_exception(exception);
        } catch (const failure_t& failure) {
            // The carrier itself was thrown.
            return failure.d;
        } catch (invocation_error_t& err) {
            auto state = track(std::move(exception), &err);
            state->self = &err;
            state->kind = std::type_index(typeid(err));
            return state;
        } catch (const std::exception& err) {
            auto state = track(std::move(exception), &err);
            state->kind = std::type_index(typeid(err));

            if (*err.what() != '\0') {
                state->args = array_t { std::string(err.what()) };
            }

            return state;
        } catch (...) {
            // Foreign exceptions carry neither a kind nor arguments, their address is unknown.
            return std::make_shared<state_t>(std::move(exception), nullptr);
        }
    }

private:
    typedef std::unordered_map<const void*, std::pair<state_t*, std::weak_ptr<state_t>>> states_type;

    static
    std::mutex&
    mutex() {
        static std::mutex mutex;
        return mutex;
    }

    static
    states_type&
    states() {
        static states_type states;
        return states;
    }

    /// Returns the live state for the object, or registers a new one.
    ///
    /// The returned state may already be classified, which is harmless since the classification
    /// depends on the exception object only.
    static
    std::shared_ptr<state_t>
    track(std::exception_ptr exception, const void* object) {
        std::lock_guard<std::mutex> lock(mutex());

        auto it = states().find(object);
        if (it != states().end()) {
            if (auto state = it->second.second.lock()) {
                return state;
            }
        }

        auto state = std::make_shared<state_t>(std::move(exception), object);
        states()[object] = std::make_pair(state.get(), std::weak_ptr<state_t>(state));
        return state;
    }
};

failure_t::failure_t(std::exception_ptr exception) :
    d(state_t::acquire(std::move(exception)))
{}

failure_t failure_t::current() {
    return failure_t(std::current_exception());
}

const std::exception_ptr& failure_t::exception() const noexcept {
    return d->exception;
}

const boost::optional<std::type_index>& failure_t::kind() const noexcept {
    return d->kind;
}

const boost::optional<array_t>& failure_t::args() const noexcept {
    return d->args;
}

std::shared_ptr<const invocation_error_t> failure_t::invocation_error() const noexcept {
    if (d->self == nullptr) {
        return nullptr;
    }

    return std::shared_ptr<const invocation_error_t>(d, d->self);
}

std::shared_ptr<const invocation_error_t> failure_t::attachment() const noexcept {
    return d->attachment;
}

void failure_t::rethrow() const {
    std::rethrow_exception(d->exception);
}

void
wamp::set_invocation_error(failure_t& failure, invocation_error_t err) {
    WAMP_CTX("A");

    if (failure.d->self) {
        WAMP_INF("overwriting %s with %s", WAMP_MSG(*failure.d->self), WAMP_MSG(err));
        *failure.d->self = std::move(err);
        return;
    }

    if (failure.d->attachment) {
        WAMP_DBG("replacing attached %s with %s", WAMP_MSG(*failure.d->attachment), WAMP_MSG(err));
    }

    failure.d->attachment = std::make_shared<invocation_error_t>(std::move(err));
}
