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

#include "wamp/registry.hpp"

#include <boost/core/demangle.hpp>
#include <boost/thread/locks.hpp>

#include "wamp/detail/log.hpp"

using namespace wamp;

registry_t::registry_t(match_policy policy) :
    factories(policy)
{}

registry_t& registry_t::instance() {
    static registry_t registry;
    return registry;
}

void
registry_t::register_error_response(const std::string& uri, factory_type factory) {
    auto validated = as_uri(uri);

    if (!factory) {
        throw std::system_error(error::invalid_factory, uri);
    }

    WAMP_DBG("registering error factory for '%s'", uri.c_str());
    factories.insert(validated, std::move(factory));
}

auto registry_t::get_exception_factory(const uri_t& uri) const -> factory_type {
    return factories.resolve(uri);
}

std::exception_ptr
registry_t::error_to_exception(const error_message_t& message) const {
    WAMP_CTX("RI");

    factory_type factory;
    try {
        factory = get_exception_factory(message.error);
    } catch (const lookup_error&) {
        WAMP_DBG("no factory registered for '%s', wrapping into error response", message.error.string().c_str());
        return std::make_exception_ptr(error_response(message));
    }

    auto exception = factory(message);
    if (!exception) {
        WAMP_WRN("error factory for '%s' returned no exception, wrapping into error response",
            message.error.string().c_str());
        return std::make_exception_ptr(error_response(message));
    }

    return exception;
}

void
registry_t::register_exception_uri(std::type_index kind, const std::string& uri) {
    auto validated = as_uri(uri);

    WAMP_DBG("registering '%s' for exception %s", uri.c_str(), boost::core::demangle(kind.name()).c_str());

    boost::unique_lock<boost::shared_mutex> lock(mutex);
    auto it = kinds.find(kind);

    if (it == kinds.end()) {
        kinds.insert(std::make_pair(kind, std::move(validated)));
    } else {
        it->second = std::move(validated);
    }
}

uri_t
registry_t::get_exception_uri(std::type_index kind) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex);
    auto it = kinds.find(kind);

    if (it == kinds.end()) {
        throw lookup_error(error::kind_not_found, boost::core::demangle(kind.name()));
    }

    return it->second;
}

std::shared_ptr<const invocation_error_t>
registry_t::exception_to_invocation_error(const failure_t& failure) const {
    WAMP_CTX("RO");

    if (auto err = failure.invocation_error()) {
        return err;
    }

    if (auto err = failure.attachment()) {
        return err;
    }

    const auto& kind = failure.kind();

    if (kind) {
        try {
            return std::make_shared<invocation_error_t>(get_exception_uri(*kind), failure.args());
        } catch (const lookup_error&) {
            WAMP_INF("no uri registered for exception %s. Using '%s'",
                boost::core::demangle(kind->name()).c_str(), uris::runtime_error);
        }
    } else {
        WAMP_INF("no uri registered for foreign exception. Using '%s'", uris::runtime_error);
    }

    return std::make_shared<invocation_error_t>(uri_t(uris::runtime_error), failure.args());
}

void
wamp::register_error_response(const std::string& uri, registry_t::factory_type factory) {
    registry_t::instance().register_error_response(uri, std::move(factory));
}

std::exception_ptr
wamp::error_to_exception(const error_message_t& message) {
    return registry_t::instance().error_to_exception(message);
}

void
wamp::register_exception_uri(std::type_index kind, const std::string& uri) {
    registry_t::instance().register_exception_uri(kind, uri);
}

uri_t
wamp::get_exception_uri(std::type_index kind) {
    return registry_t::instance().get_exception_uri(kind);
}

std::shared_ptr<const invocation_error_t>
wamp::exception_to_invocation_error(const failure_t& failure) {
    return registry_t::instance().exception_to_invocation_error(failure);
}
