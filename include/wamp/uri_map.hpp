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

#include <string>
#include <unordered_map>

#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "wamp/error.hpp"
#include "wamp/uri.hpp"

namespace wamp {

/// URI matching policy.
enum class match_policy {
    /// Only the exactly registered URI matches.
    exact,
    /// The longest registered URI, which is a component-wise prefix of the requested one, matches.
    prefix
};

/*!
 * The URI map class represents a thread-safe mapping from URIs to arbitrary values.
 *
 * Lookups take shared ownership of the internal lock, modifications take the unique one, so it's
 * safe to register new values while other threads are resolving.
 */
template<class V>
class uri_map {
public:
    typedef V value_type;

private:
    const match_policy policy_;

    std::unordered_map<uri_t, value_type> values;
    mutable boost::shared_mutex mutex;

public:
    explicit uri_map(match_policy policy = match_policy::exact) :
        policy_(policy)
    {}

    uri_map(const uri_map&) = delete;
    uri_map& operator=(const uri_map&) = delete;

    match_policy
    policy() const noexcept {
        return policy_;
    }

    /// Stores the value under the given URI, overwriting the previous one if any.
    void
    insert(const uri_t& uri, value_type value) {
        boost::unique_lock<boost::shared_mutex> lock(mutex);
        auto it = values.find(uri);

        if (it == values.end()) {
            values.insert(std::make_pair(uri, std::move(value)));
        } else {
            it->second = std::move(value);
        }
    }

    /// Removes the value stored under exactly the given URI.
    ///
    /// \returns true if the value was removed.
    bool
    erase(const uri_t& uri) {
        boost::unique_lock<boost::shared_mutex> lock(mutex);
        return values.erase(uri) > 0;
    }

    /// Returns the value for the given URI according to the matching policy.
    ///
    /// \throw lookup_error if there is no matching value.
    value_type
    resolve(const uri_t& uri) const {
        boost::shared_lock<boost::shared_mutex> lock(mutex);

        auto it = values.find(uri);
        if (it != values.end()) {
            return it->second;
        }

        if (policy_ == match_policy::prefix) {
            // Valid URIs never start with a dot, so every candidate is a valid URI too.
            const std::string& string = uri.string();

            for (auto pos = string.rfind('.'); pos != std::string::npos; pos = string.rfind('.', pos - 1)) {
                it = values.find(uri_t(string.substr(0, pos)));
                if (it != values.end()) {
                    return it->second;
                }
            }
        }

        throw lookup_error(error::uri_not_found, uri.string());
    }

    /// Checks whether a value is registered under exactly the given URI.
    bool
    contains(const uri_t& uri) const {
        boost::shared_lock<boost::shared_mutex> lock(mutex);
        return values.count(uri) > 0;
    }

    std::size_t
    size() const {
        boost::shared_lock<boost::shared_mutex> lock(mutex);
        return values.size();
    }

    bool
    empty() const {
        return size() == 0;
    }
};

} // namespace wamp
