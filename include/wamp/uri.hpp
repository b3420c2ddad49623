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

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace wamp {

/// The URI class represents a validated WAMP identifier of a procedure, a topic or an error.
///
/// URI consists of dot-separated non-empty components, which must contain neither whitespaces nor
/// '#' characters. Instances are immutable.
class uri_t {
    std::string value;

public:
    /// Constructs an URI from the given string.
    ///
    /// \throw std::system_error with one of `error::uri_errors` codes if the string is not a valid
    /// URI.
    explicit uri_t(std::string value);

    /// Returns the string representation.
    const std::string& string() const noexcept;

    /// Returns dot-separated components of this URI.
    std::vector<std::string> components() const;

    /// Checks whether this URI equals to the given one or is its component-wise prefix, i.e.
    /// "com.example" is a prefix of "com.example.bad_arg", but not of "com.examples".
    bool is_prefix_of(const uri_t& other) const noexcept;

    friend bool operator==(const uri_t& lhs, const uri_t& rhs) noexcept;
    friend bool operator!=(const uri_t& lhs, const uri_t& rhs) noexcept;
    friend bool operator<(const uri_t& lhs, const uri_t& rhs) noexcept;
};

/// Validates the given string, converting it into an URI.
uri_t as_uri(std::string value);

std::ostream&
operator<<(std::ostream& stream, const uri_t& uri);

/// Well-known URIs defined by the WAMP protocol.
namespace uris {

extern const char invalid_uri[];
extern const char no_such_procedure[];
extern const char procedure_already_exists[];
extern const char no_such_registration[];
extern const char no_such_subscription[];
extern const char invalid_argument[];
extern const char system_shutdown[];
extern const char close_realm[];
extern const char goodbye_and_out[];
extern const char not_authorized[];
extern const char authorization_failed[];
extern const char no_such_realm[];
extern const char no_such_role[];
extern const char canceled[];
extern const char option_not_allowed[];
extern const char no_eligible_callee[];
extern const char protocol_violation[];

/// Generic URI used to report failures, which have no URI registered.
extern const char runtime_error[];

} // namespace uris

} // namespace wamp

namespace std {

template<>
struct hash<wamp::uri_t> {
    size_t operator()(const wamp::uri_t& uri) const noexcept {
        return hash<string>()(uri.string());
    }
};

} // namespace std
