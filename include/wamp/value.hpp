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
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/variant.hpp>

namespace wamp {

/// The dynamic value class represents any value transferred in WAMP payloads: positional and
/// keyword arguments, details and options dictionaries.
///
/// Integral numbers keep their signedness: signed types are stored as std::int64_t, unsigned ones
/// as std::uint64_t.
class value_t {
public:
    struct null_t {
        bool operator==(const null_t&) const { return true; }
    };

    typedef std::vector<value_t> array_t;
    typedef std::map<std::string, value_t> object_t;

    typedef boost::variant<
        null_t,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        boost::recursive_wrapper<array_t>,
        boost::recursive_wrapper<object_t>
    > value_type;

private:
    value_type value;

public:
    /// Constructs a null value.
    value_t();

    value_t(null_t);
    value_t(bool boolean);
    value_t(double number);
    value_t(const char* string);
    value_t(std::string string);
    value_t(array_t array);
    value_t(object_t object);

    template<typename T>
    value_t(T number,
            typename std::enable_if<
                std::is_integral<T>::value && !std::is_same<T, bool>::value && std::is_signed<T>::value
            >::type* = nullptr) :
        value(static_cast<std::int64_t>(number))
    {}

    template<typename T>
    value_t(T number,
            typename std::enable_if<
                std::is_integral<T>::value && !std::is_same<T, bool>::value && std::is_unsigned<T>::value
            >::type* = nullptr) :
        value(static_cast<std::uint64_t>(number))
    {}

    bool is_null() const;
    bool is_bool() const;
    bool is_int() const;
    bool is_uint() const;
    bool is_double() const;
    bool is_string() const;
    bool is_array() const;
    bool is_object() const;

    /// Accessors throw boost::bad_get when the value holds another alternative.
    bool as_bool() const;
    std::int64_t as_int() const;
    std::uint64_t as_uint() const;
    double as_double() const;
    const std::string& as_string() const;
    const array_t& as_array() const;
    const object_t& as_object() const;

    /// Returns the underlying variant, mostly for visitation.
    const value_type& get() const noexcept;

    template<class Visitor>
    typename Visitor::result_type
    apply(Visitor& visitor) const {
        return boost::apply_visitor(visitor, value);
    }

    /// Signed and unsigned integers holding the same number are equal.
    bool operator==(const value_t& other) const;
    bool operator!=(const value_t& other) const;
};

typedef value_t::array_t array_t;
typedef value_t::object_t object_t;

/// Writes the debug representation of the value: strings are quoted and escaped, containers are
/// rendered recursively as `[a, b]` and `{"k": v}`.
std::ostream&
operator<<(std::ostream& stream, const value_t& value);

/// Returns the debug representation of the value, see operator<<.
std::string
repr(const value_t& value);

/// Returns the display representation of the value.
///
/// The only difference from \sa repr is that a top-level string is written as is.
std::string
to_string(const value_t& value);

/// Joins the representations of the given values with ", ".
std::string
join(const array_t& values, std::string (*fn)(const value_t&));

} // namespace wamp
