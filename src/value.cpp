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

#include "wamp/value.hpp"

#include <cstdio>
#include <ostream>
#include <sstream>

using namespace wamp;

namespace {

void escape(std::ostream& stream, const std::string& string) {
    stream << '"';

    for (auto it = string.begin(); it != string.end(); ++it) {
        const char ch = *it;

        switch (ch) {
        case '"':
            stream << "\\\"";
            break;
        case '\\':
            stream << "\\\\";
            break;
        case '\n':
            stream << "\\n";
            break;
        case '\r':
            stream << "\\r";
            break;
        case '\t':
            stream << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
                stream << buffer;
            } else {
                stream << ch;
            }
        }
    }

    stream << '"';
}

struct printer_t : public boost::static_visitor<> {
    std::ostream& stream;

    explicit printer_t(std::ostream& stream) :
        stream(stream)
    {}

    void operator()(const value_t::null_t&) const {
        stream << "null";
    }

    void operator()(bool value) const {
        stream << (value ? "true" : "false");
    }

    void operator()(std::int64_t value) const {
        stream << value;
    }

    void operator()(std::uint64_t value) const {
        stream << value;
    }

    void operator()(double value) const {
        stream << value;
    }

    void operator()(const std::string& value) const {
        escape(stream, value);
    }

    void operator()(const array_t& value) const {
        stream << '[';
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it != value.begin()) {
                stream << ", ";
            }

            stream << *it;
        }
        stream << ']';
    }

    void operator()(const object_t& value) const {
        stream << '{';
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it != value.begin()) {
                stream << ", ";
            }

            escape(stream, it->first);
            stream << ": " << it->second;
        }
        stream << '}';
    }
};

} // namespace

value_t::value_t() :
    value(null_t())
{}

value_t::value_t(null_t) :
    value(null_t())
{}

value_t::value_t(bool boolean) :
    value(boolean)
{}

value_t::value_t(double number) :
    value(number)
{}

value_t::value_t(const char* string) :
    value(std::string(string))
{}

value_t::value_t(std::string string) :
    value(std::move(string))
{}

value_t::value_t(array_t array) :
    value(std::move(array))
{}

value_t::value_t(object_t object) :
    value(std::move(object))
{}

bool value_t::is_null() const {
    return boost::get<null_t>(&value) != nullptr;
}

bool value_t::is_bool() const {
    return boost::get<bool>(&value) != nullptr;
}

bool value_t::is_int() const {
    return boost::get<std::int64_t>(&value) != nullptr;
}

bool value_t::is_uint() const {
    return boost::get<std::uint64_t>(&value) != nullptr;
}

bool value_t::is_double() const {
    return boost::get<double>(&value) != nullptr;
}

bool value_t::is_string() const {
    return boost::get<std::string>(&value) != nullptr;
}

bool value_t::is_array() const {
    return boost::get<array_t>(&value) != nullptr;
}

bool value_t::is_object() const {
    return boost::get<object_t>(&value) != nullptr;
}

bool value_t::as_bool() const {
    return boost::get<bool>(value);
}

std::int64_t value_t::as_int() const {
    return boost::get<std::int64_t>(value);
}

std::uint64_t value_t::as_uint() const {
    return boost::get<std::uint64_t>(value);
}

double value_t::as_double() const {
    return boost::get<double>(value);
}

const std::string& value_t::as_string() const {
    return boost::get<std::string>(value);
}

const array_t& value_t::as_array() const {
    return boost::get<array_t>(value);
}

const object_t& value_t::as_object() const {
    return boost::get<object_t>(value);
}

auto value_t::get() const noexcept -> const value_type& {
    return value;
}

bool value_t::operator==(const value_t& other) const {
    // Integers are compared by value, because the wire format does not keep signedness of
    // non-negative numbers.
    if (is_int() && other.is_uint()) {
        return as_int() >= 0 && static_cast<std::uint64_t>(as_int()) == other.as_uint();
    }

    if (is_uint() && other.is_int()) {
        return other == *this;
    }

    return value == other.value;
}

bool value_t::operator!=(const value_t& other) const {
    return !(*this == other);
}

std::ostream&
wamp::operator<<(std::ostream& stream, const value_t& value) {
    printer_t printer(stream);
    value.apply(printer);
    return stream;
}

std::string
wamp::repr(const value_t& value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
}

std::string
wamp::to_string(const value_t& value) {
    if (value.is_string()) {
        return value.as_string();
    }

    return repr(value);
}

std::string
wamp::join(const array_t& values, std::string (*fn)(const value_t&)) {
    std::string result;

    for (auto it = values.begin(); it != values.end(); ++it) {
        if (it != values.begin()) {
            result += ", ";
        }

        result += fn(*it);
    }

    return result;
}
