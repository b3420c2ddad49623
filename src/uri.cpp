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

#include "wamp/uri.hpp"

#include <cctype>
#include <ostream>

#include <boost/algorithm/string/split.hpp>

#include "wamp/error.hpp"

using namespace wamp;

namespace {

void validate(const std::string& value) {
    if (value.empty()) {
        throw std::system_error(error::empty_uri);
    }

    bool empty = true;
    for (auto it = value.begin(); it != value.end(); ++it) {
        const char ch = *it;

        if (ch == '.') {
            if (empty) {
                throw std::system_error(error::empty_component, value);
            }

            empty = true;
            continue;
        }

        if (ch == '#' || std::isspace(static_cast<unsigned char>(ch))) {
            throw std::system_error(error::invalid_character, value);
        }

        empty = false;
    }

    if (empty) {
        throw std::system_error(error::empty_component, value);
    }
}

} // namespace

uri_t::uri_t(std::string value) :
    value(std::move(value))
{
    validate(this->value);
}

const std::string& uri_t::string() const noexcept {
    return value;
}

std::vector<std::string> uri_t::components() const {
    std::vector<std::string> result;
    boost::algorithm::split(result, value, [](char ch) { return ch == '.'; });
    return result;
}

bool uri_t::is_prefix_of(const uri_t& other) const noexcept {
    const auto& rhs = other.value;

    if (rhs.size() < value.size() || rhs.compare(0, value.size(), value) != 0) {
        return false;
    }

    return rhs.size() == value.size() || rhs[value.size()] == '.';
}

namespace wamp {

bool operator==(const uri_t& lhs, const uri_t& rhs) noexcept {
    return lhs.value == rhs.value;
}

bool operator!=(const uri_t& lhs, const uri_t& rhs) noexcept {
    return !(lhs == rhs);
}

bool operator<(const uri_t& lhs, const uri_t& rhs) noexcept {
    return lhs.value < rhs.value;
}

} // namespace wamp

uri_t wamp::as_uri(std::string value) {
    return uri_t(std::move(value));
}

std::ostream&
wamp::operator<<(std::ostream& stream, const uri_t& uri) {
    return stream << uri.string();
}

namespace wamp { namespace uris {

const char invalid_uri[]              = "wamp.error.invalid_uri";
const char no_such_procedure[]        = "wamp.error.no_such_procedure";
const char procedure_already_exists[] = "wamp.error.procedure_already_exists";
const char no_such_registration[]     = "wamp.error.no_such_registration";
const char no_such_subscription[]     = "wamp.error.no_such_subscription";
const char invalid_argument[]         = "wamp.error.invalid_argument";
const char system_shutdown[]          = "wamp.close.system_shutdown";
const char close_realm[]              = "wamp.close.close_realm";
const char goodbye_and_out[]          = "wamp.close.goodbye_and_out";
const char not_authorized[]           = "wamp.error.not_authorized";
const char authorization_failed[]     = "wamp.error.authorization_failed";
const char no_such_realm[]            = "wamp.error.no_such_realm";
const char no_such_role[]             = "wamp.error.no_such_role";
const char canceled[]                 = "wamp.error.canceled";
const char option_not_allowed[]       = "wamp.error.option_not_allowed";
const char no_eligible_callee[]       = "wamp.error.no_eligible_callee";
const char protocol_violation[]       = "wamp.error.protocol_violation";
const char runtime_error[]            = "wamp.error.runtime_error";

}} // namespace wamp::uris
