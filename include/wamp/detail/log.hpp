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

#include "wamp/config.hpp"

#ifdef WAMP_USE_INTERNAL_LOGGING

#include <sstream>
#include <string>

#include <boost/preprocessor/cat.hpp>

#define BLACKHOLE_HAS_ATTRIBUTE_LWP
#include <blackhole/logger.hpp>
#include <blackhole/logger/wrapper.hpp>
#include <blackhole/macro.hpp>
#include <blackhole/scoped_attributes.hpp>
#include <blackhole/utils/format.hpp>

namespace wamp {

namespace detail {

enum level_t {
    debug,
    notice,
    info,
    warn,
    error
};

typedef blackhole::verbose_logger_t<level_t> logger_type;

logger_type& logger();

/// Appends the given context to the one attached to the current scope, separated by '|'.
std::string merge_context(std::string context);

} // namespace detail

} // namespace wamp

template<typename T>
inline std::string ser_msg(const T& from) {
    std::ostringstream s;
    s << from;
    return s.str();
}

#define WAMP_MSG(message) ser_msg(message).c_str()

#   define WAMP_EC(ec) ec ? ec.message().c_str() : "ok"
#   define WAMP_LOG BH_LOG
#   define WAMP_DBG(...) WAMP_LOG(::wamp::detail::logger(), ::wamp::detail::debug, __VA_ARGS__)
#   define WAMP_INF(...) WAMP_LOG(::wamp::detail::logger(), ::wamp::detail::info, __VA_ARGS__)
#   define WAMP_WRN(...) WAMP_LOG(::wamp::detail::logger(), ::wamp::detail::warn, __VA_ARGS__)

#define WAMP_CTX(...) \
    ::blackhole::scoped_attributes_t BOOST_PP_CAT(__context__, __COUNTER__)( \
        ::wamp::detail::logger(), \
        ::blackhole::attribute::set_t({ \
            { "context", ::wamp::detail::merge_context(::blackhole::utils::format(__VA_ARGS__)) } \
        }) \
    );

#else
#   define WAMP_MSG(...)
#   define WAMP_EC(...)
#   define WAMP_LOG(...)
#   define WAMP_DBG(...)
#   define WAMP_INF(...)
#   define WAMP_WRN(...)
#   define WAMP_CTX(...)
#endif
