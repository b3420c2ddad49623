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

/// Use internal logging system (much verbose, so spam, wow).
///
/// The build may disable it by passing -DWAMP_DISABLE_INTERNAL_LOGGING.
#ifndef WAMP_DISABLE_INTERNAL_LOGGING
#   define WAMP_USE_INTERNAL_LOGGING
#endif

/// Library version reported by the tools.
#define WAMP_VERSION "0.3.0"
