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
#include <vector>

namespace wamp {

namespace inspect {

struct options_t {
    /// Path to the file with MessagePack frames, "-" for the standard input.
    std::string input;

    /// URIs to be translated into invocation errors instead of generic error responses.
    std::vector<std::string> known;

    /// Whether registered URIs match their descendants too.
    bool prefix;

    /// Parses command-line arguments.
    ///
    /// Can internally terminate the program on invalid command-line arguments, providing an help
    /// message and returning a proper exit code.
    options_t(int argc, char** argv);
};

} // namespace inspect

} // namespace wamp
