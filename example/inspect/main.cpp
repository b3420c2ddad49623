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

#include <cerrno>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

#include <boost/core/demangle.hpp>

#include <wamp/decoder.hpp>
#include <wamp/error.hpp>
#include <wamp/registry.hpp>

#include "options.hpp"

using namespace wamp;

namespace {

std::string read(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream stream(path.c_str(), std::ios::binary);
    if (!stream) {
        throw std::system_error(errno, std::generic_category(), path);
    }

    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

void print(const std::exception& err) {
    std::cout << boost::core::demangle(typeid(err).name()) << ": " << err.what() << std::endl;
}

void describe(const registry_t& registry, const message_t& message) {
    switch (message.type) {
    case message_type::error:
        try {
            std::rethrow_exception(registry.error_to_exception(error_message_t::from(message)));
        } catch (const invocation_error_t& err) {
            std::cout << err << std::endl;
        } catch (const error_response& err) {
            std::cout << err << std::endl;
        } catch (const std::exception& err) {
            print(err);
        }
        break;
    case message_type::abort:
        print(make_abort_error(message));
        break;
    case message_type::interrupt:
        print(make_interrupt(message));
        break;
    default:
        std::cout << message << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    inspect::options_t options(argc, argv);

    registry_t registry(options.prefix ? match_policy::prefix : match_policy::exact);

    try {
        for (auto it = options.known.begin(); it != options.known.end(); ++it) {
            registry.register_error_response(*it, [](const error_message_t& message) {
                return std::make_exception_ptr(invocation_error_t(
                    message.error,
                    message.args.empty() ? boost::none : boost::make_optional(message.args),
                    message.kwargs.empty() ? boost::none : boost::make_optional(message.kwargs),
                    message.details.empty() ? boost::none : boost::make_optional(message.details)
                ));
            });
        }
    } catch (const std::system_error& err) {
        std::cerr << "ERROR: unable to register the URI: " << err.what() << std::endl;
        return 1;
    }

    std::string data;
    try {
        data = read(options.input);
    } catch (const std::system_error& err) {
        std::cerr << "ERROR: unable to read the input: " << err.what() << std::endl;
        return 1;
    }

    decoder_t decoder;
    size_t offset = 0;

    while (offset < data.size()) {
        boost::optional<message_t> message;
        std::error_code ec;

        offset += decoder.decode(data.data() + offset, data.size() - offset, message, ec);

        if (ec) {
            std::cerr << "ERROR: unable to decode the frame at offset " << offset << ": " << ec.message()
                      << std::endl;
            return 1;
        }

        try {
            describe(registry, *message);
        } catch (const invalid_message& err) {
            std::cerr << "ERROR: " << err.what() << std::endl;
        }
    }

    return 0;
}
