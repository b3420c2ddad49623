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
#include <memory>
#include <utility>

#include "wamp/message.hpp"
#include "wamp/uri.hpp"
#include "wamp/value.hpp"

namespace wamp {

/*!
 * The subscription event class represents a single publication delivered to a subscriber.
 *
 * It only carries already decoded publication data and provides a way to unsubscribe from the
 * topic through the client given, there is no need to manage its lifetime.
 *
 * The client type must provide `unsubscribe(const uri_t&)` method, the result of which is returned
 * as is by \sa unsubscribe.
 */
template<class Client>
class subscription_event {
public:
    typedef Client client_type;

private:
    std::shared_ptr<client_type> client_;

    uri_t topic;
    std::uint64_t publication_id_;

    array_t args_;
    object_t kwargs_;
    object_t details_;

public:
    /// Constructs the event.
    ///
    /// \param client client used to unsubscribe.
    /// \param message event message.
    /// \param topic subscribed topic URI.
    subscription_event(std::shared_ptr<client_type> client, const event_message_t& message, uri_t topic) :
        client_(std::move(client)),
        topic(std::move(topic)),
        publication_id_(message.publication_id),
        args_(message.args),
        kwargs_(message.kwargs),
        details_(message.details)
    {}

    const std::shared_ptr<client_type>&
    client() const noexcept {
        return client_;
    }

    std::uint64_t
    publication_id() const noexcept {
        return publication_id_;
    }

    /// Returns the topic URI the subscription was made for.
    const uri_t&
    subscribed_topic() const noexcept {
        return topic;
    }

    const array_t&
    args() const noexcept {
        return args_;
    }

    const object_t&
    kwargs() const noexcept {
        return kwargs_;
    }

    const object_t&
    details() const noexcept {
        return details_;
    }

    /// Unsubscribes from the topic.
    auto
    unsubscribe() const -> decltype(std::declval<client_type&>().unsubscribe(std::declval<const uri_t&>())) {
        return client_->unsubscribe(topic);
    }
};

} // namespace wamp
