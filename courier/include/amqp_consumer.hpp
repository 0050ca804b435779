/*
 * Courier Transfer Orchestrator
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright (c) 2019 The University of Queensland
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef _COURIER_AMQP_CONSUMER_HPP
#define _COURIER_AMQP_CONSUMER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <future>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <queue>
#include <string_view>
#include <amqp.h>
#include "blockingconcurrentqueue.h"
#include "amqp_exception.hpp"
#include "uuid.hpp"
#include "messages/netmsg.hpp"

namespace courier {

/*
** The orchestrator's end of the broker connection.
**
** Only onactivity() touches the connection, and it must always be called
** from the same (network) thread. send_message() and get_message() may be
** called from anywhere.
*/
class amqp_consumer
{
public:
	enum class send_result_t { none, ack, returned };

	amqp_consumer(
		amqp_connection_state_t conn,
		amqp_channel_t channel,
		std::string_view user,
		std::string_view routing_key,
		std::string_view direct
	);
	amqp_consumer(const amqp_consumer&) = delete;
	amqp_consumer(amqp_consumer&&) noexcept = delete;
	~amqp_consumer() noexcept;

	amqp_consumer& operator=(const amqp_consumer&) = delete;
	amqp_consumer& operator=(amqp_consumer&&) noexcept = delete;

	/*
	** Queue a message for publishing to the execution service. The future is
	** satisfied when the broker confirms it, or returns it as unroutable.
	*/
	std::future<send_result_t> send_message(net::message_container&& msg);

	/* Wait up to timeout for a message to arrive. */
	std::optional<net::message_container> get_message(std::chrono::milliseconds timeout);

	std::string_view queue_name() const noexcept;

	/* Process whatever the broker has sent, then flush the send queue. */
	void onactivity();

	int getsockfd();

	/* Is there input already read off the socket? */
	bool has_buffered_input() const noexcept;

	/*
	** Fail any unconfirmed sends. Call once the network thread has stopped,
	** anything sent afterwards fails straight away.
	*/
	void clear_waiting();

private:
	struct msgstate
	{
		net::message_container message;
		std::promise<send_result_t> promise;
		send_result_t state;
		uint64_t delivery_tag;
		courier::uuid message_id;
		courier::uuid correlation_id;
	};

	void write_message(msgstate& state);

	bool read_proc();
	int read_message(std::optional<net::message_container>& msg);

	void confirm(uint64_t tag, bool multiple, send_result_t result);

	amqp_connection_state_t m_connection;
	amqp_channel_t m_channel;

	std::string m_user;
	std::string m_routing_key;
	std::string m_direct;

	std::string m_queue_name;

	/* Mutex on m_send_queue */
	std::mutex m_send_mutex;
	std::queue<msgstate> m_send_queue;
	bool m_closed;

	/* Published, awaiting confirmation. Network thread only. */
	std::list<msgstate> m_messages;
	uint64_t m_next_delivery_tag;

	moodycamel::BlockingConcurrentQueue<std::optional<net::message_container>> m_incoming;
};

/*
** Find the publish a basic.return refers to, by message id and then by
** correlation id. If the return carries neither, assume the oldest one that
** hasn't already been returned.
*/
template <typename Iterator>
Iterator match_return(Iterator begin, Iterator end, const amqp_basic_properties_t& props)
{
	auto unreturned = [](const auto& m) { return m.state != amqp_consumer::send_result_t::returned; };

	auto matching = [&](const amqp_bytes_t& bytes, auto member) {
		std::string_view id(reinterpret_cast<const char*>(bytes.bytes), bytes.len);
		return std::find_if(begin, end, [&](const auto& m) {
			return unreturned(m) && (m.*member).str() == id;
		});
	};

	using value_type = typename std::iterator_traits<Iterator>::value_type;

	if(props._flags & AMQP_BASIC_MESSAGE_ID_FLAG)
		return matching(props.message_id, &value_type::message_id);

	if(props._flags & AMQP_BASIC_CORRELATION_ID_FLAG)
		return matching(props.correlation_id, &value_type::correlation_id);

	return std::find_if(begin, end, unreturned);
}

/* netthread.cpp */

/* One iteration of the network thread, waiting at most timeout for activity. */
void poll_network(amqp_consumer& amqp, std::chrono::milliseconds timeout);

}
#endif /* _COURIER_AMQP_CONSUMER_HPP */
