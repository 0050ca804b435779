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
#include <cinttypes>
#include <cstring>
#include <sys/time.h>
#include "courier_common.hpp"
#include "amqp_consumer.hpp"

using namespace std::string_view_literals;

using namespace courier;

/* Application Id. */
constexpr static std::string_view appid = "courier"sv;

static constexpr amqp_bytes_t make_bytes(std::string_view s) noexcept
{
	return amqp_bytes_t{ s.size(), const_cast<char*>(s.data()) };
}

amqp_consumer::~amqp_consumer() noexcept
{
	if(m_connection != nullptr)
		amqp_channel_close(m_connection, m_channel, AMQP_REPLY_SUCCESS);
}

amqp_consumer::amqp_consumer(
	amqp_connection_state_t conn,
	amqp_channel_t channel,
	std::string_view user,
	std::string_view routing_key,
	std::string_view direct
) :
	m_connection(conn),
	m_channel(channel),
	m_user(user),
	m_routing_key(routing_key),
	m_direct(direct),
	m_closed(false),
	m_next_delivery_tag(1)
{
	try
	{
		(void)amqp_channel_open(conn, channel);
		amqp_exception::throw_if_bad(conn);

		/* Publisher confirms, so we know when the service can't be reached. */
		(void)amqp_confirm_select(conn, channel);
		amqp_exception::throw_if_bad(conn);

		amqp_queue_declare_ok_t *declare_ok = amqp_queue_declare(
			conn,
			channel,
			amqp_empty_bytes,	/* Let the server generate a name */
			0,					/* Active */
			0,					/* Non-durable */
			1,					/* Exclusive */
			1,					/* Auto-Delete */
			amqp_empty_table
		);
		amqp_exception::throw_if_bad(conn);

		m_queue_name = amqp_bytes_to_string(declare_ok->queue);
		amqp_bytes_t queue_bytes = make_bytes(m_queue_name);

		(void)amqp_queue_bind(
			conn,
			channel,
			queue_bytes,
			make_bytes(m_direct),
			queue_bytes,
			amqp_empty_table
		);
		amqp_exception::throw_if_bad(conn);

		/* Say that we want our messages asynchronously */
		(void)amqp_basic_consume(
			conn,
			channel,
			queue_bytes,
			amqp_empty_bytes,
			0,
			0,
			1,
			amqp_empty_table
		);
		amqp_exception::throw_if_bad(conn);
	}
	catch(amqp_exception&)
	{
		/* This is all we need to do, everything else should be auto-deleted. */
		amqp_channel_close(conn, channel, AMQP_INTERNAL_ERROR);
		throw;
	}

	log::debug("AMQPC", "Listening on queue %s", m_queue_name);
}

std::future<amqp_consumer::send_result_t> amqp_consumer::send_message(net::message_container&& msg)
{
	courier::uuid correlation = msg.uuid();
	msgstate state{std::move(msg), {}, send_result_t::none, 0, courier::uuid(), correlation};

	/* Keep this lock outside, we don't want the message being sent until we've retrieved the future. */
	std::lock_guard<std::mutex> lock(m_send_mutex);
	auto future = state.promise.get_future();

	/* Nobody's left to send it, the promise breaks on the way out. */
	if(m_closed)
		return future;

	m_send_queue.push(std::move(state));
	return future;
}

std::optional<net::message_container> amqp_consumer::get_message(std::chrono::milliseconds timeout)
{
	std::optional<net::message_container> msg;
	if(!m_incoming.wait_dequeue_timed(msg, timeout))
		return std::nullopt;

	return msg;
}

std::string_view amqp_consumer::queue_name() const noexcept
{
	return m_queue_name;
}

void amqp_consumer::write_message(msgstate& state)
{
	const net::message_container& msg = state.message;
	std::string s = net::message_write(msg);

	uuid::uuid_string_type correlation;
	state.correlation_id.str(correlation, sizeof(correlation));

	uuid::uuid_string_type message_id;
	state.message_id.str(message_id, sizeof(message_id));

	// https://github.com/alanxz/rabbitmq-c/blob/master/examples/amqp_sendstring.c
	amqp_basic_properties_t props;
	memset(&props, 0, sizeof(props));

	props._flags			= AMQP_BASIC_DELIVERY_MODE_FLAG
							| AMQP_BASIC_CONTENT_TYPE_FLAG
							| AMQP_BASIC_CONTENT_ENCODING_FLAG
							| AMQP_BASIC_TYPE_FLAG
							| AMQP_BASIC_TIMESTAMP_FLAG
							| AMQP_BASIC_USER_ID_FLAG
							| AMQP_BASIC_APP_ID_FLAG
							| AMQP_BASIC_MESSAGE_ID_FLAG
							| AMQP_BASIC_CORRELATION_ID_FLAG
							| AMQP_BASIC_REPLY_TO_FLAG
							;

	props.delivery_mode		= 1; /* Transient, stale requests are useless. */
	props.content_type		= make_bytes(net::message_content_type()); /* Same as HTTP "Content-Type" */
	props.content_encoding	= make_bytes("identity"); /* Same as HTTP "Content-Encoding" */
	props.type				= make_bytes(net::get_message_type_string(msg.type()));
	props.timestamp			= static_cast<uint64_t>(time(nullptr)); /* AMQP assumes this is in seconds. */
	props.user_id			= make_bytes(m_user);
	props.app_id			= make_bytes(appid);
	props.message_id		= make_bytes(std::string_view(message_id, uuid::string_length));
	props.correlation_id	= make_bytes(std::string_view(correlation, uuid::string_length));
	props.reply_to			= make_bytes(m_queue_name);

	int ret = amqp_basic_publish(
		m_connection,
		m_channel,
		make_bytes(m_direct),
		make_bytes(m_routing_key),
		1,	/* Mandatory */
		0,	/* Not immediate */
		&props,
		make_bytes(s)
	);

	if(ret != AMQP_STATUS_OK)
		throw amqp_exception::from_status(ret);

	state.delivery_tag = m_next_delivery_tag++;
	log::trace("AMQPC", "Published %s(%s), delivery tag %" PRIu64, net::get_message_type_string(msg.type()), correlation, state.delivery_tag);
}

void amqp_consumer::onactivity()
{
	while(read_proc())
		;

	/* Try to send any pending messages. */
	std::lock_guard<std::mutex> lock(m_send_mutex);
	while(!m_send_queue.empty())
	{
		msgstate u = std::move(m_send_queue.front());
		m_send_queue.pop();
		write_message(u);
		m_messages.emplace_back(std::move(u));
	}
}

int amqp_consumer::getsockfd()
{
	return amqp_get_sockfd(m_connection);
}

bool amqp_consumer::has_buffered_input() const noexcept
{
	return amqp_frames_enqueued(m_connection) || amqp_data_in_buffer(m_connection);
}

void amqp_consumer::clear_waiting()
{
	std::lock_guard<std::mutex> lock(m_send_mutex);
	m_closed = true;
	m_messages.clear();
	while(!m_send_queue.empty())
		m_send_queue.pop();
}

void amqp_consumer::confirm(uint64_t tag, bool multiple, send_result_t result)
{
	for(auto it = m_messages.begin(); it != m_messages.end();)
	{
		if(it->delivery_tag == tag || (multiple && it->delivery_tag < tag))
		{
			/* A return always wins over the ack that follows it. */
			it->promise.set_value(it->state == send_result_t::returned ? send_result_t::returned : result);
			it = m_messages.erase(it);
		}
		else
		{
			++it;
		}
	}
}

/*
** Read a network message from the broker.
**
** This should *only* be used immediately after receiving a AMQP_BASIC_DELIVER_METHOD frame.
**
** Returns:
** -  1 if the message isn't one of ours
** -  0 on success
** - -1 if the backend couldn't parse the message
*/
int amqp_consumer::read_message(std::optional<net::message_container>& msg)
{
	amqp_message_t _msg;
	amqp_rpc_reply_t ret = amqp_read_message(m_connection, m_channel, &_msg, 0);
	amqp_exception::throw_if_bad(ret);

	auto message_destroyer = [&_msg]() { amqp_destroy_message(&_msg); };
	auto destroyer = make_protector(message_destroyer);

	if(!(_msg.properties._flags & AMQP_BASIC_CONTENT_TYPE_FLAG))
		return 1;

	if(!starts_with_icase(make_view(_msg.properties.content_type), "application/json"sv))
		return 1;

	try
	{
		msg = net::message_read(reinterpret_cast<char*>(_msg.body.bytes), _msg.body.len);
	}
	catch(std::exception& e)
	{
		log::error("AMQPC", "Error parsing network message: %s", e.what());
		return -1;
	}

	return 0;
}

/* Returns true if a frame was processed. */
bool amqp_consumer::read_proc()
{
	amqp_maybe_release_buffers(m_connection);

	struct timeval tv{};

	amqp_frame_t frame;
	int waitStat = amqp_simple_wait_frame_noblock(m_connection, &frame, &tv);

	if(waitStat == AMQP_STATUS_TIMEOUT)
		return false;

	if(waitStat != AMQP_STATUS_OK)
		throw amqp_exception::from_status(waitStat);

	if(frame.frame_type != AMQP_FRAME_METHOD)
		return true;

	log::trace("AMQPC", "Received %s frame.", amqp_method_name(frame.payload.method.id));

	switch(frame.payload.method.id)
	{
		case AMQP_BASIC_ACK_METHOD:
		{
			amqp_basic_ack_t *ack = reinterpret_cast<amqp_basic_ack_t*>(frame.payload.method.decoded);
			confirm(ack->delivery_tag, ack->multiple, send_result_t::ack);
			break;
		}
		case AMQP_BASIC_NACK_METHOD:
		{
			amqp_basic_nack_t *nack = reinterpret_cast<amqp_basic_nack_t*>(frame.payload.method.decoded);
			log::warn("AMQPC", "Broker nack'd delivery tag %" PRIu64, nack->delivery_tag);
			confirm(nack->delivery_tag, nack->multiple, send_result_t::returned);
			break;
		}
		case AMQP_BASIC_RETURN_METHOD:
		{
			/* Only the properties are of use, we still have the original body. */
			amqp_message_t returned;
			amqp_exception::throw_if_bad(amqp_read_message(m_connection, frame.channel, &returned, 0));

			auto message_destroyer = [&returned]() { amqp_destroy_message(&returned); };
			auto destroyer = make_protector(message_destroyer);

			/* Returns always precede the confirm of the same message. */
			auto it = match_return(m_messages.begin(), m_messages.end(), returned.properties);
			if(it == m_messages.end())
			{
				log::trace("AMQPC", "Rogue basic.return");
				break;
			}

			it->state = send_result_t::returned;
			/* Don't erase it, we're expecting an ack */
			break;
		}
		case AMQP_BASIC_DELIVER_METHOD:
		{
			amqp_basic_deliver_t *del = reinterpret_cast<amqp_basic_deliver_t*>(frame.payload.method.decoded);

			std::optional<net::message_container> msg;
			int rstat = read_message(msg);
			int status;
			if(rstat == 0)
			{
				m_incoming.enqueue(std::move(msg));
				status = amqp_basic_ack(m_connection, frame.channel, del->delivery_tag, 0);
			}
			else
			{
				/* Not something we understand, drop it. */
				status = amqp_basic_reject(m_connection, frame.channel, del->delivery_tag, 0);
			}

			if(status != AMQP_STATUS_OK)
				throw amqp_exception::from_status(status);
			break;
		}
		case AMQP_CHANNEL_CLOSE_METHOD:
			throw amqp_exception::from_channel_close(*reinterpret_cast<amqp_channel_close_t*>(frame.payload.method.decoded));
		case AMQP_CONNECTION_CLOSE_METHOD:
			throw amqp_exception::from_connection_close(*reinterpret_cast<amqp_connection_close_t*>(frame.payload.method.decoded));
		default:
			break;
	}

	return true;
}
