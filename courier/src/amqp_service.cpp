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
#include "courier_common.hpp"
#include "amqp_consumer.hpp"
#include "errors.hpp"
#include "amqp_service.hpp"

using namespace courier;

amqp_execution_service::amqp_execution_service(amqp_consumer& amqp, std::chrono::milliseconds start_timeout, std::chrono::milliseconds cancel_timeout) :
	m_amqp(amqp),
	m_start_timeout(start_timeout),
	m_cancel_timeout(cancel_timeout)
{}

transfer_id amqp_execution_service::start_transfer(const start_request& request)
{
	net::message_container reply = this->request(
		net::start_message(uuid(), m_amqp.queue_name(), request),
		m_start_timeout
	);

	switch(reply.type())
	{
		case net::message_type::transfer_started:
			return reply.get<net::started_message>().id();
		case net::message_type::transfer_error:
			throw transfer_rejected_error(reply.get<net::error_message>().error());
		default:
			break;
	}

	log::error("AMQPS", "Unexpected %s in reply to transfer.start", net::get_message_type_string(reply.type()));
	throw service_unavailable_error("unexpected reply");
}

void amqp_execution_service::cancel_transfer(transfer_id id, const std::string& explanation)
{
	net::message_container reply = this->request(
		net::cancel_message(uuid(), m_amqp.queue_name(), id, explanation),
		m_cancel_timeout
	);

	switch(reply.type())
	{
		case net::message_type::transfer_cancelled:
			return;
		case net::message_type::transfer_error:
			throw transfer_error(500, reply.get<net::error_message>().error());
		default:
			break;
	}

	log::error("AMQPS", "Unexpected %s in reply to transfer.cancel", net::get_message_type_string(reply.type()));
	throw service_unavailable_error("unexpected reply");
}

status_reply amqp_execution_service::query_status(transfer_id id, std::chrono::milliseconds timeout)
{
	net::message_container reply = this->request(
		net::query_message(uuid(), m_amqp.queue_name(), id),
		timeout
	);

	switch(reply.type())
	{
		case net::message_type::transfer_status:
			return reply.get<net::status_message>().status();
		case net::message_type::transfer_error:
			throw transfer_error(500, reply.get<net::error_message>().error());
		default:
			break;
	}

	log::error("AMQPS", "Unexpected %s in reply to transfer.query", net::get_message_type_string(reply.type()));
	throw service_unavailable_error("unexpected reply");
}

net::message_container amqp_execution_service::request(net::message_container&& msg, std::chrono::milliseconds timeout)
{
	auto deadline = std::chrono::steady_clock::now() + timeout;
	courier::uuid correlation = msg.uuid();
	const char *type = net::get_message_type_string(msg.type());

	reply_future reply;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		reply = m_pending[correlation].get_future();
	}

	auto forgetter = [this, &correlation]() { forget(correlation); };
	auto pending_remover = make_protector(forgetter);

	std::future<amqp_consumer::send_result_t> sent = m_amqp.send_message(std::move(msg));

	try
	{
		if(sent.wait_until(deadline) != std::future_status::ready)
		{
			log::warn("AMQPS", "Broker didn't confirm %s in time", type);
			throw service_unavailable_error("no confirmation from broker");
		}

		if(sent.get() == amqp_consumer::send_result_t::returned)
		{
			log::warn("AMQPS", "Broker returned %s, no transfer service active", type);
			throw service_unavailable_error("no route to transfer service");
		}

		if(reply.wait_until(deadline) != std::future_status::ready)
		{
			log::warn("AMQPS", "No reply to %s within %d ms", type, timeout.count());
			throw service_unavailable_error("timed out waiting for reply");
		}

		return reply.get();
	}
	catch(std::future_error& e)
	{
		/* The network thread has gone away. */
		log::error("AMQPS", "Lost %s: %s", type, e.what());
		throw service_unavailable_error("connection to broker lost");
	}
}

void amqp_execution_service::forget(const courier::uuid& correlation)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_pending.erase(correlation);
}

void amqp_execution_service::dispatch(net::message_container&& msg, notification_listener& listener)
{
	if(msg.is_reply())
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto it = m_pending.find(msg.uuid());
		if(it == m_pending.end())
		{
			/* Its requester has given up. */
			log::debug("AMQPS", "Dropping late %s", net::get_message_type_string(msg.type()));
			return;
		}

		it->second.set_value(std::move(msg));
		m_pending.erase(it);
		return;
	}

	switch(msg.type())
	{
		case net::message_type::transfer_complete:
			listener.transfer_complete(msg.get<net::complete_message>().id());
			break;
		case net::message_type::transfer_failed:
		{
			const net::failed_message& failed = msg.get<net::failed_message>();
			listener.transfer_failed(failed.id(), failed.error());
			break;
		}
		default:
			log::warn("AMQPS", "Ignoring unexpected %s", net::get_message_type_string(msg.type()));
			break;
	}
}

void amqp_execution_service::run_dispatcher(notification_listener& listener, const std::atomic_bool& done)
{
	log::info("AMQPD", "AMQP Message Dispatcher, starting up...");
	while(!done)
	{
		std::optional<net::message_container> msg = m_amqp.get_message(std::chrono::milliseconds(100));
		if(msg)
			dispatch(std::move(*msg), listener);
	}
	log::info("AMQPD", "This is AMQP Message Dispatcher, signing off...");
}
