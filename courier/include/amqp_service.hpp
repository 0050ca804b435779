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
#ifndef _COURIER_AMQP_SERVICE_HPP
#define _COURIER_AMQP_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include "execution_service.hpp"
#include "messages/netmsg.hpp"

namespace courier {

/*
** An execution service reached through the broker. Requests are published
** to the service's routing key and their replies matched up by correlation
** id. Replies and notifications are routed by run_dispatcher().
*/
class amqp_execution_service : public execution_service
{
public:
	amqp_execution_service(amqp_consumer& amqp, std::chrono::milliseconds start_timeout, std::chrono::milliseconds cancel_timeout);

	amqp_execution_service(const amqp_execution_service&) = delete;
	amqp_execution_service& operator=(const amqp_execution_service&) = delete;

	transfer_id start_transfer(const start_request& request) override;
	void cancel_transfer(transfer_id id, const std::string& explanation) override;
	status_reply query_status(transfer_id id, std::chrono::milliseconds timeout) override;

	/* Hand an incoming message to whoever is waiting for it. */
	void dispatch(net::message_container&& msg, notification_listener& listener);

	/* Dispatch messages until done is set. */
	void run_dispatcher(notification_listener& listener, const std::atomic_bool& done);

private:
	using reply_future = std::future<net::message_container>;

	/* Send a request and wait for its reply. Throws service_unavailable_error. */
	net::message_container request(net::message_container&& msg, std::chrono::milliseconds timeout);

	void forget(const courier::uuid& correlation);

	amqp_consumer& m_amqp;
	const std::chrono::milliseconds m_start_timeout;
	const std::chrono::milliseconds m_cancel_timeout;

	mutable std::mutex m_mutex;
	std::unordered_map<courier::uuid, std::promise<net::message_container>> m_pending;
};

}

#endif /* _COURIER_AMQP_SERVICE_HPP */
