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
#ifndef _COURIER_AMQP_EXCEPTION_HPP
#define _COURIER_AMQP_EXCEPTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <amqp.h>

namespace courier
{

/*
** A failure talking to the broker. what() is a complete description,
** suitable for the log.
*/
class amqp_exception : public std::runtime_error
{
public:
	/* Who raised it: rabbitmq-c itself, or the broker closing the connection or channel. */
	enum class source_t { library, connection, channel };

	source_t source() const noexcept;
	int code() const noexcept;
	uint16_t class_id() const noexcept;
	uint16_t method_id() const noexcept;

	/* Can the connection still be used? Only a closed channel leaves it intact. */
	bool connection_lost() const noexcept;

	static amqp_exception from_rpc_reply(const amqp_rpc_reply_t& r);
	static amqp_exception from_channel_close(const amqp_channel_close_t& c);
	static amqp_exception from_connection_close(const amqp_connection_close_t& c);
	static amqp_exception from_status(int status);

	/* A system call on the broker socket failed with err. */
	static amqp_exception from_errno(const char *call, int err);

	static void throw_if_bad(const amqp_rpc_reply_t& r);
	static void throw_if_bad(amqp_connection_state_t conn);

private:
	amqp_exception(const std::string& description, source_t source, int code, uint16_t c, uint16_t m);

	source_t m_source;
	int m_code;
	uint16_t m_class_id;
	uint16_t m_method_id;
};

}
#endif /* _COURIER_AMQP_EXCEPTION_HPP */
