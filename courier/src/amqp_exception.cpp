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
#include <cstring>
#include <fmt/format.h>
#include "courier_common.hpp"
#include "amqp_exception.hpp"

using namespace courier;

amqp_exception::amqp_exception(const std::string& description, source_t source, int code, uint16_t c, uint16_t m) :
	std::runtime_error(description),
	m_source(source),
	m_code(code),
	m_class_id(c),
	m_method_id(m)
{}

amqp_exception::source_t amqp_exception::source() const noexcept { return m_source; }

int amqp_exception::code() const noexcept { return m_code; }

uint16_t amqp_exception::class_id() const noexcept { return m_class_id; }

uint16_t amqp_exception::method_id() const noexcept { return m_method_id; }

bool amqp_exception::connection_lost() const noexcept { return m_source != source_t::channel; }

amqp_exception amqp_exception::from_rpc_reply(const amqp_rpc_reply_t& r)
{
	switch(r.reply_type)
	{
		case AMQP_RESPONSE_LIBRARY_EXCEPTION:
			if(r.library_error == 0)
				return amqp_exception("AMQP library error: end-of-stream", source_t::library, 0, 0, 0);

			return from_status(r.library_error);

		case AMQP_RESPONSE_SERVER_EXCEPTION:
			if(r.reply.id == AMQP_CONNECTION_CLOSE_METHOD)
				return from_connection_close(*reinterpret_cast<amqp_connection_close_t*>(r.reply.decoded));
			else if(r.reply.id == AMQP_CHANNEL_CLOSE_METHOD)
				return from_channel_close(*reinterpret_cast<amqp_channel_close_t*>(r.reply.decoded));

			return amqp_exception(
				fmt::format("AMQP server sent unexpected {}", amqp_method_name(r.reply.id)),
				source_t::connection,
				AMQP_STATUS_UNEXPECTED_STATE,
				0,
				0
			);

		case AMQP_RESPONSE_NONE:
		case AMQP_RESPONSE_NORMAL:
			break;
	}

	return amqp_exception("AMQP reply missing", source_t::library, AMQP_STATUS_UNEXPECTED_STATE, 0, 0);
}

amqp_exception amqp_exception::from_channel_close(const amqp_channel_close_t& info)
{
	return amqp_exception(
		fmt::format("AMQP channel closed (code={}, class={}, method={}): {}",
			info.reply_code, info.class_id, info.method_id, amqp_bytes_to_string(info.reply_text)),
		source_t::channel,
		info.reply_code,
		info.class_id,
		info.method_id
	);
}

amqp_exception amqp_exception::from_connection_close(const amqp_connection_close_t& info)
{
	return amqp_exception(
		fmt::format("AMQP connection closed (code={}, class={}, method={}): {}",
			info.reply_code, info.class_id, info.method_id, amqp_bytes_to_string(info.reply_text)),
		source_t::connection,
		info.reply_code,
		info.class_id,
		info.method_id
	);
}

amqp_exception amqp_exception::from_status(int status)
{
	return amqp_exception(
		fmt::format("AMQP library error {}: {}", status, amqp_error_string2(status)),
		source_t::library,
		status,
		0,
		0
	);
}

amqp_exception amqp_exception::from_errno(const char *call, int err)
{
	return amqp_exception(
		fmt::format("{}() on broker socket failed: {}", call, strerror(err)),
		source_t::library,
		AMQP_STATUS_SOCKET_ERROR,
		0,
		0
	);
}

void amqp_exception::throw_if_bad(const amqp_rpc_reply_t& r)
{
	if(r.reply_type != AMQP_RESPONSE_NORMAL)
		throw from_rpc_reply(r);
}

void amqp_exception::throw_if_bad(amqp_connection_state_t conn)
{
	return throw_if_bad(amqp_get_rpc_reply(conn));
}
