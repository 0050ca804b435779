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
#ifndef _COURIER_MESSAGES_BASE_MESSAGE_HPP
#define _COURIER_MESSAGES_BASE_MESSAGE_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include "uuid.hpp"

namespace courier::net {

enum class message_type
{
	transfer_start,
	transfer_cancel,
	transfer_query,
	transfer_started,
	transfer_cancelled,
	transfer_status,
	transfer_error,
	transfer_complete,
	transfer_failed
};

class start_message;
class cancel_message;
class query_message;
class started_message;
class cancelled_message;
class status_message;
class error_message;
class complete_message;
class failed_message;

class message_container;

const char *get_message_type_string(message_type type) noexcept;

/*
** A message exchanged with the execution service.
**
** For requests and their replies the uuid is the correlation id. For
** notifications it merely identifies the message.
*/
template <typename T>
class base_message
{
public:
	using message_base_type = base_message<T>;

	courier::uuid uuid() const noexcept { return m_uuid; }

	constexpr message_type type() const noexcept { return T::type_value; }

	explicit base_message(courier::uuid uuid) noexcept:
		m_uuid(uuid)
	{}

	friend class message_container;

private:
	courier::uuid m_uuid;
};

/* A message expecting a reply, sent to the queue named by reply_to(). */
template <typename T>
class base_request : public base_message<T>
{
public:
	using request_base_type = base_request<T>;

	base_request(courier::uuid uuid, std::string_view reply_to) :
		base_message<T>(uuid),
		m_reply_to(reply_to)
	{}

	const std::string& reply_to() const noexcept { return m_reply_to; }

private:
	std::string m_reply_to;
};

}
#endif /* _COURIER_MESSAGES_BASE_MESSAGE_HPP */
