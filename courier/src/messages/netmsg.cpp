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
#include <cstdint>
#include "messages/netmsg.hpp"

using namespace courier;
using namespace courier::net;

const char *net::get_message_type_string(message_type type) noexcept
{
	switch(type)
	{
		case message_type::transfer_start: return "transfer.start";
		case message_type::transfer_cancel: return "transfer.cancel";
		case message_type::transfer_query: return "transfer.query";
		case message_type::transfer_started: return "transfer.started";
		case message_type::transfer_cancelled: return "transfer.cancelled";
		case message_type::transfer_status: return "transfer.status";
		case message_type::transfer_error: return "transfer.error";
		case message_type::transfer_complete: return "transfer.complete";
		case message_type::transfer_failed: return "transfer.failed";
	}

	return nullptr;
}

message_type message_container::type() const noexcept
{
	return std::visit([](auto&& m) { return m.type(); }, static_cast<const msg_union&>(*this));
}

courier::uuid message_container::uuid() const noexcept
{
	return std::visit([](auto&& msg) { return msg.uuid(); }, static_cast<const msg_union&>(*this));
}

bool message_container::is_reply() const noexcept
{
	switch(this->type())
	{
		case message_type::transfer_started:
		case message_type::transfer_cancelled:
		case message_type::transfer_status:
		case message_type::transfer_error:
			return true;
		default:
			return false;
	}
}
