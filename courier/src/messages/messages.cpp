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
#include "messages/messages.hpp"

using namespace courier;
using namespace courier::net;

start_message::start_message(courier::uuid uuid, std::string_view reply_to, const start_request& request) :
	request_base_type(uuid, reply_to),
	m_request(request)
{}

start_message::start_message(courier::uuid uuid, std::string_view reply_to, start_request&& request) :
	request_base_type(uuid, reply_to),
	m_request(std::move(request))
{}

const start_request& start_message::request() const noexcept
{
	return m_request;
}


cancel_message::cancel_message(courier::uuid uuid, std::string_view reply_to, transfer_id id, std::string_view explanation) :
	request_base_type(uuid, reply_to),
	m_id(id),
	m_explanation(explanation)
{}

transfer_id cancel_message::id() const noexcept
{
	return m_id;
}

const std::string& cancel_message::explanation() const noexcept
{
	return m_explanation;
}


query_message::query_message(courier::uuid uuid, std::string_view reply_to, transfer_id id) noexcept :
	request_base_type(uuid, reply_to),
	m_id(id)
{}

transfer_id query_message::id() const noexcept
{
	return m_id;
}


started_message::started_message(courier::uuid uuid, transfer_id id) noexcept :
	message_base_type(uuid),
	m_id(id)
{}

transfer_id started_message::id() const noexcept
{
	return m_id;
}


cancelled_message::cancelled_message(courier::uuid uuid, transfer_id id) noexcept :
	message_base_type(uuid),
	m_id(id)
{}

transfer_id cancelled_message::id() const noexcept
{
	return m_id;
}


status_message::status_message(courier::uuid uuid, const status_reply& status) :
	message_base_type(uuid),
	m_status(status)
{}

const status_reply& status_message::status() const noexcept
{
	return m_status;
}


error_message::error_message(courier::uuid uuid, std::string_view error) :
	message_base_type(uuid),
	m_error(error)
{}

const std::string& error_message::error() const noexcept
{
	return m_error;
}


complete_message::complete_message(courier::uuid uuid, transfer_id id) noexcept :
	message_base_type(uuid),
	m_id(id)
{}

transfer_id complete_message::id() const noexcept
{
	return m_id;
}


failed_message::failed_message(courier::uuid uuid, transfer_id id, std::string_view error) :
	message_base_type(uuid),
	m_id(id),
	m_error(error)
{}

transfer_id failed_message::id() const noexcept
{
	return m_id;
}

const std::string& failed_message::error() const noexcept
{
	return m_error;
}
