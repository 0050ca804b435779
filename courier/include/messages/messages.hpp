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
#ifndef _COURIER_MESSAGES_MESSAGES_HPP
#define _COURIER_MESSAGES_MESSAGES_HPP

#include <string>
#include "base_message.hpp"
#include "execution_service.hpp"

namespace courier::net {

class start_message : public base_request<start_message>
{
public:
	const static message_type type_value = message_type::transfer_start;

	start_message(courier::uuid uuid, std::string_view reply_to, const start_request& request);
	start_message(courier::uuid uuid, std::string_view reply_to, start_request&& request);

	const start_request& request() const noexcept;

private:
	start_request m_request;
};

class cancel_message : public base_request<cancel_message>
{
public:
	const static message_type type_value = message_type::transfer_cancel;

	cancel_message(courier::uuid uuid, std::string_view reply_to, transfer_id id, std::string_view explanation);

	transfer_id id() const noexcept;
	const std::string& explanation() const noexcept;

private:
	transfer_id m_id;
	std::string m_explanation;
};

class query_message : public base_request<query_message>
{
public:
	const static message_type type_value = message_type::transfer_query;

	query_message(courier::uuid uuid, std::string_view reply_to, transfer_id id) noexcept;

	transfer_id id() const noexcept;

private:
	transfer_id m_id;
};

/* Reply to start_message. */
class started_message : public base_message<started_message>
{
public:
	const static message_type type_value = message_type::transfer_started;

	started_message(courier::uuid uuid, transfer_id id) noexcept;

	transfer_id id() const noexcept;

private:
	transfer_id m_id;
};

/* Reply to cancel_message. */
class cancelled_message : public base_message<cancelled_message>
{
public:
	const static message_type type_value = message_type::transfer_cancelled;

	cancelled_message(courier::uuid uuid, transfer_id id) noexcept;

	transfer_id id() const noexcept;

private:
	transfer_id m_id;
};

/* Reply to query_message. */
class status_message : public base_message<status_message>
{
public:
	const static message_type type_value = message_type::transfer_status;

	status_message(courier::uuid uuid, const status_reply& status);

	const status_reply& status() const noexcept;

private:
	status_reply m_status;
};

/* Negative reply to any request. */
class error_message : public base_message<error_message>
{
public:
	const static message_type type_value = message_type::transfer_error;

	error_message(courier::uuid uuid, std::string_view error);

	const std::string& error() const noexcept;

private:
	std::string m_error;
};

class complete_message : public base_message<complete_message>
{
public:
	const static message_type type_value = message_type::transfer_complete;

	complete_message(courier::uuid uuid, transfer_id id) noexcept;

	transfer_id id() const noexcept;

private:
	transfer_id m_id;
};

class failed_message : public base_message<failed_message>
{
public:
	const static message_type type_value = message_type::transfer_failed;

	failed_message(courier::uuid uuid, transfer_id id, std::string_view error);

	transfer_id id() const noexcept;
	const std::string& error() const noexcept;

private:
	transfer_id m_id;
	std::string m_error;
};

}

#endif /* _COURIER_MESSAGES_MESSAGES_HPP */
