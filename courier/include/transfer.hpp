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
#ifndef _COURIER_TRANSFER_HPP
#define _COURIER_TRANSFER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include "courier_fwd.hpp"
#include "identity.hpp"
#include "protocol.hpp"
#include "transfer_status.hpp"

namespace courier {

/*
** A client's request to move a file to or from some remote server.
**
** The thread that calls await_completion() drives the performance markers
** and watches the client connection; closing it is how the client asks for
** the transfer to be cancelled. success() and failure() may be called from
** any thread.
*/
class transfer
{
public:
	enum class state_t { created, started, running, succeeded, failed };

	/*
	** Throws unsupported_scheme_error or unsupported_credential_error if
	** destination can't be reached with cred.
	*/
	transfer(
		execution_service& service,
		client_channel& channel,
		subject identity,
		restriction restrictions,
		std::string path,
		std::string destination,
		credential cred,
		transfer_flags flags,
		header_map headers,
		direction_t direction,
		std::chrono::milliseconds marker_period
	);

	transfer(const transfer&) = delete;
	transfer(transfer&&) = delete;
	transfer& operator=(const transfer&) = delete;
	transfer& operator=(transfer&&) = delete;

	/* Ask the execution service to begin. Nothing is retained on failure. */
	transfer_id start();

	/* Send markers until success() or failure() is called, then the final line. */
	void await_completion();

	void success();
	void failure(const std::string& explanation);

	transfer_id id() const noexcept;
	direction_t direction() const noexcept;
	transfer_type type() const noexcept;
	const protocol_descriptor& descriptor() const noexcept;

	state_t state() const;
	bool finished() const;
	std::optional<std::string> problem() const;

private:
	status_reply query_status();
	void send_marker(const status_reply& status);
	void check_client_connected();
	bool finish(std::optional<std::string>&& problem);

	execution_service& m_service;
	client_channel& m_channel;
	const subject m_identity;
	const restriction m_restrictions;
	const std::string m_path;
	const std::string m_destination;
	const direction_t m_direction;
	const std::chrono::milliseconds m_marker_period;
	const protocol_descriptor m_descriptor;

	transfer_id m_id;

	mutable std::mutex m_mutex;
	std::condition_variable m_cv;
	state_t m_state;
	bool m_finished;
	std::optional<std::string> m_problem;
};

const char *to_string(transfer::state_t state) noexcept;

}

#endif /* _COURIER_TRANSFER_HPP */
