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
#include <ctime>
#include "courier_common.hpp"
#include "client_channel.hpp"
#include "errors.hpp"
#include "execution_service.hpp"
#include "marker.hpp"
#include "transfer.hpp"

using namespace courier;

transfer::transfer(
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
) :
	m_service(service),
	m_channel(channel),
	m_identity(std::move(identity)),
	m_restrictions(std::move(restrictions)),
	m_path(std::move(path)),
	m_destination(std::move(destination)),
	m_direction(direction),
	m_marker_period(marker_period),
	m_descriptor(build_protocol_descriptor(m_destination, direction, cred, headers, flags)),
	m_id(0),
	m_state(state_t::created),
	m_finished(false),
	m_problem()
{}

transfer_id transfer::start()
{
	start_request request{
		m_destination,
		m_path,
		m_direction == direction_t::pull,
		m_descriptor,
		m_identity,
		m_restrictions
	};

	try
	{
		m_id = m_service.start_transfer(request);
	}
	catch(service_unavailable_error& e)
	{
		log::error("XFER", "Failed to send request to transfer service: %s", e.reason());
		throw;
	}
	catch(transfer_rejected_error& e)
	{
		log::error("XFER", "Error from transfer service: %s", e.explanation());
		throw;
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_state = state_t::started;
	}

	log::debug("XFER", "Started %s of %s with %s as transfer %d", to_string(m_direction), m_path, m_destination, m_id);
	return m_id;
}

void transfer::await_completion()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if(m_state == state_t::started)
			m_state = state_t::running;
	}

	/* Always at least one marker, even if we've already finished. */
	for(;;)
	{
		send_marker(query_status());
		check_client_connected();

		std::unique_lock<std::mutex> lock(m_mutex);
		if(m_cv.wait_for(lock, m_marker_period, [this]() { return m_finished; }))
			break;
	}

	write_terminal_line(m_channel.stream(), problem());
}

status_reply transfer::query_status()
{
	try
	{
		return m_service.query_status(m_id, m_marker_period / 2);
	}
	catch(service_unavailable_error& e)
	{
		log::warn("XFER", "Failed to fetch information for progress marker: %s", e.reason());
	}
	catch(transfer_error& e)
	{
		log::warn("XFER", "Failed to fetch information for progress marker: %s", e.what());
	}

	return status_reply{};
}

void transfer::send_marker(const status_reply& status)
{
	write_perf_marker(m_channel.stream(), std::time(nullptr), status);
}

/*
** If the client has hung up, ask for the transfer to be killed. If that fails
** the markers keep going, and the next one will try again.
*/
void transfer::check_client_connected()
{
	if(m_channel.is_open())
		return;

	log::info("XFER", "Client went away, cancelling transfer %d", m_id);
	try
	{
		m_service.cancel_transfer(m_id, "client went away");
	}
	catch(service_unavailable_error& e)
	{
		log::error("XFER", "Failed to cancel transfer id=%d: %s", m_id, e.reason());
	}
	catch(transfer_error& e)
	{
		log::error("XFER", "Failed to cancel transfer id=%d: %s", m_id, e.what());
	}
}

bool transfer::finish(std::optional<std::string>&& problem)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if(m_finished)
			return false;

		m_finished = true;
		m_problem = std::move(problem);
		m_state = m_problem ? state_t::failed : state_t::succeeded;
	}

	m_cv.notify_all();
	return true;
}

void transfer::success()
{
	if(!finish(std::nullopt))
		log::debug("XFER", "Ignoring repeated completion of transfer %d", m_id);
}

void transfer::failure(const std::string& explanation)
{
	if(!finish(explanation))
		log::debug("XFER", "Ignoring repeated failure of transfer %d: %s", m_id, explanation);
}

transfer_id transfer::id() const noexcept
{
	return m_id;
}

direction_t transfer::direction() const noexcept
{
	return m_direction;
}

transfer_type transfer::type() const noexcept
{
	return descriptor_type(m_descriptor);
}

const protocol_descriptor& transfer::descriptor() const noexcept
{
	return m_descriptor;
}

transfer::state_t transfer::state() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state;
}

bool transfer::finished() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_finished;
}

std::optional<std::string> transfer::problem() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_problem;
}

const char *courier::to_string(transfer::state_t state) noexcept
{
	switch(state)
	{
		case transfer::state_t::created: return "created";
		case transfer::state_t::started: return "started";
		case transfer::state_t::running: return "running";
		case transfer::state_t::succeeded: return "succeeded";
		case transfer::state_t::failed: return "failed";
	}

	return nullptr;
}
