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
#include "errors.hpp"
#include "protocol.hpp"
#include "transfer.hpp"
#include "orchestrator.hpp"

using namespace courier;

orchestrator::orchestrator(execution_service& service, std::chrono::milliseconds marker_period, std::chrono::seconds notification_grace) :
	m_service(service),
	m_marker_period(marker_period),
	m_registry(notification_grace)
{}

bool orchestrator::accept_request(
	client_channel& channel,
	const header_map& request_headers,
	const subject& identity,
	const restriction& restrictions,
	const std::string& path,
	std::string_view remote,
	const credential& cred,
	direction_t direction,
	bool require_verification
)
{
	/* A pull writes into storage, a push reads out of it. */
	restriction::activity_t activity = direction == direction_t::pull
		? restriction::activity_t::upload
		: restriction::activity_t::download;

	if(restrictions.is_restricted(activity, path))
	{
		log::info("ORCH", "Denied %s of %s for %s", to_string(activity), path, identity.name);
		throw permission_denied_error("Permission denied");
	}

	log::debug("ORCH", "%s of %s for %s, %s: %s", to_string(direction), path, identity.name, header_name(direction), remote);

	transfer_flags flags = require_verification ? flag_require_verification : flag_none;

	transfer t(
		m_service,
		channel,
		identity,
		restrictions,
		path,
		std::string(remote),
		cred,
		flags,
		filter_transfer_headers(request_headers),
		direction,
		m_marker_period
	);

	transfer_id id = t.start();

	if(!m_registry.put(id, &t))
	{
		/*
		** Shouldn't happen, ids are unique among live transfers. The id
		** belongs to the other one, so leave it be.
		*/
		log::error("ORCH", "Transfer service reused live transfer id %d", id);
		throw service_unavailable_error("duplicate transfer id");
	}

	/* Make sure the transfer is unregistered before it is destroyed. */
	auto unregister = [this, id]() { m_registry.remove(id); };
	auto unregisterer = make_protector(unregister);

	t.await_completion();

	std::optional<std::string> problem = t.problem();
	if(problem)
		log::info("ORCH", "Transfer %d failed: %s", id, *problem);
	else
		log::info("ORCH", "Transfer %d complete", id);

	return !problem;
}

void orchestrator::transfer_complete(transfer_id id)
{
	m_registry.notify_complete(id);
}

void orchestrator::transfer_failed(transfer_id id, const std::string& error)
{
	m_registry.notify_failed(id, error);
}

void orchestrator::service_lost(const std::string& reason)
{
	log::error("ORCH", "Lost the transfer service: %s", reason);
	m_registry.fail_all(reason);
}

transfer_registry& orchestrator::registry() noexcept
{
	return m_registry;
}

std::chrono::milliseconds orchestrator::marker_period() const noexcept
{
	return m_marker_period;
}
