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
#ifndef _COURIER_ORCHESTRATOR_HPP
#define _COURIER_ORCHESTRATOR_HPP

#include <chrono>
#include <string>
#include <string_view>
#include "courier_fwd.hpp"
#include "credential.hpp"
#include "execution_service.hpp"
#include "identity.hpp"
#include "transfer_registry.hpp"
#include "transfer_types.hpp"

namespace courier {

/*
** Accepts third-party transfer requests, hands them to the execution
** service and reports their progress to the client with performance markers.
**
** Once the transfer has completed successfully, "success: Created" is
** reported. On failure "failure: <explanation>" is.
*/
class orchestrator : public notification_listener
{
public:
	orchestrator(execution_service& service, std::chrono::milliseconds marker_period, std::chrono::seconds notification_grace);

	orchestrator(const orchestrator&) = delete;
	orchestrator& operator=(const orchestrator&) = delete;

	/*
	** Perform a transfer, blocking until it finishes.
	**
	** Throws a transfer_error (permission denied, unsupported scheme or
	** credential, service unavailable, rejected) if the transfer couldn't be
	** started; nothing is written to the channel in that case. Otherwise the
	** outcome is reported on the channel, and returned.
	*/
	bool accept_request(
		client_channel& channel,
		const header_map& request_headers,
		const subject& identity,
		const restriction& restrictions,
		const std::string& path,
		std::string_view remote,
		const credential& cred,
		direction_t direction,
		bool require_verification
	);

	void transfer_complete(transfer_id id) override;
	void transfer_failed(transfer_id id, const std::string& error) override;
	void service_lost(const std::string& reason) override;

	transfer_registry& registry() noexcept;
	std::chrono::milliseconds marker_period() const noexcept;

private:
	execution_service& m_service;
	const std::chrono::milliseconds m_marker_period;
	transfer_registry m_registry;
};

}

#endif /* _COURIER_ORCHESTRATOR_HPP */
