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
#ifndef _COURIER_EXECUTION_SERVICE_HPP
#define _COURIER_EXECUTION_SERVICE_HPP

#include <chrono>
#include <string>
#include "courier_fwd.hpp"
#include "identity.hpp"
#include "protocol.hpp"
#include "transfer_status.hpp"

namespace courier {

struct start_request
{
	/* The remote end. */
	std::string destination;
	/* The file in the storage system. */
	std::string path;
	/* Is data coming into the storage system? */
	bool is_store;
	protocol_descriptor protocol;
	subject identity;
	restriction restrictions;
};

/*
** The service that actually moves the data. Calls may be made from
** any thread.
*/
class execution_service
{
public:
	virtual ~execution_service() = default;

	/*
	** Begin a transfer, returning the id the service assigned it.
	**
	** Throws service_unavailable_error if the service couldn't be reached or
	** didn't answer in time, and transfer_rejected_error if it declined.
	*/
	virtual transfer_id start_transfer(const start_request& request) = 0;

	/* Ask the service to abort a transfer. Throws on failure, as above. */
	virtual void cancel_transfer(transfer_id id, const std::string& explanation) = 0;

	/* Throws service_unavailable_error if no reply arrived within timeout. */
	virtual status_reply query_status(transfer_id id, std::chrono::milliseconds timeout) = 0;
};

/* Receives the terminal notifications the execution service pushes. */
class notification_listener
{
public:
	virtual ~notification_listener() = default;

	virtual void transfer_complete(transfer_id id) = 0;
	virtual void transfer_failed(transfer_id id, const std::string& error) = 0;

	/*
	** No further notifications can arrive, e.g. the broker connection
	** has dropped. Every transfer waiting on one must be failed.
	*/
	virtual void service_lost(const std::string& reason) = 0;
};

}

#endif /* _COURIER_EXECUTION_SERVICE_HPP */
