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
#include <fmt/format.h>
#include <fmt/ostream.h>
#include "marker.hpp"

using namespace courier;

const char *courier::describe_state(int code) noexcept
{
	switch(static_cast<transfer_state>(code))
	{
		case transfer_state::initial: return "initialising";
		case transfer_state::waiting_for_metadata: return "waiting for file metadata";
		case transfer_state::received_metadata: return "received file metadata";
		case transfer_state::waiting_for_parent_metadata: return "waiting for parent directory metadata";
		case transfer_state::received_parent_metadata: return "received parent directory metadata";
		case transfer_state::waiting_for_entry_creation: return "waiting for namespace entry creation";
		case transfer_state::received_entry_creation: return "namespace entry created";
		case transfer_state::waiting_for_pool: return "waiting for pool selection";
		case transfer_state::received_pool: return "pool selected";
		case transfer_state::waiting_for_mover: return "waiting for mover";
		case transfer_state::received_mover: return "transfer in progress";
		case transfer_state::waiting_for_space: return "waiting for space reservation";
		case transfer_state::received_space: return "space reserved";
		case transfer_state::waiting_for_entry_delete: return "waiting for namespace entry deletion";
		case transfer_state::received_entry_delete: return "namespace entry deleted";
		case transfer_state::sent_error_reply: return "failed";
		case transfer_state::sent_success_reply: return "succeeded";
		case transfer_state::unknown_id: return "unknown transfer";
	}

	return "unrecognised state";
}

static int64_t ms_to_seconds(int64_t ms) noexcept
{
	return ms / 1000;
}

void courier::write_perf_marker(std::ostream& os, time_t now, const status_reply& status)
{
	fmt::print(os, "Perf Marker\n");
	fmt::print(os, "    Timestamp: {}\n", static_cast<int64_t>(now));
	fmt::print(os, "    State: {}\n", status.state);
	fmt::print(os, "    State description: {}\n", describe_state(status.state));
	fmt::print(os, "    Stripe Index: 0\n");
	if(const std::optional<mover_info>& info = status.mover)
	{
		fmt::print(os, "    Stripe Start Time: {}\n", ms_to_seconds(info->start_time));
		fmt::print(os, "    Stripe Last Transferred: {}\n", ms_to_seconds(info->last_transferred));
		fmt::print(os, "    Stripe Transfer Time: {}\n", ms_to_seconds(info->transfer_time));
		fmt::print(os, "    Stripe Bytes Transferred: {}\n", info->bytes_transferred);
		fmt::print(os, "    Stripe Status: {}\n", info->status);
	}
	fmt::print(os, "    Total Stripe Count: 1\n");
	fmt::print(os, "End\n");
	os.flush();
}

void courier::write_terminal_line(std::ostream& os, const std::optional<std::string>& problem)
{
	if(!problem)
		fmt::print(os, "success: Created\n");
	else
		fmt::print(os, "failure: {}\n", *problem);

	os.flush();
}
