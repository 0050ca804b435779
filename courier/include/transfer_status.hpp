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
#ifndef _COURIER_TRANSFER_STATUS_HPP
#define _COURIER_TRANSFER_STATUS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace courier {

/* State codes as reported by the execution service. */
enum class transfer_state : int
{
	initial						= 0,
	waiting_for_metadata		= 1,
	received_metadata			= 2,
	waiting_for_parent_metadata	= 3,
	received_parent_metadata	= 4,
	waiting_for_entry_creation	= 5,
	received_entry_creation		= 6,
	waiting_for_pool			= 7,
	received_pool				= 8,
	waiting_for_mover			= 9,
	received_mover				= 10,
	waiting_for_space			= 11,
	received_space				= 12,
	waiting_for_entry_delete	= 13,
	received_entry_delete		= 14,

	sent_error_reply			= -1,
	sent_success_reply			= -2,
	unknown_id					= -3
};

constexpr int to_code(transfer_state s) noexcept { return static_cast<int>(s); }

const char *describe_state(int code) noexcept;

/* What the mover doing the transfer last reported. Times are in milliseconds. */
struct mover_info
{
	int64_t start_time;
	int64_t last_transferred;
	int64_t transfer_time;
	int64_t bytes_transferred;
	std::string status;
};

struct status_reply
{
	int state = to_code(transfer_state::unknown_id);
	std::optional<mover_info> mover;
};

}

#endif /* _COURIER_TRANSFER_STATUS_HPP */
