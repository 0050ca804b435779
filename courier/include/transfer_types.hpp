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
#ifndef _COURIER_TRANSFER_TYPES_HPP
#define _COURIER_TRANSFER_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "courier_fwd.hpp"

namespace courier {

/* The way the data travels, relative to the storage system. */
enum class direction_t
{
	/* Fetch from the remote endpoint into storage (a "store"). */
	pull,
	/* Send from storage to the remote endpoint. */
	push
};

enum class transfer_type { gsiftp, http, https };

enum class credential_source { none, certificate, bearer_token };

enum transfer_flag : uint32_t
{
	flag_none					= 0,
	flag_require_verification	= 1u << 0
};

using transfer_flags = uint32_t;

using header_map = std::map<std::string, std::string>;

const char *to_string(direction_t dir) noexcept;
const char *to_string(transfer_type type) noexcept;
const char *to_string(credential_source source) noexcept;

/* The request header naming the remote end, e.g. "Source" for a pull. */
const char *header_name(direction_t dir) noexcept;

/* Case-insensitive. */
std::optional<transfer_type> transfer_type_from_scheme(std::string_view scheme) noexcept;

}

#endif /* _COURIER_TRANSFER_TYPES_HPP */
