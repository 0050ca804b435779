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
#ifndef _COURIER_IDENTITY_HPP
#define _COURIER_IDENTITY_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace courier {

/* Who the transfer is performed on behalf of. Opaque to the orchestrator. */
struct subject
{
	std::string name;
	uint32_t uid = 0;
	uint32_t gid = 0;
};

/*
** Limits on what a subject may do, typically derived from a macaroon
** or scoped token by the request layer.
*/
class restriction
{
public:
	enum class activity_t { upload, download };

	/* Unrestricted. */
	restriction();
	restriction(std::vector<std::string> prefixes, bool allow_upload, bool allow_download);

	/* Returns true if the activity on path is NOT allowed. */
	bool is_restricted(activity_t activity, std::string_view path) const noexcept;

	bool unrestricted() const noexcept;
	const std::vector<std::string>& prefixes() const noexcept;
	bool allows(activity_t activity) const noexcept;

private:
	std::vector<std::string> m_prefixes;
	bool m_upload;
	bool m_download;
};

const char *to_string(restriction::activity_t activity) noexcept;

}

#endif /* _COURIER_IDENTITY_HPP */
