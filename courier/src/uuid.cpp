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
#include <algorithm>
#include <string>
#include <stdexcept>
#include <ostream>
#include <string.h>
#include "uuid.hpp"

using namespace courier;

uuid::uuid() noexcept
{
	uuid_generate(m_uuid);
}

uuid::uuid(std::string_view s)
{
	if(s.size() != string_length)
		throw std::invalid_argument("malformed uuid");

	uuid_string_type buf;
	memcpy(buf, s.data(), string_length);
	buf[string_length] = '\0';

	if(uuid_parse(buf, m_uuid) < 0)
		throw std::invalid_argument("malformed uuid");
}

std::string uuid::str() const
{
	uuid_string_type out;
	str(out, sizeof(out));
	return out;
}

size_t uuid::str(char *buf, size_t size) const
{
	uuid_string_type out;
	uuid_unparse_lower(m_uuid, out);
	strncpy(buf, out, size);
	if(size < sizeof(uuid_string_type))
		buf[size - 1] = '\0';

	return std::min(size, sizeof(uuid_string_type));
}

bool uuid::operator==(const uuid& u) const noexcept
{
	return uuid_compare(m_uuid, u.m_uuid) == 0;
}

bool uuid::operator!=(const uuid& u) const noexcept
{
	return !(*this == u);
}

bool uuid::operator<(const uuid& u) const noexcept
{
	return uuid_compare(m_uuid, u.m_uuid) < 0;
}

/* Version 4 uuids are random, the first word is as good a hash as any. */
size_t uuid::hash() const noexcept
{
	size_t h;
	memcpy(&h, m_uuid, sizeof(h));
	return h;
}

std::ostream& courier::operator<<(std::ostream& os, const uuid& u)
{
	uuid::uuid_string_type out;
	u.str(out, sizeof(out));
	return os << out;
}
