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
#include "identity.hpp"

using namespace courier;

restriction::restriction() :
	m_prefixes(),
	m_upload(true),
	m_download(true)
{}

restriction::restriction(std::vector<std::string> prefixes, bool allow_upload, bool allow_download) :
	m_prefixes(std::move(prefixes)),
	m_upload(allow_upload),
	m_download(allow_download)
{}

/* A prefix only matches whole path elements, so "/data" doesn't cover "/database". */
static bool path_has_prefix(std::string_view path, std::string_view prefix) noexcept
{
	while(prefix.size() > 1 && prefix.back() == '/')
		prefix.remove_suffix(1);

	if(prefix == "/")
		return !path.empty() && path.front() == '/';

	if(path.compare(0, prefix.size(), prefix) != 0)
		return false;

	return path.size() == prefix.size() || path[prefix.size()] == '/';
}

bool restriction::is_restricted(activity_t activity, std::string_view path) const noexcept
{
	if(!allows(activity))
		return true;

	if(m_prefixes.empty())
		return false;

	for(const std::string& p : m_prefixes)
	{
		if(path_has_prefix(path, p))
			return false;
	}

	return true;
}

bool restriction::unrestricted() const noexcept
{
	return m_prefixes.empty() && m_upload && m_download;
}

const std::vector<std::string>& restriction::prefixes() const noexcept
{
	return m_prefixes;
}

bool restriction::allows(activity_t activity) const noexcept
{
	return activity == activity_t::upload ? m_upload : m_download;
}

const char *courier::to_string(restriction::activity_t activity) noexcept
{
	switch(activity)
	{
		case restriction::activity_t::upload: return "upload";
		case restriction::activity_t::download: return "download";
	}

	return nullptr;
}
