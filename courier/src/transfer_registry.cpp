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
#include "transfer.hpp"
#include "transfer_registry.hpp"

using namespace courier;

transfer_registry::transfer_registry(clock::duration grace) :
	m_grace(grace)
{}

static void deliver(transfer *t, const std::optional<std::string>& problem)
{
	if(problem)
		t->failure(*problem);
	else
		t->success();
}

bool transfer_registry::put(transfer_id id, transfer *t)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	prune(clock::now());

	if(!m_transfers.emplace(id, t).second)
		return false;

	/* The id may have been reused. */
	m_retired.erase(id);

	if(m_lost)
	{
		deliver(t, m_lost);
		return true;
	}

	if(auto it = m_parked.find(id); it != m_parked.end())
	{
		log::debug("REG", "Replaying early notification for transfer %d", id);
		deliver(t, it->second.problem);
		m_parked.erase(it);
	}

	return true;
}

transfer *transfer_registry::get(transfer_id id) const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if(auto it = m_transfers.find(id); it != m_transfers.end())
		return it->second;

	return nullptr;
}

void transfer_registry::remove(transfer_id id)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	clock::time_point now = clock::now();
	prune(now);

	if(m_transfers.erase(id) > 0)
		m_retired[id] = now + m_grace;
}

void transfer_registry::notify_complete(transfer_id id)
{
	return notify(id, std::nullopt);
}

void transfer_registry::notify_failed(transfer_id id, const std::string& error)
{
	return notify(id, error);
}

void transfer_registry::fail_all(const std::string& reason)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if(m_lost)
		return;

	log::warn("REG", "Failing %d live transfer(s): %s", m_transfers.size(), reason);

	m_lost = reason;
	m_parked.clear();
	for(auto& it : m_transfers)
		deliver(it.second, m_lost);
}

void transfer_registry::notify(transfer_id id, std::optional<std::string>&& problem)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	clock::time_point now = clock::now();
	prune(now);

	if(auto it = m_transfers.find(id); it != m_transfers.end())
		return deliver(it->second, problem);

	if(m_retired.count(id) > 0)
	{
		log::trace("REG", "Ignoring late notification for transfer %d", id);
		return;
	}

	/* The first notification wins here too. */
	if(m_parked.emplace(id, parked_notification{ std::move(problem), now + m_grace }).second)
		log::trace("REG", "Holding notification for unknown transfer %d", id);
}

void transfer_registry::prune(clock::time_point now)
{
	for(auto it = m_parked.begin(); it != m_parked.end();)
	{
		if(it->second.expiry <= now)
			it = m_parked.erase(it);
		else
			++it;
	}

	for(auto it = m_retired.begin(); it != m_retired.end();)
	{
		if(it->second <= now)
			it = m_retired.erase(it);
		else
			++it;
	}
}

size_t transfer_registry::size() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_transfers.size();
}

bool transfer_registry::empty() const
{
	return size() == 0;
}

size_t transfer_registry::parked() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_parked.size();
}
