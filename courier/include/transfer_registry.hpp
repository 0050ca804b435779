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
#ifndef _COURIER_TRANSFER_REGISTRY_HPP
#define _COURIER_TRANSFER_REGISTRY_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "courier_fwd.hpp"

namespace courier {

/*
** Live transfers, by the id the execution service gave them.
**
** The registry doesn't own the transfers. A transfer must be removed before
** it is destroyed; notifications are delivered with the registry locked, so
** once remove() returns no notification can reach it.
**
** The execution service may notify before the requesting thread has had a
** chance to put() the transfer. Such notifications are held for the grace
** period and replayed by put(). Notifications for transfers that have
** already been removed are dropped.
**
** Once fail_all() has been called every transfer, including any put()
** afterwards, is failed with the given reason.
*/
class transfer_registry
{
public:
	using clock = std::chrono::steady_clock;

	explicit transfer_registry(clock::duration grace);

	transfer_registry(const transfer_registry&) = delete;
	transfer_registry& operator=(const transfer_registry&) = delete;

	/* Returns false if id is already registered. */
	bool put(transfer_id id, transfer *t);

	/* Returns nullptr if there's no such transfer. */
	transfer *get(transfer_id id) const;

	void remove(transfer_id id);

	void notify_complete(transfer_id id);
	void notify_failed(transfer_id id, const std::string& error);

	/* Fail everything, now and from here on. */
	void fail_all(const std::string& reason);

	size_t size() const;
	bool empty() const;

	/* Notifications waiting for their transfer to be registered. */
	size_t parked() const;

private:
	struct parked_notification
	{
		std::optional<std::string> problem;
		clock::time_point expiry;
	};

	void notify(transfer_id id, std::optional<std::string>&& problem);
	void prune(clock::time_point now);

	const clock::duration m_grace;

	mutable std::mutex m_mutex;
	std::unordered_map<transfer_id, transfer*> m_transfers;
	std::unordered_map<transfer_id, parked_notification> m_parked;
	std::unordered_map<transfer_id, clock::time_point> m_retired;
	std::optional<std::string> m_lost;
};

}

#endif /* _COURIER_TRANSFER_REGISTRY_HPP */
