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
#ifndef _COURIER_CLIENT_CHANNEL_HPP
#define _COURIER_CLIENT_CHANNEL_HPP

#include <ostream>

namespace courier {

/*
** The connection to the client that asked for a transfer.
**
** Only the thread waiting on the transfer writes to the stream. is_open()
** must not block; a closed connection means the client has given up.
*/
class client_channel
{
public:
	virtual ~client_channel() = default;

	virtual std::ostream& stream() noexcept = 0;
	virtual bool is_open() = 0;
};

/* A stream backed by a file descriptor, such as stdout or an accepted socket. */
class fd_channel : public client_channel
{
public:
	fd_channel(std::ostream& os, int fd) noexcept;

	std::ostream& stream() noexcept override;

	/* Polls the descriptor for hangup or error. */
	bool is_open() override;

private:
	std::ostream& m_stream;
	int m_fd;
};

}

#endif /* _COURIER_CLIENT_CHANNEL_HPP */
