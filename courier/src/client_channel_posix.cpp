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
#include <cerrno>
#include <poll.h>
#include "client_channel.hpp"

using namespace courier;

fd_channel::fd_channel(std::ostream& os, int fd) noexcept :
	m_stream(os),
	m_fd(fd)
{}

std::ostream& fd_channel::stream() noexcept
{
	return m_stream;
}

bool fd_channel::is_open()
{
	if(!m_stream)
		return false;

	struct pollfd pfd{};
	pfd.fd = m_fd;
	pfd.events = POLLOUT;

	int ret;
	while((ret = poll(&pfd, 1, 0)) < 0 && errno == EINTR)
		;

	if(ret < 0)
		return false;

	return (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) == 0;
}
