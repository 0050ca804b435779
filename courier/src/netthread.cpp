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
#include <sys/select.h>
#include "courier_common.hpp"
#include "amqp_consumer.hpp"

/* Network thread. Waits for AMQP activity and flushes outgoing messages. */
void courier::poll_network(amqp_consumer& amqp, std::chrono::milliseconds timeout)
{
	int amqpfd = amqp.getsockfd();
	if(amqpfd < 0)
		throw amqp_exception::from_status(AMQP_STATUS_SOCKET_CLOSED);

	/* Frames already read off the socket won't wake select(). */
	if(!amqp.has_buffered_input())
	{
		fd_set readfds;

		auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
		struct timeval tv = {
			.tv_sec = static_cast<time_t>(usec / 1000000),
			.tv_usec = static_cast<suseconds_t>(usec % 1000000)
		};

		for(;;)
		{
			FD_ZERO(&readfds);
			FD_SET(amqpfd, &readfds);

			if(select(amqpfd + 1, &readfds, nullptr, nullptr, &tv) >= 0)
				break;

			if(errno == EAGAIN || errno == EINTR)
				continue;

			throw amqp_exception::from_errno("select", errno);
		}
	}

	amqp.onactivity();
}
