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
#ifndef _COURIER_MARKER_HPP
#define _COURIER_MARKER_HPP

#include <ctime>
#include <optional>
#include <ostream>
#include <string>
#include "transfer_status.hpp"

namespace courier {

/*
** Write a performance marker, similar to those of an FTP transfer:
**
**     Perf Marker
**         Timestamp: 1360578938
**         State: 10
**         State description: transfer in progress
**         Stripe Index: 0
**         Stripe Bytes Transferred: 49397760
**         Total Stripe Count: 1
**     End
**
** The Stripe Start/Last Transferred/Transfer Time/Bytes/Status lines only
** appear if the status carries mover information.
*/
void write_perf_marker(std::ostream& os, time_t now, const status_reply& status);

/* "success: Created", or "failure: <problem>". */
void write_terminal_line(std::ostream& os, const std::optional<std::string>& problem);

}

#endif /* _COURIER_MARKER_HPP */
