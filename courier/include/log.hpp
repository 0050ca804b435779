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
#ifndef _COURIER_LOG_HPP
#define _COURIER_LOG_HPP

#include "config.h"
#include <cstdio>
#include <string_view>
#include <fmt/printf.h>

/*
** Component-tagged, printf-style logging. Each call is one line:
**
**   2019-07-01T10:15:02 XFER  [t3] [ INFO] Started pull of /data/file ...
**
** Threads are numbered in the order they first log.
*/
namespace courier::log {

enum class level_t { trace, debug, info, warn, error };

/* Messages below this level are discarded. Defaults to info. */
void set_level(level_t level) noexcept;
level_t get_level() noexcept;

/* Case-insensitive: "trace", "debug", "info", "warn" or "error". */
bool parse_level(std::string_view s, level_t& level) noexcept;

/*
** Send everything to stream. By default errors go to stderr and
** everything else to stdout; nullptr restores that.
*/
void set_output(FILE *stream) noexcept;

void vwrite(level_t level, const char *component, const char *fmt, fmt::printf_args args);

template<typename... Args>
void write(level_t level, const char *component, const char *fmt, Args&&... args)
{
	if(level < get_level())
		return;

	return vwrite(level, component, fmt, fmt::make_printf_args(args...));
}

template<typename... Args>
void trace(const char *component, const char *fmt, Args&&... args)
{
	return write(level_t::trace, component, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void debug(const char *component, const char *fmt, Args&&... args)
{
	return write(level_t::debug, component, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(const char *component, const char *fmt, Args&&... args)
{
	return write(level_t::info, component, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(const char *component, const char *fmt, Args&&... args)
{
	return write(level_t::warn, component, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(const char *component, const char *fmt, Args&&... args)
{
	return write(level_t::error, component, fmt, std::forward<Args>(args)...);
}

}
#endif /* _COURIER_LOG_HPP */
