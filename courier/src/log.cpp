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
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <fmt/format.h>

#include "log.hpp"

using namespace courier;

static std::atomic<log::level_t> s_level(log::level_t::info);
static std::atomic<FILE*> s_output(nullptr);
static std::atomic_uint s_next_thread(0);

static const char *level_string(log::level_t level) noexcept
{
	switch(level)
	{
		case log::level_t::trace: return "TRACE";
		case log::level_t::debug: return "DEBUG";
		case log::level_t::info: return "INFO";
		case log::level_t::warn: return "WARN";
		case log::level_t::error: return "ERROR";
	}

	return "UNKWN";
}

static unsigned int thread_number() noexcept
{
	static thread_local unsigned int number = s_next_thread++;
	return number;
}

void log::set_output(FILE *stream) noexcept
{
	s_output = stream;
}

void log::set_level(level_t level) noexcept
{
	s_level = level;
}

log::level_t log::get_level() noexcept
{
	return s_level;
}

bool log::parse_level(std::string_view s, level_t& level) noexcept
{
	for(level_t l : { level_t::trace, level_t::debug, level_t::info, level_t::warn, level_t::error })
	{
		std::string_view name = level_string(l);
		if(name.size() != s.size())
			continue;

		bool match = true;
		for(size_t i = 0; i < s.size() && match; ++i)
			match = toupper(static_cast<unsigned char>(s[i])) == name[i];

		if(match)
			return level = l, true;
	}

	return false;
}

void log::vwrite(level_t level, const char *component, const char *fmt, fmt::printf_args args)
{
	static std::mutex log_lock;

	if(level < s_level)
		return;

	FILE *stream = s_output.load();
	if(stream == nullptr)
		stream = level == level_t::error ? stderr : stdout;

	time_t now = time(nullptr);
	struct tm tm{};
	localtime_r(&now, &tm);

	char stamp[32];
	strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

	/* Format first, so a slow stream doesn't hold the lock any longer than needed. */
	std::string line = fmt::format("{} {:<5.5} [t{}] [{:>5}] ", stamp, component, thread_number(), level_string(level));
	line += fmt::vsprintf(fmt, args);
	line += '\n';

	std::lock_guard<std::mutex> lock(log_lock);
	fputs(line.c_str(), stream);
	fflush(stream);
}
