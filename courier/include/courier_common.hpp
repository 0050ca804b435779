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

/*
** Courier master include file.
** Try to keep external libraries out of this.
** C++ STL is fine.
*/

#ifndef _COURIER_COMMON_HPP
#define _COURIER_COMMON_HPP

#include <chrono>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "config.h"

#include "courier_fwd.hpp"
#include "log.hpp"
#include "transfer_types.hpp"

namespace courier {

struct settings
{
	enum class amqp_scheme_t { amqp, amqps };

	settings();

	std::string			amqp_raw_uri;
	uri_ptr				amqp_uri;
	amqp_scheme_t		amqp_scheme;
	std::string_view	amqp_sscheme;
	std::string			amqp_host;
	uint16_t			amqp_port;
	std::string			amqp_user;
	std::string			amqp_pass;
	std::string			amqp_vhost;
	std::string			amqp_routing_key;
	std::string			amqp_direct_exchange;

	bool				ssl_no_verify_peer;
	bool				ssl_no_verify_hostname;
	std::string			ca_path;

	std::chrono::milliseconds	marker_period;
	std::chrono::milliseconds	start_timeout;
	std::chrono::milliseconds	cancel_timeout;
	std::chrono::seconds		notification_grace;

	log::level_t		log_level;

	/* The transfer to perform. */
	direction_t			direction;
	std::string			path;
	std::string			remote;
	std::string			proxy_path;
	std::string			token;
	std::string			token_file;
	header_map			headers;
	bool				verify_transfer;
	std::string			subject_name;
	uint32_t			uid;
	uint32_t			gid;
	std::vector<std::string> restrict_paths;
	bool				allow_upload;
	bool				allow_download;
};


/* utils.cpp */

/*
** Parse a URI using uriparser.
**
** If the URI is valid and was parsed successfully, returns a pointer
** to the UriUriA structure. If parsing failed, this returns nullptr.
**
** The returned structure points into the given string, which must outlive it.
*/
uri_ptr parse_uri(std::string_view uri);
std::string uri_to_string(const UriUriA *uri);

bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept;

std::string_view make_view(const char *b, const char *e) noexcept;
std::string_view make_view(const amqp_bytes_t& b) noexcept;

/*
** Convert an amqp_bytes_t structure to a C++ string.
*/
std::string amqp_bytes_to_string(const amqp_bytes_t& b);

amqp_socket_t *create_socket(settings& s, amqp_connection_state_t conn);
void report_filesystem_error(const char *component, const filesystem::path& path, const std::error_code& code);
std::unique_ptr<char[]> load_entire_file(const filesystem::path& file, size_t& size);

/* ssl.cpp */
void init_openssl();

/* settings.cpp */
bool parse_program_arguments(int argc, char **argv, int& status, std::ostream& out, std::ostream& err, settings& s);

/* Abuse std::unique_ptr to handle static cleanups. */
template <typename D>
auto make_protector(D& deleter)
{
	using ptr_type = std::unique_ptr<D, void(*)(D*)>;
	return ptr_type(&deleter, [](D* d) { (*d)(); });
}

}

#include "amqp_exception.hpp"

#endif /* _COURIER_COMMON_HPP */
