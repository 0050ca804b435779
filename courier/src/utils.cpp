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
#include <cstring>
#include <fstream>
#include <memory>
#include <uriparser/Uri.h>
#include <amqp.h>
#include <amqp_ssl_socket.h>
#include <amqp_tcp_socket.h>
#include "courier_common.hpp"

using namespace courier;

void courier::deleter_uri::operator()(UriUriA *uri) const noexcept
{
	uriFreeUriMembersA(uri);
	delete uri;
}

void courier::deleter_amqp_conn::operator()(amqp_connection_state_t conn) const noexcept
{
	amqp_destroy_connection(conn);
}

void courier::deleter_cstdio::operator()(FILE *f) const noexcept
{
	fclose(f);
}

uri_ptr courier::parse_uri(std::string_view uri)
{
	if(uri.empty())
		return nullptr;

	UriUriA rawUri;
	memset(&rawUri, 0, sizeof(rawUri));

	UriParserStateA state;
	memset(&state, 0, sizeof(state));

	state.uri = &rawUri;

	int ret = uriParseUriExA(&state, uri.data(), uri.data() + uri.size());
	if(ret == URI_ERROR_MALLOC)
		throw std::bad_alloc();

	if(ret != URI_SUCCESS)
	{
		uriFreeUriMembersA(&rawUri);
		return nullptr;
	}

	UriUriA *puri = new UriUriA;

	*puri = rawUri;

	return uri_ptr(puri);
}

std::string courier::uri_to_string(const UriUriA *uri)
{
	int len = 0;
	if(uriToStringCharsRequiredA(uri, &len) != URI_SUCCESS)
		throw std::bad_alloc();

	std::string s;
	s.resize(len);

	++len;
	if(uriToStringA(s.data(), uri, len, &len) != URI_SUCCESS)
		throw std::bad_alloc();

	return s;
}

static int toasciilower(unsigned char c) noexcept
{
	if(c >= 'A' && c <= 'Z')
		return c + 32;
	else
		return c;
}

bool courier::starts_with_icase(std::string_view s, std::string_view prefix) noexcept
{
	if(s.size() < prefix.size())
		return false;

	for(size_t i = 0; i < prefix.size(); ++i)
	{
		if(toasciilower(static_cast<unsigned char>(s[i])) != toasciilower(static_cast<unsigned char>(prefix[i])))
			return false;
	}

	return true;
}

std::string_view courier::make_view(const char *b, const char *e) noexcept
{
	if(b == nullptr || e == nullptr)
		return std::string_view();

	return std::string_view(b, static_cast<size_t>(e - b));
}

std::string_view courier::make_view(const amqp_bytes_t& b) noexcept
{
	return std::string_view(reinterpret_cast<const char*>(b.bytes), b.len);
}

std::string courier::amqp_bytes_to_string(const amqp_bytes_t& b)
{
	return std::string(reinterpret_cast<const char*>(b.bytes), reinterpret_cast<const char*>(b.bytes) + b.len);
}

amqp_socket_t *courier::create_socket(settings& s, amqp_connection_state_t conn)
{
	amqp_socket_t *socket;
	if(s.amqp_scheme == settings::amqp_scheme_t::amqps)
	{
		/* Shouldn't do anything, OpenSSL is init'd by main() */
		amqp_set_initialize_ssl_library(0);

		if(!(socket = amqp_ssl_socket_new(conn)))
		{
			log::error("AMQP", "Error creating SSL socket.");
			log::debug("AMQP", "  amqp_ssl_socket_new() returned NULL.");
			return nullptr;
		}

		if(!s.ca_path.empty())
		{
			int status = amqp_ssl_socket_set_cacert(socket, s.ca_path.c_str());
			if(status != AMQP_STATUS_OK)
			{
				log::error("AMQP", "Unable to load CA certificates from %s: %s", s.ca_path, amqp_error_string2(status));
				return nullptr;
			}
		}

		{ /* Peer/Hostname verification */
			const char *sslWarn = nullptr;

			if(s.ssl_no_verify_peer && !s.ssl_no_verify_hostname)
				sslWarn = "peer";
			else if(!s.ssl_no_verify_peer && s.ssl_no_verify_hostname)
				sslWarn = "hostname";
			else if(s.ssl_no_verify_peer && s.ssl_no_verify_hostname)
				sslWarn = "peer, hostname";

			if(sslWarn)
				log::warn("AMQP", "Skipping [%s] verification by request... On your own head be it!", sslWarn);

			amqp_ssl_socket_set_verify_peer(socket, static_cast<amqp_boolean_t>(!s.ssl_no_verify_peer));
			amqp_ssl_socket_set_verify_hostname(socket, static_cast<amqp_boolean_t>(!s.ssl_no_verify_hostname));
		}
	}
	else
	{
		if(!(socket = amqp_tcp_socket_new(conn)))
		{
			log::error("AMQP", "Error creating TCP socket.");
			log::debug("AMQP", "  amqp_tcp_socket_new() returned NULL.");
			return nullptr;
		}
	}

	return socket;
}

void courier::report_filesystem_error(const char *component, const filesystem::path& path, const std::error_code& code)
{
	log::error(component, "Filesystem Error:");
	log::error(component, "  Path: %s", path.string());
	log::error(component, "  Code: %d", code.value());
	log::error(component, "  Mesg: %s", code.message());
}

std::unique_ptr<char[]> courier::load_entire_file(const filesystem::path& file, size_t& size)
{
	std::error_code code;
	size = filesystem::file_size(file, code);
	if(code)
	{
		log::error("COURIER", "Unable to determine file size.");
		report_filesystem_error("COURIER", file, code);
		return nullptr;
	}

	/* Allow empty files. */
	std::unique_ptr<char[]> ptr = std::make_unique<char[]>(size + 1);

	std::ifstream fs(file, std::ios::binary);
	if(!fs.read(ptr.get(), size))
	{
		log::error("COURIER", "Unable to read file %s.", file.string());
		return nullptr;
	}

	ptr[size] = '\0';
	return ptr;
}
