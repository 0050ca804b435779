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
#include <fmt/format.h>
#include <uriparser/Uri.h>
#include "courier_common.hpp"
#include "errors.hpp"
#include "protocol.hpp"

using namespace courier;

namespace {

struct transport_entry
{
	transfer_type type;
	const char *scheme;
	uint16_t port;
	bool sources[3];	/* Indexed by credential_source */
};

/*                                                          none   cert   token */
constexpr transport_entry transports[] = {
	{ transfer_type::gsiftp,	"gsiftp",	2811,	{ false,	true,	false } },
	{ transfer_type::http,		"http",		80,		{ true,		false,	false } },
	{ transfer_type::https,		"https",	443,	{ true,		true,	true } },
};

const transport_entry& entry_for(transfer_type type) noexcept
{
	return transports[static_cast<size_t>(type)];
}

}

const char *courier::to_string(direction_t dir) noexcept
{
	switch(dir)
	{
		case direction_t::pull: return "pull";
		case direction_t::push: return "push";
	}

	return nullptr;
}

const char *courier::to_string(transfer_type type) noexcept
{
	return entry_for(type).scheme;
}

const char *courier::to_string(credential_source source) noexcept
{
	switch(source)
	{
		case credential_source::none: return "none";
		case credential_source::certificate: return "certificate";
		case credential_source::bearer_token: return "bearer-token";
	}

	return nullptr;
}

const char *courier::header_name(direction_t dir) noexcept
{
	return dir == direction_t::pull ? "Source" : "Destination";
}

std::optional<transfer_type> courier::transfer_type_from_scheme(std::string_view scheme) noexcept
{
	for(const transport_entry& e : transports)
	{
		std::string_view s = e.scheme;
		if(s.size() == scheme.size() && starts_with_icase(scheme, s))
			return e.type;
	}

	return std::nullopt;
}

uint16_t courier::default_port(transfer_type type) noexcept
{
	return entry_for(type).port;
}

bool courier::is_supported(transfer_type type, credential_source source) noexcept
{
	return entry_for(type).sources[static_cast<size_t>(source)];
}

transfer_type courier::descriptor_type(const protocol_descriptor& desc) noexcept
{
	return static_cast<transfer_type>(desc.index());
}

const network_address& courier::descriptor_address(const protocol_descriptor& desc) noexcept
{
	return std::visit([](auto&& d) -> const network_address& { return d.address; }, desc);
}

const std::string& courier::descriptor_uri(const protocol_descriptor& desc) noexcept
{
	return std::visit([](auto&& d) -> const std::string& { return d.uri; }, desc);
}

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<size_t>(transfer_type::gsiftp), protocol_descriptor>, gsiftp_descriptor>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<size_t>(transfer_type::http), protocol_descriptor>, http_descriptor>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<size_t>(transfer_type::https), protocol_descriptor>, https_descriptor>);

static network_address resolve_address(const UriUriA *uri, transfer_type type)
{
	std::string_view host = make_view(uri->hostText.first, uri->hostText.afterLast);
	if(host.empty())
		throw transfer_error(400, "remote URI has no host");

	std::string_view sport = make_view(uri->portText.first, uri->portText.afterLast);

	/* No port specified? Use the protocol's. */
	if(sport.empty())
		return network_address{ std::string(host), default_port(type) };

	unsigned long port = 0;
	for(char c : sport)
	{
		if(c < '0' || c > '9' || (port = port * 10 + static_cast<unsigned long>(c - '0')) > 65535)
			throw transfer_error(400, "invalid port in remote URI");
	}

	if(port == 0)
		throw transfer_error(400, "invalid port in remote URI");

	return network_address{ std::string(host), static_cast<uint16_t>(port) };
}

protocol_descriptor courier::build_protocol_descriptor(const UriUriA *uri, direction_t direction, const credential& cred, const header_map& headers, transfer_flags flags)
{
	std::string_view scheme = make_view(uri->scheme.first, uri->scheme.afterLast);

	std::optional<transfer_type> type = transfer_type_from_scheme(scheme);
	if(!type)
		throw unsupported_scheme_error(std::string(scheme));

	credential_source source = source_of(cred);
	if(!is_supported(*type, source))
	{
		throw unsupported_credential_error(fmt::format(
			"{} transfers do not support {} credentials", to_string(*type), to_string(source)
		));
	}

	network_address address = resolve_address(uri, *type);
	std::string uristring = uri_to_string(uri);
	bool verify = (flags & flag_require_verification) != 0;

	log::trace("PROTO", "%s %s via %s:%u, credential %s", to_string(direction), uristring, address.host, address.port, to_string(source));

	switch(*type)
	{
		case transfer_type::gsiftp:
			return gsiftp_descriptor{
				std::move(address),
				std::move(uristring),
				default_buffer_size,
				default_buffer_size,
				std::get<certificate_ptr>(cred)
			};

		case transfer_type::http:
			return http_descriptor{
				std::move(address),
				std::move(uristring),
				default_buffer_size,
				verify,
				headers
			};

		case transfer_type::https:
			return https_descriptor{
				std::move(address),
				std::move(uristring),
				default_buffer_size,
				verify,
				headers,
				cred
			};
	}

	throw std::logic_error("unexpected transfer type");
}

protocol_descriptor courier::build_protocol_descriptor(std::string_view uri, direction_t direction, const credential& cred, const header_map& headers, transfer_flags flags)
{
	uri_ptr parsed = parse_uri(uri);
	if(!parsed)
		throw transfer_error(400, "malformed remote URI");

	return build_protocol_descriptor(parsed.get(), direction, cred, headers, flags);
}

header_map courier::filter_transfer_headers(const header_map& request_headers)
{
	header_map headers;
	for(const auto& [key, value] : request_headers)
	{
		if(starts_with_icase(key, transfer_header_prefix))
			headers.emplace(key.substr(transfer_header_prefix.size()), value);
	}

	return headers;
}
