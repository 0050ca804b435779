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
#ifndef _COURIER_PROTOCOL_HPP
#define _COURIER_PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include "transfer_types.hpp"
#include "credential.hpp"

namespace courier {

struct network_address
{
	std::string host;
	uint16_t port;
};

/*
** Transport-specific connection descriptors, handed opaquely to the
** execution service. Credential material is only present on the
** transport that can use it.
*/
struct gsiftp_descriptor
{
	network_address address;
	std::string uri;
	uint32_t buffer_size;
	uint32_t tcp_buffer_size;
	certificate_ptr certificate;
};

struct http_descriptor
{
	network_address address;
	std::string uri;
	uint32_t buffer_size;
	bool require_verification;
	header_map headers;
};

struct https_descriptor
{
	network_address address;
	std::string uri;
	uint32_t buffer_size;
	bool require_verification;
	header_map headers;
	credential remote_credential;
};

using protocol_descriptor = std::variant<gsiftp_descriptor, http_descriptor, https_descriptor>;

constexpr static uint32_t default_buffer_size = 1024 * 1024;

/* The prefix marking a request header to forward to the remote endpoint. */
constexpr static std::string_view transfer_header_prefix = "transferheader";

uint16_t default_port(transfer_type type) noexcept;

/* Is the credential source acceptable for this transport? */
bool is_supported(transfer_type type, credential_source source) noexcept;

transfer_type descriptor_type(const protocol_descriptor& desc) noexcept;
const network_address& descriptor_address(const protocol_descriptor& desc) noexcept;
const std::string& descriptor_uri(const protocol_descriptor& desc) noexcept;

/*
** Build the descriptor for a transfer to or from uri.
**
** Throws unsupported_scheme_error if the scheme isn't one we know,
** unsupported_credential_error if the transport can't use the credential,
** and transfer_error for a URI without a host.
*/
protocol_descriptor build_protocol_descriptor(
	const UriUriA *uri,
	direction_t direction,
	const credential& cred,
	const header_map& headers,
	transfer_flags flags
);

/* Parse uri (see above). Also throws transfer_error if it isn't a valid URI. */
protocol_descriptor build_protocol_descriptor(
	std::string_view uri,
	direction_t direction,
	const credential& cred,
	const header_map& headers,
	transfer_flags flags
);

/*
** Keep only the request headers named "TransferHeader<name>" (any case),
** keyed by <name>.
*/
header_map filter_transfer_headers(const header_map& request_headers);

}

#endif /* _COURIER_PROTOCOL_HPP */
