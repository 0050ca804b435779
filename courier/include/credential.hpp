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
#ifndef _COURIER_CREDENTIAL_HPP
#define _COURIER_CREDENTIAL_HPP

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "courier_fwd.hpp"
#include "transfer_types.hpp"

namespace courier {

/* An X.509 certificate chain (leaf first) and its private key, e.g. a delegated proxy. */
class certificate_credential
{
public:
	certificate_credential(std::vector<x509_ptr>&& chain, evp_pkey_ptr&& key) noexcept;

	certificate_credential(const certificate_credential&) = delete;
	certificate_credential(certificate_credential&&) = delete;
	certificate_credential& operator=(const certificate_credential&) = delete;
	certificate_credential& operator=(certificate_credential&&) = delete;

	const std::vector<x509_ptr>& chain() const noexcept;
	EVP_PKEY *key() const noexcept;

	/* Subject DN of the leaf certificate, or empty if there isn't one. */
	std::string subject() const;

	std::string chain_pem() const;
	std::string key_pem() const;

private:
	std::vector<x509_ptr> m_chain;
	evp_pkey_ptr m_key;
};

using certificate_ptr = std::shared_ptr<const certificate_credential>;

/* An OAuth2/OpenID Connect token and what's needed to refresh it. */
struct bearer_credential
{
	std::string access_token;
	std::string refresh_token;
	std::string issuer;
	std::string client_id;
	std::string client_secret;
};

using credential = std::variant<std::monostate, certificate_ptr, bearer_credential>;

credential_source source_of(const credential& cred) noexcept;

/* ssl.cpp */

/*
** Load a PEM bundle containing a certificate chain and an unencrypted private key.
** Returns nullptr and logs the OpenSSL error on failure.
*/
certificate_ptr load_certificate_credential_mem(const char *data, size_t size);
certificate_ptr load_certificate_credential(const filesystem::path& path);

}

#endif /* _COURIER_CREDENTIAL_HPP */
