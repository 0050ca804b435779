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

/* Put everything OpenSSL-related in here. */
#include <limits>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/ssl.h>
#include <openssl/evp.h>
#include "courier_common.hpp"
#include "credential.hpp"

using namespace courier;

void courier::deleter_x509::operator()(X509 *v) const noexcept { X509_free(v); }
void courier::deleter_evp_pkey::operator()(EVP_PKEY *v) const noexcept { EVP_PKEY_free(v); }
void courier::deleter_bio::operator()(BIO *v) const noexcept { BIO_free_all(v); }

template <typename T>
static T report_openssl_error(unsigned long err)
{
	char errBuffer[256];
	ERR_error_string_n(err, errBuffer, sizeof(errBuffer));
	log::error("OpenSSL", "%s", errBuffer);
	return T();
}

template <typename T>
static T report_openssl_error()
{
	return report_openssl_error<T>(ERR_get_error());
}

void courier::init_openssl()
{
	log::info("COURIER", "Initialising %s...", OpenSSL_version(OPENSSL_VERSION));
	OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

certificate_credential::certificate_credential(std::vector<x509_ptr>&& chain, evp_pkey_ptr&& key) noexcept :
	m_chain(std::move(chain)),
	m_key(std::move(key))
{}

const std::vector<x509_ptr>& certificate_credential::chain() const noexcept
{
	return m_chain;
}

EVP_PKEY *certificate_credential::key() const noexcept
{
	return m_key.get();
}

static std::string bio_to_string(BIO *bio)
{
	char *data = nullptr;
	long len = BIO_get_mem_data(bio, &data);
	if(len <= 0 || data == nullptr)
		return std::string();

	return std::string(data, data + len);
}

std::string certificate_credential::subject() const
{
	if(m_chain.empty())
		return std::string();

	bio_ptr bio(BIO_new(BIO_s_mem()));
	if(!bio)
		return report_openssl_error<std::string>();

	if(X509_NAME_print_ex(bio.get(), X509_get_subject_name(m_chain.front().get()), 0, XN_FLAG_RFC2253) < 0)
		return report_openssl_error<std::string>();

	return bio_to_string(bio.get());
}

std::string certificate_credential::chain_pem() const
{
	bio_ptr bio(BIO_new(BIO_s_mem()));
	if(!bio)
		return report_openssl_error<std::string>();

	for(const x509_ptr& x : m_chain)
	{
		if(PEM_write_bio_X509(bio.get(), x.get()) != 1)
			return report_openssl_error<std::string>();
	}

	return bio_to_string(bio.get());
}

std::string certificate_credential::key_pem() const
{
	if(!m_key)
		return std::string();

	bio_ptr bio(BIO_new(BIO_s_mem()));
	if(!bio)
		return report_openssl_error<std::string>();

	if(PEM_write_bio_PrivateKey(bio.get(), m_key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
		return report_openssl_error<std::string>();

	return bio_to_string(bio.get());
}

credential_source courier::source_of(const credential& cred) noexcept
{
	if(const certificate_ptr *cert = std::get_if<certificate_ptr>(&cred))
		return *cert ? credential_source::certificate : credential_source::none;
	else if(std::holds_alternative<bearer_credential>(cred))
		return credential_source::bearer_token;

	return credential_source::none;
}

certificate_ptr courier::load_certificate_credential_mem(const char *data, size_t size)
{
	ERR_clear_error();

	if(size >= static_cast<size_t>(std::numeric_limits<int>::max()))
	{
		log::error("COURIER", "Credential too big.");
		return nullptr;
	}

	std::vector<x509_ptr> chain;
	{
		bio_ptr bio(BIO_new_mem_buf(data, static_cast<int>(size)));
		if(!bio)
			return report_openssl_error<certificate_ptr>();

		for(X509 *x; (x = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) != nullptr; )
			chain.emplace_back(x);

		/* Running off the end of the bundle is expected. */
		ERR_clear_error();
	}

	if(chain.empty())
	{
		log::error("COURIER", "No certificates found in credential.");
		return nullptr;
	}

	evp_pkey_ptr key;
	{
		bio_ptr bio(BIO_new_mem_buf(data, static_cast<int>(size)));
		if(!bio)
			return report_openssl_error<certificate_ptr>();

		key.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
		if(!key)
			return report_openssl_error<certificate_ptr>();
	}

	if(X509_check_private_key(chain.front().get(), key.get()) != 1)
	{
		log::error("COURIER", "Private key doesn't match the leaf certificate.");
		return nullptr;
	}

	return std::make_shared<const certificate_credential>(std::move(chain), std::move(key));
}

certificate_ptr courier::load_certificate_credential(const filesystem::path& path)
{
	size_t size;
	std::unique_ptr<char[]> raw = load_entire_file(path, size);
	if(!raw)
		return nullptr;

	return load_certificate_credential_mem(raw.get(), size);
}
