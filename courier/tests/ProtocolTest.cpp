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
#include <cppunit/extensions/HelperMacros.h>

#include "courier_common.hpp"
#include "errors.hpp"
#include "protocol.hpp"

using namespace courier;

class ProtocolTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(ProtocolTest);
	CPPUNIT_TEST(TestSupportedCredentials);
	CPPUNIT_TEST(TestDefaultPorts);
	CPPUNIT_TEST(TestSchemeCase);
	CPPUNIT_TEST(TestUnknownScheme);
	CPPUNIT_TEST(TestUnsupportedCredential);
	CPPUNIT_TEST(TestHttpDescriptor);
	CPPUNIT_TEST(TestHttpsBearer);
	CPPUNIT_TEST(TestExplicitPort);
	CPPUNIT_TEST(TestBadUri);
	CPPUNIT_TEST(TestHeaderFilter);
	CPPUNIT_TEST_SUITE_END();

public:
	void TestSupportedCredentials();
	void TestDefaultPorts();
	void TestSchemeCase();
	void TestUnknownScheme();
	void TestUnsupportedCredential();
	void TestHttpDescriptor();
	void TestHttpsBearer();
	void TestExplicitPort();
	void TestBadUri();
	void TestHeaderFilter();
};

static bearer_credential make_token()
{
	bearer_credential b;
	b.access_token = "eyJhbGciOi";
	return b;
}

void ProtocolTest::TestSupportedCredentials()
{
	CPPUNIT_ASSERT(!is_supported(transfer_type::gsiftp, credential_source::none));
	CPPUNIT_ASSERT(is_supported(transfer_type::gsiftp, credential_source::certificate));
	CPPUNIT_ASSERT(!is_supported(transfer_type::gsiftp, credential_source::bearer_token));

	CPPUNIT_ASSERT(is_supported(transfer_type::http, credential_source::none));
	CPPUNIT_ASSERT(!is_supported(transfer_type::http, credential_source::certificate));
	CPPUNIT_ASSERT(!is_supported(transfer_type::http, credential_source::bearer_token));

	CPPUNIT_ASSERT(is_supported(transfer_type::https, credential_source::none));
	CPPUNIT_ASSERT(is_supported(transfer_type::https, credential_source::certificate));
	CPPUNIT_ASSERT(is_supported(transfer_type::https, credential_source::bearer_token));
}

void ProtocolTest::TestDefaultPorts()
{
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(2811), default_port(transfer_type::gsiftp));
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(80), default_port(transfer_type::http));
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(443), default_port(transfer_type::https));
}

void ProtocolTest::TestSchemeCase()
{
	CPPUNIT_ASSERT(transfer_type_from_scheme("HTTPS") == transfer_type::https);
	CPPUNIT_ASSERT(transfer_type_from_scheme("GsiFtp") == transfer_type::gsiftp);
	CPPUNIT_ASSERT(!transfer_type_from_scheme("httpx"));
	CPPUNIT_ASSERT(!transfer_type_from_scheme("htt"));

	protocol_descriptor desc = build_protocol_descriptor("HTTP://example.org/file", direction_t::pull, credential(), {}, flag_none);
	CPPUNIT_ASSERT(descriptor_type(desc) == transfer_type::http);
}

void ProtocolTest::TestUnknownScheme()
{
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("ftp://example.org/file", direction_t::pull, credential(), {}, flag_none),
		unsupported_scheme_error
	);

	try
	{
		build_protocol_descriptor("s3://bucket/key", direction_t::push, credential(), {}, flag_none);
		CPPUNIT_FAIL("expected unsupported_scheme_error");
	}
	catch(unsupported_scheme_error& e)
	{
		CPPUNIT_ASSERT_EQUAL(400, e.status());
		CPPUNIT_ASSERT_EQUAL(std::string("unsupported scheme: s3"), std::string(e.what()));
	}
}

void ProtocolTest::TestUnsupportedCredential()
{
	/* No certificate for gsiftp. */
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("gsiftp://example.org/file", direction_t::pull, credential(), {}, flag_none),
		unsupported_credential_error
	);

	/* Tokens over plain http. */
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("http://example.org/file", direction_t::push, make_token(), {}, flag_none),
		unsupported_credential_error
	);

	/* A null certificate is no credential at all. */
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("gsiftp://example.org/file", direction_t::pull, certificate_ptr(), {}, flag_none),
		unsupported_credential_error
	);
}

void ProtocolTest::TestHttpDescriptor()
{
	header_map headers = { { "Authorization", "Basic Zm9vOmJhcg==" } };
	protocol_descriptor desc = build_protocol_descriptor("http://example.org/data/file", direction_t::push, credential(), headers, flag_require_verification);

	CPPUNIT_ASSERT(descriptor_type(desc) == transfer_type::http);

	const http_descriptor& http = std::get<http_descriptor>(desc);
	CPPUNIT_ASSERT_EQUAL(std::string("example.org"), http.address.host);
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(80), http.address.port);
	CPPUNIT_ASSERT_EQUAL(std::string("http://example.org/data/file"), http.uri);
	CPPUNIT_ASSERT_EQUAL(default_buffer_size, http.buffer_size);
	CPPUNIT_ASSERT(http.require_verification);
	CPPUNIT_ASSERT(http.headers == headers);
}

void ProtocolTest::TestHttpsBearer()
{
	protocol_descriptor desc = build_protocol_descriptor("https://example.org/file", direction_t::pull, make_token(), {}, flag_none);

	const https_descriptor& https = std::get<https_descriptor>(desc);
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(443), https.address.port);
	CPPUNIT_ASSERT(!https.require_verification);
	CPPUNIT_ASSERT(source_of(https.remote_credential) == credential_source::bearer_token);
	CPPUNIT_ASSERT_EQUAL(std::string("eyJhbGciOi"), std::get<bearer_credential>(https.remote_credential).access_token);
}

void ProtocolTest::TestExplicitPort()
{
	protocol_descriptor desc = build_protocol_descriptor("https://example.org:8443/file", direction_t::pull, credential(), {}, flag_none);
	CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(8443), descriptor_address(desc).port);
	CPPUNIT_ASSERT_EQUAL(std::string("https://example.org:8443/file"), descriptor_uri(desc));

	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("https://example.org:70000/file", direction_t::pull, credential(), {}, flag_none),
		transfer_error
	);
}

void ProtocolTest::TestBadUri()
{
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("not a uri", direction_t::pull, credential(), {}, flag_none),
		transfer_error
	);

	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("", direction_t::pull, credential(), {}, flag_none),
		transfer_error
	);

	/* No host. */
	CPPUNIT_ASSERT_THROW(
		build_protocol_descriptor("http:/file", direction_t::pull, credential(), {}, flag_none),
		transfer_error
	);
}

void ProtocolTest::TestHeaderFilter()
{
	header_map request = {
		{ "TransferHeaderAuthorization", "Bearer abc" },
		{ "transferheaderX-Custom", "1" },
		{ "Authorization", "Bearer local" },
		{ "Overwrite", "T" },
		{ "Transfer", "no" }
	};

	header_map filtered = filter_transfer_headers(request);
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), filtered.size());
	CPPUNIT_ASSERT_EQUAL(std::string("Bearer abc"), filtered["Authorization"]);
	CPPUNIT_ASSERT_EQUAL(std::string("1"), filtered["X-Custom"]);
}

CPPUNIT_TEST_SUITE_REGISTRATION(ProtocolTest);
