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
#include <sstream>
#include <stdexcept>
#include <cppunit/extensions/HelperMacros.h>

#include "courier_common.hpp"
#include "protocol.hpp"
#include "messages/netmsg_json.hpp"

using namespace courier;
using namespace courier::net;

static const char *test_uuid = "0c7b1e58-5c3a-4b8e-9d1f-2a4e6c8b0d13";

static message_container parse(const std::string& s)
{
	return message_read(s.c_str(), s.size());
}

class MessagesTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(MessagesTest);
	CPPUNIT_TEST(TestStarted);
	CPPUNIT_TEST(TestError);
	CPPUNIT_TEST(TestStatusWithoutMover);
	CPPUNIT_TEST(TestStatusWithMover);
	CPPUNIT_TEST(TestComplete);
	CPPUNIT_TEST(TestFailed);
	CPPUNIT_TEST(TestStartNotAccepted);
	CPPUNIT_TEST(TestMalformed);
	CPPUNIT_TEST(TestStartRequest);
	CPPUNIT_TEST(TestCancelQuery);
	CPPUNIT_TEST(TestPrintHidesBody);
	CPPUNIT_TEST_SUITE_END();

public:
	void TestStarted();
	void TestError();
	void TestStatusWithoutMover();
	void TestStatusWithMover();
	void TestComplete();
	void TestFailed();
	void TestStartNotAccepted();
	void TestMalformed();
	void TestStartRequest();
	void TestCancelQuery();
	void TestPrintHidesBody();
};

void MessagesTest::TestStarted()
{
	message_container msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.started","id":42}})", test_uuid));

	CPPUNIT_ASSERT(msg.type() == message_type::transfer_started);
	CPPUNIT_ASSERT(msg.uuid() == uuid(test_uuid));
	CPPUNIT_ASSERT(msg.is_reply());
	CPPUNIT_ASSERT_EQUAL(transfer_id(42), msg.get<started_message>().id());
}

void MessagesTest::TestError()
{
	message_container msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.error","error":"no pools available"}})", test_uuid));

	CPPUNIT_ASSERT(msg.type() == message_type::transfer_error);
	CPPUNIT_ASSERT(msg.is_reply());
	CPPUNIT_ASSERT_EQUAL(std::string("no pools available"), msg.get<error_message>().error());
}

void MessagesTest::TestStatusWithoutMover()
{
	message_container msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.status","status":{{"state":7,"mover":null}}}})", test_uuid));

	const status_reply& status = msg.get<status_message>().status();
	CPPUNIT_ASSERT_EQUAL(to_code(transfer_state::waiting_for_pool), status.state);
	CPPUNIT_ASSERT(!status.mover);

	/* mover may be left out entirely. */
	msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.status","status":{{"state":-3}}}})", test_uuid));
	CPPUNIT_ASSERT_EQUAL(to_code(transfer_state::unknown_id), msg.get<status_message>().status().state);
	CPPUNIT_ASSERT(!msg.get<status_message>().status().mover);
}

void MessagesTest::TestStatusWithMover()
{
	message_container msg = parse(fmt::format(
		R"({{"uuid":"{}","type":"transfer.status","status":{{"state":10,"mover":{{)"
		R"("start_time":1499999990123,"last_transferred":1499999999456,"transfer_time":9333,)"
		R"("bytes_transferred":1048576,"status":"RUNNING"}}}}}})",
		test_uuid
	));

	const status_reply& status = msg.get<status_message>().status();
	CPPUNIT_ASSERT_EQUAL(10, status.state);
	CPPUNIT_ASSERT(status.mover);
	CPPUNIT_ASSERT_EQUAL(int64_t(1499999990123), status.mover->start_time);
	CPPUNIT_ASSERT_EQUAL(int64_t(1499999999456), status.mover->last_transferred);
	CPPUNIT_ASSERT_EQUAL(int64_t(9333), status.mover->transfer_time);
	CPPUNIT_ASSERT_EQUAL(int64_t(1048576), status.mover->bytes_transferred);
	CPPUNIT_ASSERT_EQUAL(std::string("RUNNING"), status.mover->status);
}

void MessagesTest::TestComplete()
{
	message_container msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.complete","id":42}})", test_uuid));

	CPPUNIT_ASSERT(msg.type() == message_type::transfer_complete);
	CPPUNIT_ASSERT(!msg.is_reply());
	CPPUNIT_ASSERT_EQUAL(transfer_id(42), msg.get<complete_message>().id());
}

void MessagesTest::TestFailed()
{
	message_container msg = parse(fmt::format(R"({{"uuid":"{}","type":"transfer.failed","id":43,"error":"disk full"}})", test_uuid));

	CPPUNIT_ASSERT(msg.type() == message_type::transfer_failed);
	CPPUNIT_ASSERT(!msg.is_reply());
	CPPUNIT_ASSERT_EQUAL(transfer_id(43), msg.get<failed_message>().id());
	CPPUNIT_ASSERT_EQUAL(std::string("disk full"), msg.get<failed_message>().error());
}

void MessagesTest::TestStartNotAccepted()
{
	std::string s = fmt::format(R"({{"uuid":"{}","type":"transfer.start","reply_to":"q","request":{{}}}})", test_uuid);
	CPPUNIT_ASSERT_THROW(parse(s), std::domain_error);
}

void MessagesTest::TestMalformed()
{
	CPPUNIT_ASSERT_THROW(parse(fmt::format(R"({{"uuid":"{}","type":"transfer.exploded","id":1}})", test_uuid)), std::domain_error);
	CPPUNIT_ASSERT_THROW(parse(R"({"uuid":"not-a-uuid","type":"transfer.complete","id":1})"), std::invalid_argument);
	CPPUNIT_ASSERT_THROW(parse(fmt::format(R"({{"uuid":"{}","type":"transfer.complete"}})", test_uuid)), nlohmann::json::exception);
	CPPUNIT_ASSERT_THROW(parse("{\"uuid\":"), nlohmann::json::exception);
}

void MessagesTest::TestStartRequest()
{
	header_map headers{ { "Overwrite", "T" } };
	bearer_credential bearer{ "access", "refresh", "https://issuer.example.org", "client", "secret" };

	start_request request{
		"https://example.org/upload/file",
		"/data/file",
		false,
		build_protocol_descriptor("https://example.org/upload/file", direction_t::push, bearer, headers, flag_require_verification),
		subject{ "alice", 1000, 100 },
		restriction({ "/data" }, false, true)
	};

	nlohmann::json j = message_container(start_message(uuid(test_uuid), "courier-reply", request));

	CPPUNIT_ASSERT_EQUAL(std::string("transfer.start"), j["type"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string(test_uuid), j["uuid"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string("courier-reply"), j["reply_to"].get<std::string>());

	const nlohmann::json& req = j["request"];
	CPPUNIT_ASSERT_EQUAL(std::string("/data/file"), req["path"].get<std::string>());
	CPPUNIT_ASSERT(!req["is_store"].get<bool>());
	CPPUNIT_ASSERT_EQUAL(std::string("alice"), req["subject"]["name"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(1000u, req["subject"]["uid"].get<uint32_t>());
	CPPUNIT_ASSERT(!req["restriction"]["upload"].get<bool>());
	CPPUNIT_ASSERT(req["restriction"]["download"].get<bool>());

	const nlohmann::json& proto = req["protocol"];
	CPPUNIT_ASSERT_EQUAL(std::string("https"), proto["type"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string("example.org"), proto["address"]["host"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(443, proto["address"]["port"].get<int>());
	CPPUNIT_ASSERT(proto["require_verification"].get<bool>());
	CPPUNIT_ASSERT_EQUAL(std::string("T"), proto["headers"]["Overwrite"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string("bearer"), proto["credential"]["type"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string("access"), proto["credential"]["access_token"].get<std::string>());

	/* An unrestricted subject sends no restriction at all. */
	request.restrictions = restriction();
	j = message_container(start_message(uuid(test_uuid), "courier-reply", request));
	CPPUNIT_ASSERT(j["request"]["restriction"].is_null());
}

void MessagesTest::TestCancelQuery()
{
	nlohmann::json j = message_container(cancel_message(uuid(test_uuid), "courier-reply", 42, "client went away"));
	CPPUNIT_ASSERT_EQUAL(std::string("transfer.cancel"), j["type"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(transfer_id(42), j["id"].get<transfer_id>());
	CPPUNIT_ASSERT_EQUAL(std::string("client went away"), j["explanation"].get<std::string>());

	j = message_container(query_message(uuid(test_uuid), "courier-reply", 42));
	CPPUNIT_ASSERT_EQUAL(std::string("transfer.query"), j["type"].get<std::string>());
	CPPUNIT_ASSERT_EQUAL(std::string("courier-reply"), j["reply_to"].get<std::string>());
}

void MessagesTest::TestPrintHidesBody()
{
	bearer_credential bearer{ "s3cr3t-token", "", "", "", "" };
	start_request request{
		"https://example.org/file",
		"/data/file",
		true,
		build_protocol_descriptor("https://example.org/file", direction_t::pull, bearer, header_map{}, flag_none),
		subject{},
		restriction()
	};

	std::ostringstream ss;
	ss << message_container(start_message(uuid(test_uuid), "courier-reply", request));

	CPPUNIT_ASSERT_EQUAL(fmt::format("transfer.start({})", test_uuid), ss.str());
	CPPUNIT_ASSERT(ss.str().find("s3cr3t") == std::string::npos);
}

CPPUNIT_TEST_SUITE_REGISTRATION(MessagesTest);
