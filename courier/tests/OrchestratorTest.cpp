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
#include <memory>
#include <optional>
#include <thread>
#include <cppunit/extensions/HelperMacros.h>

#include "courier_common.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "protocol.hpp"
#include "transfer.hpp"
#include "TestFakes.hpp"

using namespace courier;
using namespace courier::test;
using namespace std::chrono_literals;

static bool ends_with(const std::string& s, const std::string& suffix)
{
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

class OrchestratorTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(OrchestratorTest);
	CPPUNIT_TEST(TestPushSucceeds);
	CPPUNIT_TEST(TestUnsupportedCredential);
	CPPUNIT_TEST(TestUnsupportedScheme);
	CPPUNIT_TEST(TestStartTimeout);
	CPPUNIT_TEST(TestStartRejected);
	CPPUNIT_TEST(TestPermissionDenied);
	CPPUNIT_TEST(TestFailureMidTransfer);
	CPPUNIT_TEST(TestClientGoesAway);
	CPPUNIT_TEST(TestQueryFailureStillSendsMarker);
	CPPUNIT_TEST(TestNotificationBeforeRegistration);
	CPPUNIT_TEST(TestCompletionFromAnotherThread);
	CPPUNIT_TEST(TestDuplicateId);
	CPPUNIT_TEST(TestRepeatedNotifications);
	CPPUNIT_TEST(TestServiceLost);
	CPPUNIT_TEST(TestServiceLostBeforeStart);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override;
	void tearDown() override;

	void TestPushSucceeds();
	void TestUnsupportedCredential();
	void TestUnsupportedScheme();
	void TestStartTimeout();
	void TestStartRejected();
	void TestPermissionDenied();
	void TestFailureMidTransfer();
	void TestClientGoesAway();
	void TestQueryFailureStillSendsMarker();
	void TestNotificationBeforeRegistration();
	void TestCompletionFromAnotherThread();
	void TestDuplicateId();
	void TestRepeatedNotifications();
	void TestServiceLost();
	void TestServiceLostBeforeStart();

private:
	bool pull(const std::string& remote, const credential& cred, const restriction& r = restriction());
	bool push(const std::string& remote, const credential& cred, const restriction& r = restriction());

	/* Complete (or fail) the transfer during the nth status query. */
	void finish_on_query(size_t n, std::optional<std::string> problem = std::nullopt);

	std::unique_ptr<fake_execution_service> m_service;
	std::unique_ptr<orchestrator> m_orch;
	std::unique_ptr<string_channel> m_channel;
	std::shared_ptr<std::atomic_size_t> m_queries;
};

void OrchestratorTest::setUp()
{
	m_service = std::make_unique<fake_execution_service>();
	m_orch = std::make_unique<orchestrator>(*m_service, 20ms, 30s);
	m_channel = std::make_unique<string_channel>();
	m_queries = std::make_shared<std::atomic_size_t>(0);
}

void OrchestratorTest::tearDown()
{
	m_channel.reset();
	m_orch.reset();
	m_service.reset();
}

bool OrchestratorTest::pull(const std::string& remote, const credential& cred, const restriction& r)
{
	return m_orch->accept_request(*m_channel, header_map{}, subject{ "alice", 1000, 100 }, r, "/data/file", remote, cred, direction_t::pull, true);
}

bool OrchestratorTest::push(const std::string& remote, const credential& cred, const restriction& r)
{
	return m_orch->accept_request(*m_channel, header_map{}, subject{ "alice", 1000, 100 }, r, "/data/file", remote, cred, direction_t::push, true);
}

void OrchestratorTest::finish_on_query(size_t n, std::optional<std::string> problem)
{
	orchestrator *orch = m_orch.get();
	std::shared_ptr<std::atomic_size_t> queries = m_queries;
	m_service->on_query = [orch, queries, n, problem](transfer_id id) {
		if(++*queries != n)
			return;

		if(problem)
			orch->transfer_failed(id, *problem);
		else
			orch->transfer_complete(id);
	};
}

void OrchestratorTest::TestPushSucceeds()
{
	m_service->next_id = 42;
	m_service->status.state = to_code(transfer_state::initial);
	finish_on_query(1);

	CPPUNIT_ASSERT(push("https://example.org/upload/file", bearer_credential{ "token", "", "", "", "" }));

	std::string out = m_channel->str();
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("    State: 0\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("success: Created\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_channel->count("failure: "));
	CPPUNIT_ASSERT(ends_with(out, "End\nsuccess: Created\n"));

	start_request req = m_service->last_request();
	CPPUNIT_ASSERT(!req.is_store);
	CPPUNIT_ASSERT_EQUAL(std::string("/data/file"), req.path);
	CPPUNIT_ASSERT_EQUAL(std::string("https://example.org/upload/file"), req.destination);
	CPPUNIT_ASSERT(descriptor_type(req.protocol) == transfer_type::https);
	CPPUNIT_ASSERT(std::get<https_descriptor>(req.protocol).require_verification);

	/* Queried with half the marker period. */
	CPPUNIT_ASSERT_EQUAL(transfer_id(42), m_service->last_query().first);
	CPPUNIT_ASSERT(m_service->last_query().second == 10ms);

	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->cancel_count());
	CPPUNIT_ASSERT(m_orch->registry().empty());
}

void OrchestratorTest::TestUnsupportedCredential()
{
	CPPUNIT_ASSERT_THROW(pull("gsiftp://example.org/file", bearer_credential{ "token", "", "", "", "" }), unsupported_credential_error);

	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->start_count());
	CPPUNIT_ASSERT(m_channel->str().empty());
	CPPUNIT_ASSERT(m_orch->registry().empty());
}

void OrchestratorTest::TestUnsupportedScheme()
{
	try
	{
		pull("s3://bucket/file", credential());
		CPPUNIT_FAIL("unsupported scheme accepted");
	}
	catch(unsupported_scheme_error& e)
	{
		CPPUNIT_ASSERT_EQUAL(400, e.status());
	}

	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->start_count());
	CPPUNIT_ASSERT(m_channel->str().empty());
}

void OrchestratorTest::TestStartTimeout()
{
	m_service->start_unavailable = true;

	try
	{
		pull("http://example.org/file", credential());
		CPPUNIT_FAIL("transfer started without a service");
	}
	catch(service_unavailable_error& e)
	{
		CPPUNIT_ASSERT_EQUAL(500, e.status());
		CPPUNIT_ASSERT_EQUAL(std::string("transfer service unavailable"), std::string(e.what()));
	}

	CPPUNIT_ASSERT(m_orch->registry().empty());
	CPPUNIT_ASSERT(m_channel->str().empty());
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->query_count());
}

void OrchestratorTest::TestStartRejected()
{
	m_service->reject_reason = "no pools available";

	try
	{
		pull("http://example.org/file", credential());
		CPPUNIT_FAIL("rejected transfer started");
	}
	catch(transfer_rejected_error& e)
	{
		CPPUNIT_ASSERT_EQUAL(500, e.status());
		CPPUNIT_ASSERT_EQUAL(std::string("transfer not accepted: no pools available"), std::string(e.what()));
	}

	CPPUNIT_ASSERT(m_orch->registry().empty());
	CPPUNIT_ASSERT(m_channel->str().empty());
}

void OrchestratorTest::TestPermissionDenied()
{
	/* Outside the allowed prefixes. */
	CPPUNIT_ASSERT_THROW(pull("http://example.org/file", credential(), restriction({ "/other" }, true, true)), permission_denied_error);

	/* A pull is an upload into storage. */
	try
	{
		pull("http://example.org/file", credential(), restriction({ "/data" }, false, true));
		CPPUNIT_FAIL("upload allowed");
	}
	catch(permission_denied_error& e)
	{
		CPPUNIT_ASSERT_EQUAL(403, e.status());
	}

	CPPUNIT_ASSERT_THROW(push("http://example.org/file", credential(), restriction({ "/data" }, true, false)), permission_denied_error);

	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->start_count());
	CPPUNIT_ASSERT(m_channel->str().empty());
}

void OrchestratorTest::TestFailureMidTransfer()
{
	m_service->next_id = 43;
	m_service->status.state = to_code(transfer_state::received_mover);
	m_service->status.mover = mover_info{ 1499999990123, 1499999999456, 9333, 1048576, "RUNNING" };
	finish_on_query(3, "disk full");

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential(), restriction({ "/data" }, true, false)));

	std::string out = m_channel->str();
	CPPUNIT_ASSERT_EQUAL(size_t(3), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(3), m_channel->count("    Stripe Bytes Transferred: 1048576\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: "));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_channel->count("success: "));
	CPPUNIT_ASSERT(ends_with(out, "End\nfailure: disk full\n"));

	CPPUNIT_ASSERT(m_service->last_request().is_store);
	CPPUNIT_ASSERT(m_orch->registry().empty());
}

void OrchestratorTest::TestClientGoesAway()
{
	m_service->next_id = 44;
	m_service->cancel_unavailable = true;
	m_channel->close();

	/* The cancel never gets through, so the service finishes it on its own. */
	finish_on_query(3, "cancelled");

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential()));

	/* One attempt per marker. */
	CPPUNIT_ASSERT_EQUAL(size_t(3), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(3), m_service->cancel_count());
	CPPUNIT_ASSERT_EQUAL(transfer_id(44), m_service->last_cancel().first);
	CPPUNIT_ASSERT_EQUAL(std::string("client went away"), m_service->last_cancel().second);
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: cancelled\n"));
}

void OrchestratorTest::TestQueryFailureStillSendsMarker()
{
	m_service->query_unavailable = true;
	finish_on_query(2);

	CPPUNIT_ASSERT(pull("http://example.org/file", credential()));

	/* Markers fall back to "unknown transfer". */
	CPPUNIT_ASSERT_EQUAL(size_t(2), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(2), m_channel->count("    State: -3\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("success: Created\n"));
}

void OrchestratorTest::TestNotificationBeforeRegistration()
{
	orchestrator *orch = m_orch.get();
	m_service->next_id = 45;
	m_service->on_start = [orch](transfer_id id) { orch->transfer_failed(id, "connection refused"); };

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential()));

	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT(ends_with(m_channel->str(), "End\nfailure: connection refused\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_orch->registry().parked());
	CPPUNIT_ASSERT(m_orch->registry().empty());

	/* Anything arriving afterwards is dropped. */
	m_orch->transfer_complete(45);
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_orch->registry().parked());
}

void OrchestratorTest::TestCompletionFromAnotherThread()
{
	orchestrator *orch = m_orch.get();
	m_service->next_id = 46;

	std::thread notifier;
	m_service->on_start = [orch, &notifier](transfer_id id) {
		notifier = std::thread([orch, id]() {
			std::this_thread::sleep_for(70ms);
			orch->transfer_complete(id);
		});
	};

	bool ok = pull("http://example.org/file", credential());
	notifier.join();

	CPPUNIT_ASSERT(ok);
	CPPUNIT_ASSERT(m_channel->count("Perf Marker\n") >= 1);
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("success: Created\n"));
	CPPUNIT_ASSERT(ends_with(m_channel->str(), "success: Created\n"));
}

void OrchestratorTest::TestDuplicateId()
{
	string_channel other;
	m_service->next_id = 47;

	/* A live transfer with the same id. */
	transfer t(*m_service, other, subject{}, restriction(), "/data/other", "http://example.org/other", credential(), flag_none, header_map{}, direction_t::pull, 20ms);
	CPPUNIT_ASSERT(m_orch->registry().put(47, &t));

	CPPUNIT_ASSERT_THROW(pull("http://example.org/file", credential()), service_unavailable_error);

	/* The id belongs to the live transfer, it mustn't be cancelled. */
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->cancel_count());
	CPPUNIT_ASSERT(m_orch->registry().get(47) == &t);
	CPPUNIT_ASSERT(!t.finished());
	CPPUNIT_ASSERT(m_channel->str().empty());
	CPPUNIT_ASSERT(other.str().empty());

	m_orch->registry().remove(47);
}

void OrchestratorTest::TestRepeatedNotifications()
{
	orchestrator *orch = m_orch.get();
	m_service->next_id = 48;
	m_service->on_query = [orch](transfer_id id) {
		orch->transfer_failed(id, "first");
		orch->transfer_complete(id);
		orch->transfer_failed(id, "second");
	};

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential()));

	/* Only the first notification counts, and only one line is written for it. */
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: first\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: "));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_channel->count("success: "));
	CPPUNIT_ASSERT(ends_with(m_channel->str(), "End\nfailure: first\n"));
	CPPUNIT_ASSERT(m_orch->registry().empty());
}

void OrchestratorTest::TestServiceLost()
{
	orchestrator *orch = m_orch.get();
	std::shared_ptr<std::atomic_size_t> queries = m_queries;
	m_service->next_id = 49;

	/* The broker goes away between the first and second markers. */
	m_service->on_query = [orch, queries](transfer_id) {
		if(++*queries == 2)
			orch->service_lost("connection to transfer service lost");
	};

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential()));

	CPPUNIT_ASSERT_EQUAL(size_t(2), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: "));
	CPPUNIT_ASSERT(ends_with(m_channel->str(), "End\nfailure: connection to transfer service lost\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_service->cancel_count());
	CPPUNIT_ASSERT(m_orch->registry().empty());

	/* Nothing can finish a later transfer either. */
	string_channel next;
	m_service->next_id = 50;
	m_service->on_query = nullptr;

	CPPUNIT_ASSERT(!m_orch->accept_request(next, header_map{}, subject{ "alice", 1000, 100 }, restriction(), "/data/file", "http://example.org/file", credential(), direction_t::pull, true));
	CPPUNIT_ASSERT_EQUAL(size_t(1), next.count("Perf Marker\n"));
	CPPUNIT_ASSERT(ends_with(next.str(), "End\nfailure: connection to transfer service lost\n"));
}

void OrchestratorTest::TestServiceLostBeforeStart()
{
	orchestrator *orch = m_orch.get();
	m_service->next_id = 51;
	m_service->on_start = [orch](transfer_id) { orch->service_lost("connection to transfer service lost"); };

	CPPUNIT_ASSERT(!pull("http://example.org/file", credential()));

	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("Perf Marker\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(1), m_channel->count("failure: connection to transfer service lost\n"));
	CPPUNIT_ASSERT_EQUAL(size_t(0), m_orch->registry().parked());
}

CPPUNIT_TEST_SUITE_REGISTRATION(OrchestratorTest);
