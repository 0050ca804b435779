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
#include <cerrno>
#include <cstring>
#include <cppunit/extensions/HelperMacros.h>

#include "courier_common.hpp"
#include "amqp_exception.hpp"

using namespace courier;

class AmqpExceptionTest : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(AmqpExceptionTest);
	CPPUNIT_TEST(TestLibraryError);
	CPPUNIT_TEST(TestChannelClose);
	CPPUNIT_TEST(TestConnectionClose);
	CPPUNIT_TEST(TestRpcReply);
	CPPUNIT_TEST(TestErrno);
	CPPUNIT_TEST_SUITE_END();

public:
	void TestLibraryError();
	void TestChannelClose();
	void TestConnectionClose();
	void TestRpcReply();
	void TestErrno();
};

void AmqpExceptionTest::TestLibraryError()
{
	amqp_exception e = amqp_exception::from_status(AMQP_STATUS_SOCKET_CLOSED);

	CPPUNIT_ASSERT(e.source() == amqp_exception::source_t::library);
	CPPUNIT_ASSERT_EQUAL(static_cast<int>(AMQP_STATUS_SOCKET_CLOSED), e.code());
	CPPUNIT_ASSERT(e.connection_lost());
	CPPUNIT_ASSERT(std::string(e.what()).find(amqp_error_string2(AMQP_STATUS_SOCKET_CLOSED)) != std::string::npos);
}

void AmqpExceptionTest::TestChannelClose()
{
	char text[] = "NOT_FOUND - no exchange 'amq.nowhere' in vhost '/'";

	amqp_channel_close_t close;
	memset(&close, 0, sizeof(close));
	close.reply_code = 404;
	close.reply_text = amqp_bytes_t{ strlen(text), text };
	close.class_id = 40;
	close.method_id = 10;

	amqp_exception e = amqp_exception::from_channel_close(close);
	CPPUNIT_ASSERT(e.source() == amqp_exception::source_t::channel);
	CPPUNIT_ASSERT_EQUAL(404, e.code());
	CPPUNIT_ASSERT_EQUAL(uint16_t(40), e.class_id());
	CPPUNIT_ASSERT_EQUAL(uint16_t(10), e.method_id());
	CPPUNIT_ASSERT(!e.connection_lost());
	CPPUNIT_ASSERT_EQUAL(
		std::string("AMQP channel closed (code=404, class=40, method=10): NOT_FOUND - no exchange 'amq.nowhere' in vhost '/'"),
		std::string(e.what())
	);
}

void AmqpExceptionTest::TestConnectionClose()
{
	char text[] = "CONNECTION_FORCED - broker forced connection closure with reason 'shutdown'";

	amqp_connection_close_t close;
	memset(&close, 0, sizeof(close));
	close.reply_code = 320;
	close.reply_text = amqp_bytes_t{ strlen(text), text };

	amqp_exception e = amqp_exception::from_connection_close(close);
	CPPUNIT_ASSERT(e.source() == amqp_exception::source_t::connection);
	CPPUNIT_ASSERT_EQUAL(320, e.code());
	CPPUNIT_ASSERT(e.connection_lost());
}

void AmqpExceptionTest::TestRpcReply()
{
	amqp_rpc_reply_t r;
	memset(&r, 0, sizeof(r));

	/* Nothing wrong, nothing thrown. */
	r.reply_type = AMQP_RESPONSE_NORMAL;
	amqp_exception::throw_if_bad(r);

	r.reply_type = AMQP_RESPONSE_LIBRARY_EXCEPTION;
	r.library_error = AMQP_STATUS_TIMEOUT;
	CPPUNIT_ASSERT_THROW(amqp_exception::throw_if_bad(r), amqp_exception);
	CPPUNIT_ASSERT_EQUAL(static_cast<int>(AMQP_STATUS_TIMEOUT), amqp_exception::from_rpc_reply(r).code());

	r.library_error = 0;
	CPPUNIT_ASSERT_EQUAL(std::string("AMQP library error: end-of-stream"), std::string(amqp_exception::from_rpc_reply(r).what()));

	char text[] = "PRECONDITION_FAILED - unknown delivery tag 1";
	amqp_channel_close_t close;
	memset(&close, 0, sizeof(close));
	close.reply_code = 406;
	close.reply_text = amqp_bytes_t{ strlen(text), text };

	r.reply_type = AMQP_RESPONSE_SERVER_EXCEPTION;
	r.reply.id = AMQP_CHANNEL_CLOSE_METHOD;
	r.reply.decoded = &close;

	amqp_exception e = amqp_exception::from_rpc_reply(r);
	CPPUNIT_ASSERT(e.source() == amqp_exception::source_t::channel);
	CPPUNIT_ASSERT_EQUAL(406, e.code());

	r.reply_type = AMQP_RESPONSE_NONE;
	CPPUNIT_ASSERT_EQUAL(static_cast<int>(AMQP_STATUS_UNEXPECTED_STATE), amqp_exception::from_rpc_reply(r).code());
}

void AmqpExceptionTest::TestErrno()
{
	amqp_exception e = amqp_exception::from_errno("select", EBADF);

	CPPUNIT_ASSERT(e.connection_lost());
	CPPUNIT_ASSERT_EQUAL(static_cast<int>(AMQP_STATUS_SOCKET_ERROR), e.code());
	CPPUNIT_ASSERT_EQUAL(std::string("select() on broker socket failed: ") + strerror(EBADF), std::string(e.what()));
}

CPPUNIT_TEST_SUITE_REGISTRATION(AmqpExceptionTest);
