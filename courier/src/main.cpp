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
#include <cctype>
#include <csignal>
#include <iostream>
#include <thread>
#include <unistd.h>
#include <amqp.h>

#include "courier_common.hpp"
#include "amqp_consumer.hpp"
#include "amqp_service.hpp"
#include "client_channel.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"

using namespace courier;

enum
{
	EXIT_TRANSFER_OK		= 0,
	EXIT_TRANSFER_FAILED	= 1,
	EXIT_ARGUMENTS			= 2,
	EXIT_SETUP				= 3
};

/* Report a request that never became a transfer, the way the client expects. */
static int report_setup_error(const transfer_error& e)
{
	std::cout << e.status() << " " << e.what() << std::endl;
	return EXIT_SETUP;
}

static std::string_view trim(std::string_view s) noexcept
{
	while(!s.empty() && isspace(static_cast<unsigned char>(s.front())))
		s.remove_prefix(1);

	while(!s.empty() && isspace(static_cast<unsigned char>(s.back())))
		s.remove_suffix(1);

	return s;
}

static bool load_credential(const settings& s, credential& cred)
{
	if(!s.proxy_path.empty())
	{
		log::info("COURIER", "Loading delegated credential from %s...", s.proxy_path);
		certificate_ptr cert = load_certificate_credential(s.proxy_path);
		if(!cert)
			return false;

		log::info("COURIER", "  Subject: %s", cert->subject());
		cred = std::move(cert);
		return true;
	}

	bearer_credential bearer;
	if(!s.token.empty())
	{
		bearer.access_token = s.token;
	}
	else if(!s.token_file.empty())
	{
		size_t size;
		std::unique_ptr<char[]> raw = load_entire_file(s.token_file, size);
		if(!raw)
			return false;

		bearer.access_token = trim(std::string_view(raw.get(), size));
		if(bearer.access_token.empty())
		{
			log::error("COURIER", "Token file %s is empty.", s.token_file);
			return false;
		}
	}
	else
	{
		cred = std::monostate();
		return true;
	}

	cred = std::move(bearer);
	return true;
}

static restriction build_restriction(const settings& s)
{
	if(s.restrict_paths.empty() && s.allow_upload && s.allow_download)
		return restriction();

	return restriction(s.restrict_paths, s.allow_upload, s.allow_download);
}

int main(int argc, char **argv)
{
	int argStatus;
	settings s;

	if(!parse_program_arguments(argc, argv, argStatus, std::cout, std::cerr, s))
		return argStatus;

	/* stdout belongs to the client. */
	log::set_output(stderr);
	log::set_level(s.log_level);

	/* A client hanging up shouldn't kill us, we need to cancel the transfer. */
	signal(SIGPIPE, SIG_IGN);

	log::info("COURIER", "%s starting up...", g_compile_info.description);

	/* OpenSSL/LibreSSL init */
	init_openssl();

	credential cred;
	if(!load_credential(s, cred))
		return report_setup_error(transfer_error(400, "unable to load credential"));

	amqp_conn_ptr conn(amqp_new_connection());
	if(!conn)
	{
		log::error("COURIER", "Error creating AMQP connection.");
		log::debug("COURIER", "  amqp_new_connection() returned NULL.");
		return report_setup_error(service_unavailable_error("amqp_new_connection() failed"));
	}

	amqp_socket_t *socket = create_socket(s, conn.get());
	if(socket == nullptr)
		return report_setup_error(service_unavailable_error("unable to create socket"));

	log::info("COURIER", "Connecting to '%s://%s:%d'...", s.amqp_sscheme, s.amqp_host, s.amqp_port);
	int status;
	if((status = amqp_socket_open(socket, s.amqp_host.c_str(), s.amqp_port)) != AMQP_STATUS_OK)
	{
		log::error("COURIER", "Connection failed: %s", amqp_error_string2(status));
		log::debug("COURIER", "  amqp_socket_open() returned %d", status);
		return report_setup_error(service_unavailable_error("connection failed"));
	}

	log::info("COURIER", "Connection established. Authenticating...");

	amqp_rpc_reply_t rr = amqp_login(conn.get(), s.amqp_vhost.c_str(), 0, 131072, 0, AMQP_SASL_METHOD_PLAIN, s.amqp_user.c_str(), s.amqp_pass.c_str());
	if(rr.reply_type != AMQP_RESPONSE_NORMAL)
	{
		log::error("COURIER", "%s", amqp_exception::from_rpc_reply(rr).what());
		return report_setup_error(service_unavailable_error("authentication failed"));
	}

	log::info("COURIER", "Authentication successful!");

	int ret = EXIT_SETUP;
	std::atomic_bool exit_amqp(false);
	try
	{
		amqp_consumer amqp(conn.get(), 1, s.amqp_user, s.amqp_routing_key, s.amqp_direct_exchange);
		amqp_execution_service service(amqp, s.start_timeout, s.cancel_timeout);
		orchestrator orch(service, s.marker_period, s.notification_grace);

		/* Spin off the network worker. */
		std::thread qt([&amqp, &orch, &exit_amqp]()
		{
			log::info("NET", "Network Thread, starting up...");

			bool lost = false;
			try
			{
				while(!exit_amqp)
					poll_network(amqp, std::chrono::milliseconds(50));
			}
			catch(amqp_exception& e)
			{
				log::error("NET", "%s", e.what());
				lost = true;
			}

			/* Fails anyone waiting on the broker. */
			amqp.clear_waiting();

			/* No more notifications are coming. */
			if(lost)
				orch.service_lost("connection to transfer service lost");

			log::info("NET", "Network Thread, signing off...");
		});

		std::thread dd([&service, &orch, &exit_amqp]() { service.run_dispatcher(orch, exit_amqp); });

		auto thread_stopper = [&exit_amqp, &qt, &dd]() {
			exit_amqp = true;
			qt.join();
			dd.join();
		};
		auto stopper = make_protector(thread_stopper);

		fd_channel channel(std::cout, STDOUT_FILENO);

		subject identity;
		identity.name = s.subject_name;
		identity.uid = s.uid;
		identity.gid = s.gid;

		try
		{
			bool ok = orch.accept_request(
				channel,
				s.headers,
				identity,
				build_restriction(s),
				s.path,
				s.remote,
				cred,
				s.direction,
				s.verify_transfer
			);
			ret = ok ? EXIT_TRANSFER_OK : EXIT_TRANSFER_FAILED;
		}
		catch(transfer_error& e)
		{
			log::error("COURIER", "Transfer not started: %s", e.what());
			ret = report_setup_error(e);
		}
	}
	catch(amqp_exception& e)
	{
		log::error("COURIER", "%s", e.what());
		ret = report_setup_error(service_unavailable_error(e.what()));
	}

	log::info("COURIER", "%s signing off...", g_compile_info.description);
	amqp_connection_close(conn.get(), AMQP_REPLY_SUCCESS);
	return ret;
}
