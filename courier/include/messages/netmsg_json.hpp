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
#ifndef _COURIER_MESSAGES_NETMSG_JSON_HPP
#define _COURIER_MESSAGES_NETMSG_JSON_HPP

#include <nlohmann/json.hpp>
#include "netmsg.hpp"

namespace nlohmann {

template<>
struct adl_serializer<courier::uuid>
{
	static courier::uuid from_json(const json& j);
	static void to_json(json& j, const courier::uuid& u);
};

template<>
struct adl_serializer<courier::credential>
{
	static void to_json(json& j, const courier::credential& cred);
};

template<>
struct adl_serializer<courier::gsiftp_descriptor>
{
	static void to_json(json& j, const courier::gsiftp_descriptor& desc);
};

template<>
struct adl_serializer<courier::http_descriptor>
{
	static void to_json(json& j, const courier::http_descriptor& desc);
};

template<>
struct adl_serializer<courier::https_descriptor>
{
	static void to_json(json& j, const courier::https_descriptor& desc);
};

template<>
struct adl_serializer<courier::protocol_descriptor>
{
	static void to_json(json& j, const courier::protocol_descriptor& desc);
};

template<>
struct adl_serializer<courier::subject>
{
	static courier::subject from_json(const json& j);
	static void to_json(json& j, const courier::subject& s);
};

template<>
struct adl_serializer<courier::restriction>
{
	static courier::restriction from_json(const json& j);
	static void to_json(json& j, const courier::restriction& r);
};

template<>
struct adl_serializer<courier::start_request>
{
	static void to_json(json& j, const courier::start_request& req);
};

template<>
struct adl_serializer<courier::mover_info>
{
	static courier::mover_info from_json(const json& j);
	static void to_json(json& j, const courier::mover_info& info);
};

template<>
struct adl_serializer<courier::status_reply>
{
	static courier::status_reply from_json(const json& j);
	static void to_json(json& j, const courier::status_reply& status);
};

template<>
struct adl_serializer<courier::net::message_type>
{
	static courier::net::message_type from_json(const json& j);
	static void to_json(json& j, const courier::net::message_type& type);
};

template<>
struct adl_serializer<courier::net::start_message>
{
	static void to_json(json& j, const courier::net::start_message& msg);
};

template<>
struct adl_serializer<courier::net::cancel_message>
{
	static courier::net::cancel_message from_json(const json& j);
	static void to_json(json& j, const courier::net::cancel_message& msg);
};

template<>
struct adl_serializer<courier::net::query_message>
{
	static courier::net::query_message from_json(const json& j);
	static void to_json(json& j, const courier::net::query_message& msg);
};

template<>
struct adl_serializer<courier::net::started_message>
{
	static courier::net::started_message from_json(const json& j);
	static void to_json(json& j, const courier::net::started_message& msg);
};

template<>
struct adl_serializer<courier::net::cancelled_message>
{
	static courier::net::cancelled_message from_json(const json& j);
	static void to_json(json& j, const courier::net::cancelled_message& msg);
};

template<>
struct adl_serializer<courier::net::status_message>
{
	static courier::net::status_message from_json(const json& j);
	static void to_json(json& j, const courier::net::status_message& msg);
};

template<>
struct adl_serializer<courier::net::error_message>
{
	static courier::net::error_message from_json(const json& j);
	static void to_json(json& j, const courier::net::error_message& msg);
};

template<>
struct adl_serializer<courier::net::complete_message>
{
	static courier::net::complete_message from_json(const json& j);
	static void to_json(json& j, const courier::net::complete_message& msg);
};

template<>
struct adl_serializer<courier::net::failed_message>
{
	static courier::net::failed_message from_json(const json& j);
	static void to_json(json& j, const courier::net::failed_message& msg);
};

template<>
struct adl_serializer<courier::net::message_container>
{
	static courier::net::message_container from_json(const json& j);
	static void to_json(json& j, const courier::net::message_container& msg);
};

}

#endif /* _COURIER_MESSAGES_NETMSG_JSON_HPP */
