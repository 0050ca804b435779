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
#include <sstream>
#include "messages/netmsg_json.hpp"

using namespace courier;
using namespace courier::net;

uuid nlohmann::adl_serializer<uuid>::from_json(const json& j)
{
	return uuid(j.get<std::string>());
}

void nlohmann::adl_serializer<uuid>::to_json(json& j, const uuid& u)
{
	uuid::uuid_string_type out;
	u.str(out, sizeof(out));
	j = out;
}

void nlohmann::adl_serializer<credential>::to_json(json& j, const credential& cred)
{
	if(const certificate_ptr *cert = std::get_if<certificate_ptr>(&cred); cert && *cert)
	{
		j = json{
			{ "type", "certificate" },
			{ "subject", (*cert)->subject() },
			{ "chain", (*cert)->chain_pem() },
			{ "key", (*cert)->key_pem() }
		};
	}
	else if(const bearer_credential *bearer = std::get_if<bearer_credential>(&cred))
	{
		j = json{
			{ "type", "bearer" },
			{ "access_token", bearer->access_token },
			{ "refresh_token", bearer->refresh_token },
			{ "issuer", bearer->issuer },
			{ "client_id", bearer->client_id },
			{ "client_secret", bearer->client_secret }
		};
	}
	else
	{
		j = nullptr;
	}
}

static nlohmann::json address_json(const network_address& addr)
{
	return nlohmann::json{ { "host", addr.host }, { "port", addr.port } };
}

void nlohmann::adl_serializer<gsiftp_descriptor>::to_json(json& j, const gsiftp_descriptor& desc)
{
	j = json{
		{ "type", to_string(transfer_type::gsiftp) },
		{ "address", address_json(desc.address) },
		{ "uri", desc.uri },
		{ "buffer_size", desc.buffer_size },
		{ "tcp_buffer_size", desc.tcp_buffer_size },
		{ "credential", credential(desc.certificate) }
	};
}

void nlohmann::adl_serializer<http_descriptor>::to_json(json& j, const http_descriptor& desc)
{
	j = json{
		{ "type", to_string(transfer_type::http) },
		{ "address", address_json(desc.address) },
		{ "uri", desc.uri },
		{ "buffer_size", desc.buffer_size },
		{ "require_verification", desc.require_verification },
		{ "headers", desc.headers }
	};
}

void nlohmann::adl_serializer<https_descriptor>::to_json(json& j, const https_descriptor& desc)
{
	j = json{
		{ "type", to_string(transfer_type::https) },
		{ "address", address_json(desc.address) },
		{ "uri", desc.uri },
		{ "buffer_size", desc.buffer_size },
		{ "require_verification", desc.require_verification },
		{ "headers", desc.headers },
		{ "credential", desc.remote_credential }
	};
}

void nlohmann::adl_serializer<protocol_descriptor>::to_json(json& j, const protocol_descriptor& desc)
{
	std::visit([&j](auto&& d) { nlohmann::adl_serializer<std::decay_t<decltype(d)>>::to_json(j, d); }, desc);
}

subject nlohmann::adl_serializer<subject>::from_json(const json& j)
{
	subject s;
	s.name = j.at("name").get<std::string>();
	s.uid = j.at("uid").get<uint32_t>();
	s.gid = j.at("gid").get<uint32_t>();
	return s;
}

void nlohmann::adl_serializer<subject>::to_json(json& j, const subject& s)
{
	j = json{ { "name", s.name }, { "uid", s.uid }, { "gid", s.gid } };
}

restriction nlohmann::adl_serializer<restriction>::from_json(const json& j)
{
	if(j.is_null())
		return restriction();

	return restriction(
		j.at("prefixes").get<std::vector<std::string>>(),
		j.at("upload").get<bool>(),
		j.at("download").get<bool>()
	);
}

void nlohmann::adl_serializer<restriction>::to_json(json& j, const restriction& r)
{
	if(r.unrestricted())
	{
		j = nullptr;
		return;
	}

	j = json{
		{ "prefixes", r.prefixes() },
		{ "upload", r.allows(restriction::activity_t::upload) },
		{ "download", r.allows(restriction::activity_t::download) }
	};
}

void nlohmann::adl_serializer<start_request>::to_json(json& j, const start_request& req)
{
	j = json{
		{ "destination", req.destination },
		{ "path", req.path },
		{ "is_store", req.is_store },
		{ "protocol", req.protocol },
		{ "subject", req.identity },
		{ "restriction", req.restrictions }
	};
}

mover_info nlohmann::adl_serializer<mover_info>::from_json(const json& j)
{
	mover_info info;
	info.start_time = j.at("start_time").get<int64_t>();
	info.last_transferred = j.at("last_transferred").get<int64_t>();
	info.transfer_time = j.at("transfer_time").get<int64_t>();
	info.bytes_transferred = j.at("bytes_transferred").get<int64_t>();
	info.status = j.value("status", "");
	return info;
}

void nlohmann::adl_serializer<mover_info>::to_json(json& j, const mover_info& info)
{
	j = json{
		{ "start_time", info.start_time },
		{ "last_transferred", info.last_transferred },
		{ "transfer_time", info.transfer_time },
		{ "bytes_transferred", info.bytes_transferred },
		{ "status", info.status }
	};
}

status_reply nlohmann::adl_serializer<status_reply>::from_json(const json& j)
{
	status_reply status;
	status.state = j.at("state").get<int>();

	if(auto it = j.find("mover"); it != j.end() && !it->is_null())
		status.mover = it->get<mover_info>();

	return status;
}

void nlohmann::adl_serializer<status_reply>::to_json(json& j, const status_reply& status)
{
	j = json{ { "state", status.state }, { "mover", nullptr } };
	if(status.mover)
		j["mover"] = *status.mover;
}

message_type nlohmann::adl_serializer<message_type>::from_json(const json& j)
{
	std::string t = j.get<std::string>();

	if(t == "transfer.start") return message_type::transfer_start;
	else if(t == "transfer.cancel") return message_type::transfer_cancel;
	else if(t == "transfer.query") return message_type::transfer_query;
	else if(t == "transfer.started") return message_type::transfer_started;
	else if(t == "transfer.cancelled") return message_type::transfer_cancelled;
	else if(t == "transfer.status") return message_type::transfer_status;
	else if(t == "transfer.error") return message_type::transfer_error;
	else if(t == "transfer.complete") return message_type::transfer_complete;
	else if(t == "transfer.failed") return message_type::transfer_failed;

	throw std::domain_error("Invalid value for message_type");
}

void nlohmann::adl_serializer<message_type>::to_json(json& j, const message_type& type)
{
	const char *s = get_message_type_string(type);
	if(s == nullptr)
		throw std::domain_error("Invalid value for message_type");

	j = s;
}

void nlohmann::adl_serializer<start_message>::to_json(json& j, const start_message& msg)
{
	j = json{
		{ "uuid", msg.uuid() },
		{ "type", msg.type() },
		{ "reply_to", msg.reply_to() },
		{ "request", msg.request() }
	};
}

cancel_message nlohmann::adl_serializer<cancel_message>::from_json(const json& j)
{
	return cancel_message(
		j.at("uuid").get<uuid>(),
		j.at("reply_to").get<std::string>(),
		j.at("id").get<transfer_id>(),
		j.at("explanation").get<std::string>()
	);
}

void nlohmann::adl_serializer<cancel_message>::to_json(json& j, const cancel_message& msg)
{
	j = json{
		{ "uuid", msg.uuid() },
		{ "type", msg.type() },
		{ "reply_to", msg.reply_to() },
		{ "id", msg.id() },
		{ "explanation", msg.explanation() }
	};
}

query_message nlohmann::adl_serializer<query_message>::from_json(const json& j)
{
	return query_message(j.at("uuid").get<uuid>(), j.at("reply_to").get<std::string>(), j.at("id").get<transfer_id>());
}

void nlohmann::adl_serializer<query_message>::to_json(json& j, const query_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "reply_to", msg.reply_to() }, { "id", msg.id() } };
}

started_message nlohmann::adl_serializer<started_message>::from_json(const json& j)
{
	return started_message(j.at("uuid").get<uuid>(), j.at("id").get<transfer_id>());
}

void nlohmann::adl_serializer<started_message>::to_json(json& j, const started_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "id", msg.id() } };
}

cancelled_message nlohmann::adl_serializer<cancelled_message>::from_json(const json& j)
{
	return cancelled_message(j.at("uuid").get<uuid>(), j.at("id").get<transfer_id>());
}

void nlohmann::adl_serializer<cancelled_message>::to_json(json& j, const cancelled_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "id", msg.id() } };
}

status_message nlohmann::adl_serializer<status_message>::from_json(const json& j)
{
	return status_message(j.at("uuid").get<uuid>(), j.at("status").get<status_reply>());
}

void nlohmann::adl_serializer<status_message>::to_json(json& j, const status_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "status", msg.status() } };
}

error_message nlohmann::adl_serializer<error_message>::from_json(const json& j)
{
	return error_message(j.at("uuid").get<uuid>(), j.at("error").get<std::string>());
}

void nlohmann::adl_serializer<error_message>::to_json(json& j, const error_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "error", msg.error() } };
}

complete_message nlohmann::adl_serializer<complete_message>::from_json(const json& j)
{
	return complete_message(j.at("uuid").get<uuid>(), j.at("id").get<transfer_id>());
}

void nlohmann::adl_serializer<complete_message>::to_json(json& j, const complete_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "id", msg.id() } };
}

failed_message nlohmann::adl_serializer<failed_message>::from_json(const json& j)
{
	return failed_message(j.at("uuid").get<uuid>(), j.at("id").get<transfer_id>(), j.at("error").get<std::string>());
}

void nlohmann::adl_serializer<failed_message>::to_json(json& j, const failed_message& msg)
{
	j = json{ { "uuid", msg.uuid() }, { "type", msg.type() }, { "id", msg.id() }, { "error", msg.error() } };
}

message_container nlohmann::adl_serializer<message_container>::from_json(const json& j)
{
	message_type t = j.at("type").get<message_type>();

	switch(t)
	{
		case message_type::transfer_cancel: return adl_serializer<cancel_message>::from_json(j);
		case message_type::transfer_query: return adl_serializer<query_message>::from_json(j);
		case message_type::transfer_started: return adl_serializer<started_message>::from_json(j);
		case message_type::transfer_cancelled: return adl_serializer<cancelled_message>::from_json(j);
		case message_type::transfer_status: return adl_serializer<status_message>::from_json(j);
		case message_type::transfer_error: return adl_serializer<error_message>::from_json(j);
		case message_type::transfer_complete: return adl_serializer<complete_message>::from_json(j);
		case message_type::transfer_failed: return adl_serializer<failed_message>::from_json(j);
		/* Carries private keys, we only ever send these. */
		case message_type::transfer_start: break;
	}

	throw std::domain_error("Unexpected message type");
}

void nlohmann::adl_serializer<message_container>::to_json(json& j, const message_container& msg)
{
	return std::visit([&j](auto&& m) { return nlohmann::adl_serializer<std::decay_t<decltype(m)>>::to_json(j, m); }, static_cast<const msg_union&>(msg));
}

message_container net::message_read(const char *buffer, size_t size)
{
	return nlohmann::json::parse(buffer, buffer + size).get<message_container>();
}

std::string net::message_write(const net::message_container& msg)
{
	return static_cast<nlohmann::json>(msg).dump();
}

std::string_view net::message_content_type() noexcept
{
	return "application/json; charset=utf-8";
}

/* Only the type and correlation id, the body may contain credentials. */
std::ostream& courier::net::operator<<(std::ostream& os, const message_container& msg)
{
	return os << get_message_type_string(msg.type()) << "(" << msg.uuid() << ")";
}
