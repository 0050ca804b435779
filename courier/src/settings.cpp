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
#include <fstream>
#include <limits>
#include <optional>
#include <fmt/format.h>
#include <uriparser/Uri.h>
#include <nlohmann/json.hpp>
#include <parg.h>
#include "courier_common.hpp"

enum
{
	ARGDEF_VERSION					= 'v',
	ARGDEF_PLATFORM					= 'p',
	ARGDEF_HELP						= 'h',
	ARGDEF_CONFIG					= 'c',
	ARGDEF_AMQP_URI					= 300,
	ARGDEF_AMQP_ROUTING_KEY,
	ARGDEF_AMQP_DIRECT_EXCHANGE,
	ARGDEF_NO_VERIFY_PEER,
	ARGDEF_NO_VERIFY_HOST,
	ARGDEF_CACERT,
	ARGDEF_MARKER_PERIOD,
	ARGDEF_START_TIMEOUT,
	ARGDEF_CANCEL_TIMEOUT,
	ARGDEF_NOTIFICATION_GRACE,
	ARGDEF_LOG_LEVEL,
	ARGDEF_PULL,
	ARGDEF_PUSH,
	ARGDEF_PATH,
	ARGDEF_REMOTE,
	ARGDEF_PROXY,
	ARGDEF_TOKEN,
	ARGDEF_TOKEN_FILE,
	ARGDEF_HEADER,
	ARGDEF_NO_VERIFY_TRANSFER,
	ARGDEF_SUBJECT,
	ARGDEF_UID,
	ARGDEF_GID,
	ARGDEF_RESTRICT_PATH,
	ARGDEF_DENY_UPLOAD,
	ARGDEF_DENY_DOWNLOAD,
};

static struct parg_option argdefs[] = {
	{ "version",				PARG_NOARG,		nullptr, ARGDEF_VERSION },
	{ "platform",				PARG_NOARG,		nullptr, ARGDEF_PLATFORM },
	{ "help",					PARG_NOARG,		nullptr, ARGDEF_HELP },
	{ "config",					PARG_REQARG,	nullptr, ARGDEF_CONFIG },
	{ "amqp-uri",				PARG_REQARG,	nullptr, ARGDEF_AMQP_URI },
	{ "amqp-routing-key",		PARG_REQARG,	nullptr, ARGDEF_AMQP_ROUTING_KEY },
	{ "amqp-direct-exchange",	PARG_REQARG,	nullptr, ARGDEF_AMQP_DIRECT_EXCHANGE },
	{ "no-verify-peer",			PARG_NOARG,		nullptr, ARGDEF_NO_VERIFY_PEER },
	{ "no-verify-host",			PARG_NOARG,		nullptr, ARGDEF_NO_VERIFY_HOST },
	{ "cacert",					PARG_REQARG,	nullptr, ARGDEF_CACERT },
	{ "marker-period",			PARG_REQARG,	nullptr, ARGDEF_MARKER_PERIOD },
	{ "start-timeout",			PARG_REQARG,	nullptr, ARGDEF_START_TIMEOUT },
	{ "cancel-timeout",			PARG_REQARG,	nullptr, ARGDEF_CANCEL_TIMEOUT },
	{ "notification-grace",		PARG_REQARG,	nullptr, ARGDEF_NOTIFICATION_GRACE },
	{ "log-level",				PARG_REQARG,	nullptr, ARGDEF_LOG_LEVEL },
	{ "pull",					PARG_NOARG,		nullptr, ARGDEF_PULL },
	{ "push",					PARG_NOARG,		nullptr, ARGDEF_PUSH },
	{ "path",					PARG_REQARG,	nullptr, ARGDEF_PATH },
	{ "remote",					PARG_REQARG,	nullptr, ARGDEF_REMOTE },
	{ "proxy",					PARG_REQARG,	nullptr, ARGDEF_PROXY },
	{ "token",					PARG_REQARG,	nullptr, ARGDEF_TOKEN },
	{ "token-file",				PARG_REQARG,	nullptr, ARGDEF_TOKEN_FILE },
	{ "header",					PARG_REQARG,	nullptr, ARGDEF_HEADER },
	{ "no-verify-transfer",		PARG_NOARG,		nullptr, ARGDEF_NO_VERIFY_TRANSFER },
	{ "subject",				PARG_REQARG,	nullptr, ARGDEF_SUBJECT },
	{ "uid",					PARG_REQARG,	nullptr, ARGDEF_UID },
	{ "gid",					PARG_REQARG,	nullptr, ARGDEF_GID },
	{ "restrict-path",			PARG_REQARG,	nullptr, ARGDEF_RESTRICT_PATH },
	{ "deny-upload",			PARG_NOARG,		nullptr, ARGDEF_DENY_UPLOAD },
	{ "deny-download",			PARG_NOARG,		nullptr, ARGDEF_DENY_DOWNLOAD },
	{ nullptr, 0, nullptr, 0 }
};

static const char *USAGE_OPTIONS =
"  -v, --version\n"
"                          Display version string\n"
"  -p, --platform\n"
"                          Display platform string\n"
"  -h, --help\n"
"                          Display help message\n"
"  -c, --config=PATH\n"
"                          Path to a configuration file.\n"
"                          - Any arguments already provided will be overridden.\n"
"                          - Any subsequent arguments will override the configuration values.\n"
"  --amqp-uri=URI\n"
"                          The URI of the AMQP broker\n"
"  --amqp-routing-key=KEY\n"
"                          The routing key of the transfer service. Defaults to \"transfermanager\"\n"
"  --amqp-direct-exchange=NAME\n"
"                          The name of the direct exchange to use. Defaults to \"amq.direct\"\n"
"  --no-verify-peer\n"
"                          Disable peer verification\n"
"  --no-verify-host\n"
"                          Disable hostname verification\n"
"  --cacert=PATH\n"
"                          Path to the CA certificate(s) of the broker\n"
"  --marker-period=MS\n"
"                          Interval between performance markers. Defaults to 5000\n"
"  --start-timeout=MS\n"
"                          How long to wait for the transfer service to accept. Defaults to 60000\n"
"  --cancel-timeout=MS\n"
"                          How long to wait for a cancellation to be acknowledged. Defaults to 10000\n"
"  --notification-grace=SECONDS\n"
"                          How long an early or late notification is kept. Defaults to 30\n"
"  --log-level={trace,debug,info,warn,error}\n"
"                          Discard log messages below this level. Defaults to info\n"
"  --pull, --push\n"
"                          Copy the remote file into the local path, or the local path to the remote\n"
"  --path=PATH\n"
"                          The local path\n"
"  --remote=URI\n"
"                          The remote URI, one of gsiftp://, http:// or https://\n"
"  --proxy=PATH\n"
"                          PEM file holding the certificate chain and private key to delegate\n"
"  --token=TOKEN, --token-file=PATH\n"
"                          Bearer token to present to the remote server\n"
"  --header=NAME:VALUE\n"
"                          A request header. May be given multiple times\n"
"                          - Only TransferHeader* headers are passed to the remote server\n"
"  --no-verify-transfer\n"
"                          Don't ask the transfer service to verify the transferred data\n"
"  --subject=NAME, --uid=UID, --gid=GID\n"
"                          Who the transfer is performed on behalf of\n"
"  --restrict-path=PREFIX\n"
"                          Only allow transfers beneath PREFIX. May be given multiple times\n"
"  --deny-upload, --deny-download\n"
"                          Forbid writing into, or reading out of, local storage\n"
;

using namespace courier;

static int usage(int val, std::ostream& s, const char *argv0)
{
	s << "Usage: " << filesystem::path(argv0).filename().string() << " [OPTIONS]\nOptions:\n";
	s << USAGE_OPTIONS;
	return val;
}

static int parseerror(int val, std::ostream& s, const char *argv0, const char *msg)
{
	s << "Error parsing arguments: " << msg << std::endl;
	return usage(val, s, argv0);
}

static bool parse_number(std::string_view v, uint64_t max, uint64_t& out) noexcept
{
	if(v.empty())
		return false;

	uint64_t n = 0;
	for(char c : v)
	{
		if(c < '0' || c > '9')
			return false;

		n = n * 10 + static_cast<uint64_t>(c - '0');
		if(n > max)
			return false;
	}

	out = n;
	return true;
}

static bool validate_uri(std::ostream& out, settings& s)
{
	uri_ptr& uri = s.amqp_uri;

	{ /* Scheme */
		s.amqp_sscheme = make_view(uri->scheme.first, uri->scheme.afterLast);
		if(s.amqp_sscheme.empty())
			return out << "URI Scheme cannot be empty. Must be one of [amqp, amqps]." << std::endl, false;

		if(s.amqp_sscheme == "amqp")
			s.amqp_scheme = settings::amqp_scheme_t::amqp;
		else if(s.amqp_sscheme == "amqps")
			s.amqp_scheme = settings::amqp_scheme_t::amqps;
		else
			return out << "Invalid URI Scheme. Must be one of [amqp, amqps]." << std::endl, false;
	}

	{ /* Host */
		std::string_view host = make_view(uri->hostText.first, uri->hostText.afterLast);
		if(host.empty())
			return out << "Host cannot be empty." << std::endl, false;

		s.amqp_host = host;
	}

	{ /* Port */
		std::string_view sport = make_view(uri->portText.first, uri->portText.afterLast);

		/* No port specified? Use defaults. */
		if(sport.empty())
		{
			if(s.amqp_scheme == settings::amqp_scheme_t::amqp)
				s.amqp_port = 5672;
			else
				s.amqp_port = 5671;
		}
		else
		{
			uint64_t port;
			if(!parse_number(sport, 65535, port) || port == 0)
				return out << "Port must be in the range [1, 65535]." << std::endl, false;

			s.amqp_port = static_cast<uint16_t>(port);
		}
	}

	{ /* User/Pass */
		std::string_view user = make_view(uri->userInfo.first, uri->userInfo.afterLast);

		size_t colonPos = user.find(':', 0);

		if(colonPos == std::string::npos)
		{
			s.amqp_user = user;
		}
		else
		{
			s.amqp_user = user.substr(0, colonPos);
			s.amqp_pass = user.substr(colonPos + 1, std::string::npos);
		}
	}

	{ /* VHost */
		/* NB: Things like cour%2Fier will be split into cour/ier. This is intentional. */
		for(UriPathSegmentA *seg = uri->pathHead; seg; seg = seg->next)
		{
			s.amqp_vhost.append(seg->text.first, seg->text.afterLast);
			s.amqp_vhost.push_back('/');
		}
		if(uri->pathHead)
			s.amqp_vhost.pop_back();

		if(s.amqp_vhost.empty())
			s.amqp_vhost = "/";
	}

	return true;
}

struct tmpargs
{
	using sopt_t = std::optional<std::string>;
	using bopt_t = std::optional<bool>;

	sopt_t	amqp_uri;
	sopt_t	amqp_routing_key;
	sopt_t	amqp_direct_exchange;
	bopt_t	no_verify_peer;
	bopt_t	no_verify_host;
	sopt_t	ca_cert;
	sopt_t	marker_period;
	sopt_t	start_timeout;
	sopt_t	cancel_timeout;
	sopt_t	notification_grace;
	sopt_t	log_level;

	std::optional<direction_t> direction;
	sopt_t	path;
	sopt_t	remote;
	sopt_t	proxy;
	sopt_t	token;
	sopt_t	token_file;
	std::vector<std::string> headers;
	bopt_t	no_verify_transfer;
	sopt_t	subject;
	sopt_t	uid;
	sopt_t	gid;
	std::vector<std::string> restrict_paths;
	bopt_t	deny_upload;
	bopt_t	deny_download;
};

static void load_config_file(tmpargs& s, const char *path)
{
	std::ifstream f;
	f.exceptions(std::ios::badbit | std::ios::failbit);
	f.open(path, std::ios::in | std::ios::binary);

	nlohmann::json j = nlohmann::json::parse(f);

	auto number_or_string = [](const nlohmann::json& v, std::optional<std::string>& out) {
		if(v.is_string())
			out = v.get<std::string>();
		else if(v.is_number_unsigned())
			out = std::to_string(v.get<uint64_t>());
	};

	if(auto v = j["/amqp/uri"_json_pointer]; v.is_string())
		s.amqp_uri = v.get<std::string>();

	if(auto v = j["/amqp/routing_key"_json_pointer]; v.is_string())
		s.amqp_routing_key = v.get<std::string>();

	if(auto v = j["/amqp/direct_exchange"_json_pointer]; v.is_string())
		s.amqp_direct_exchange = v.get<std::string>();

	if(auto v = j["/no_verify_peer"_json_pointer]; v.is_boolean())
		s.no_verify_peer = v.get<bool>();

	if(auto v = j["/no_verify_host"_json_pointer]; v.is_boolean())
		s.no_verify_host = v.get<bool>();

	if(auto v = j["/cacert"_json_pointer]; v.is_string())
		s.ca_cert = v.get<std::string>();

	number_or_string(j["/marker_period"_json_pointer], s.marker_period);
	number_or_string(j["/start_timeout"_json_pointer], s.start_timeout);
	number_or_string(j["/cancel_timeout"_json_pointer], s.cancel_timeout);
	number_or_string(j["/notification_grace"_json_pointer], s.notification_grace);

	if(auto v = j["/log_level"_json_pointer]; v.is_string())
		s.log_level = v.get<std::string>();

	if(auto v = j["/proxy"_json_pointer]; v.is_string())
		s.proxy = v.get<std::string>();

	if(auto v = j["/token_file"_json_pointer]; v.is_string())
		s.token_file = v.get<std::string>();
}

static bool parse_header(std::string_view arg, header_map& headers)
{
	size_t colon = arg.find(':');
	if(colon == std::string_view::npos || colon == 0)
		return false;

	std::string_view value = arg.substr(colon + 1);
	while(!value.empty() && (value.front() == ' ' || value.front() == '\t'))
		value.remove_prefix(1);

	headers[std::string(arg.substr(0, colon))] = value;
	return true;
}

static bool parse_duration(std::string_view arg, std::chrono::milliseconds& ms)
{
	uint64_t n;
	if(!parse_number(arg, std::numeric_limits<uint32_t>::max(), n))
		return false;

	ms = std::chrono::milliseconds(n);
	return true;
}

bool courier::parse_program_arguments(int argc, char **argv, int& status, std::ostream& out, std::ostream& err, settings& s)
{
	parg_state ps{};
	parg_init(&ps);

	tmpargs tmp;
	for(int c; (c = parg_getopt_long(&ps, argc, argv, "vphc:", argdefs, nullptr)) != -1; )
	{
		switch(c)
		{
			case ARGDEF_VERSION:
				out << g_compile_info.description << std::endl;
				status = 0;
				return false;

			case ARGDEF_PLATFORM:
				out << g_compile_info.platform_string << std::endl;
				status = 0;
				return false;

			case ARGDEF_HELP:
				status = usage(0, out, argv[0]);
				return false;

			case ARGDEF_CONFIG:
				try
				{
					load_config_file(tmp, ps.optarg);
				}
				catch(std::exception& e)
				{
					err << "Unable to load configuration file " << ps.optarg << ": " << e.what() << std::endl;
					status = 2;
					return false;
				}
				break;

			case ARGDEF_AMQP_URI:
				tmp.amqp_uri = ps.optarg;
				break;

			case ARGDEF_AMQP_ROUTING_KEY:
				tmp.amqp_routing_key = ps.optarg;
				break;

			case ARGDEF_AMQP_DIRECT_EXCHANGE:
				tmp.amqp_direct_exchange = ps.optarg;
				break;

			case ARGDEF_NO_VERIFY_PEER:
				tmp.no_verify_peer = true;
				break;

			case ARGDEF_NO_VERIFY_HOST:
				tmp.no_verify_host = true;
				break;

			case ARGDEF_CACERT:
				tmp.ca_cert = ps.optarg;
				break;

			case ARGDEF_MARKER_PERIOD:
				tmp.marker_period = ps.optarg;
				break;

			case ARGDEF_START_TIMEOUT:
				tmp.start_timeout = ps.optarg;
				break;

			case ARGDEF_CANCEL_TIMEOUT:
				tmp.cancel_timeout = ps.optarg;
				break;

			case ARGDEF_NOTIFICATION_GRACE:
				tmp.notification_grace = ps.optarg;
				break;

			case ARGDEF_LOG_LEVEL:
				tmp.log_level = ps.optarg;
				break;

			case ARGDEF_PULL:
				tmp.direction = direction_t::pull;
				break;

			case ARGDEF_PUSH:
				tmp.direction = direction_t::push;
				break;

			case ARGDEF_PATH:
				tmp.path = ps.optarg;
				break;

			case ARGDEF_REMOTE:
				tmp.remote = ps.optarg;
				break;

			case ARGDEF_PROXY:
				tmp.proxy = ps.optarg;
				break;

			case ARGDEF_TOKEN:
				tmp.token = ps.optarg;
				break;

			case ARGDEF_TOKEN_FILE:
				tmp.token_file = ps.optarg;
				break;

			case ARGDEF_HEADER:
				tmp.headers.emplace_back(ps.optarg);
				break;

			case ARGDEF_NO_VERIFY_TRANSFER:
				tmp.no_verify_transfer = true;
				break;

			case ARGDEF_SUBJECT:
				tmp.subject = ps.optarg;
				break;

			case ARGDEF_UID:
				tmp.uid = ps.optarg;
				break;

			case ARGDEF_GID:
				tmp.gid = ps.optarg;
				break;

			case ARGDEF_RESTRICT_PATH:
				tmp.restrict_paths.emplace_back(ps.optarg);
				break;

			case ARGDEF_DENY_UPLOAD:
				tmp.deny_upload = true;
				break;

			case ARGDEF_DENY_DOWNLOAD:
				tmp.deny_download = true;
				break;

			case '?':
			default:
				status = usage(2, out, argv[0]);
				return false;
		}
	}

	if(!tmp.amqp_uri)
	{
		status = parseerror(2, out, argv[0], "Option --amqp-uri is required.");
		return false;
	}

	if(!tmp.direction)
	{
		status = parseerror(2, out, argv[0], "One of --pull or --push is required.");
		return false;
	}

	if(!tmp.path || tmp.path->empty())
	{
		status = parseerror(2, out, argv[0], "Option --path is required.");
		return false;
	}

	if(!tmp.remote || tmp.remote->empty())
	{
		status = parseerror(2, out, argv[0], "Option --remote is required.");
		return false;
	}

	if(tmp.token && tmp.token_file)
	{
		status = parseerror(2, out, argv[0], "Options --token and --token-file are mutually exclusive.");
		return false;
	}

	if(tmp.proxy && (tmp.token || tmp.token_file))
	{
		status = parseerror(2, out, argv[0], "Option --proxy can't be used with a bearer token.");
		return false;
	}

	s = settings();

	s.amqp_raw_uri = tmp.amqp_uri.value();
	{ /* Validate the AMQP URI */
		if(!(s.amqp_uri = parse_uri(s.amqp_raw_uri)))
		{
			status = parseerror(2, out, argv[0], "Malformed URI.");
			return false;
		}

		if(!validate_uri(out, s))
		{
			status = 2;
			return false;
		}
	}

	s.amqp_routing_key = tmp.amqp_routing_key.value_or("transfermanager");
	s.amqp_direct_exchange = tmp.amqp_direct_exchange.value_or("amq.direct");

	s.ssl_no_verify_peer = tmp.no_verify_peer.value_or(false);
	s.ssl_no_verify_hostname = tmp.no_verify_host.value_or(false);

	s.ca_path = tmp.ca_cert.value_or("");

	if(tmp.marker_period && (!parse_duration(*tmp.marker_period, s.marker_period) || s.marker_period.count() == 0))
	{
		status = parseerror(2, out, argv[0], "Invalid marker period.");
		return false;
	}

	if(tmp.start_timeout && !parse_duration(*tmp.start_timeout, s.start_timeout))
	{
		status = parseerror(2, out, argv[0], "Invalid start timeout.");
		return false;
	}

	if(tmp.cancel_timeout && !parse_duration(*tmp.cancel_timeout, s.cancel_timeout))
	{
		status = parseerror(2, out, argv[0], "Invalid cancel timeout.");
		return false;
	}

	if(tmp.notification_grace)
	{
		uint64_t n;
		if(!parse_number(*tmp.notification_grace, std::numeric_limits<uint32_t>::max(), n))
		{
			status = parseerror(2, out, argv[0], "Invalid notification grace period.");
			return false;
		}
		s.notification_grace = std::chrono::seconds(n);
	}

	if(tmp.log_level && !log::parse_level(*tmp.log_level, s.log_level))
	{
		status = parseerror(2, out, argv[0], "Invalid log level.");
		return false;
	}

	s.direction = tmp.direction.value();
	s.path = tmp.path.value();
	s.remote = tmp.remote.value();
	s.proxy_path = tmp.proxy.value_or("");
	s.token = tmp.token.value_or("");
	s.token_file = tmp.token_file.value_or("");

	for(const std::string& h : tmp.headers)
	{
		if(!parse_header(h, s.headers))
		{
			status = parseerror(2, out, argv[0], fmt::format("Malformed header \"{}\".", h).c_str());
			return false;
		}
	}

	s.verify_transfer = !tmp.no_verify_transfer.value_or(false);
	s.subject_name = tmp.subject.value_or("");

	uint64_t id;
	if(tmp.uid)
	{
		if(!parse_number(*tmp.uid, std::numeric_limits<uint32_t>::max(), id))
		{
			status = parseerror(2, out, argv[0], "Invalid uid.");
			return false;
		}
		s.uid = static_cast<uint32_t>(id);
	}

	if(tmp.gid)
	{
		if(!parse_number(*tmp.gid, std::numeric_limits<uint32_t>::max(), id))
		{
			status = parseerror(2, out, argv[0], "Invalid gid.");
			return false;
		}
		s.gid = static_cast<uint32_t>(id);
	}

	s.restrict_paths = std::move(tmp.restrict_paths);
	s.allow_upload = !tmp.deny_upload.value_or(false);
	s.allow_download = !tmp.deny_download.value_or(false);
	return true;
}

settings::settings() :
	amqp_raw_uri(""),
	amqp_uri(nullptr),
	amqp_scheme(amqp_scheme_t::amqp),
	amqp_sscheme(""),
	amqp_host(""),
	amqp_port(0),
	amqp_user(""),
	amqp_pass(""),
	amqp_vhost(""),
	amqp_routing_key(""),
	amqp_direct_exchange(""),
	ssl_no_verify_peer(false),
	ssl_no_verify_hostname(false),
	ca_path(""),
	marker_period(5000),
	start_timeout(60000),
	cancel_timeout(10000),
	notification_grace(30),
	log_level(log::level_t::info),
	direction(direction_t::pull),
	path(""),
	remote(""),
	proxy_path(""),
	token(""),
	token_file(""),
	headers(),
	verify_transfer(true),
	subject_name(""),
	uid(0),
	gid(0),
	restrict_paths(),
	allow_upload(true),
	allow_download(true)
{}
