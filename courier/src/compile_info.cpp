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
#include <fmt/core.h>
#include <uriparser/UriBase.h>
#include <openssl/opensslv.h>
#include <amqp.h>
#include "config.h"

#define _COURIER_STR(x) #x
#define COURIER_STR(x) _COURIER_STR(x)

#define COURIER_FMT_VERSION_STRING \
	COURIER_STR(FMT_VERSION)

#define COURIER_URIPARSER_VERSION_STRING \
	COURIER_STR(URI_VER_MAJOR) "." COURIER_STR(URI_VER_MINOR) "." COURIER_STR(URI_VER_RELEASE)

#define COURIER_DESCRIPTION_STRING \
	"Courier Transfer Orchestrator " COURIER_VERSION_STRING " (" COURIER_PLATFORM_STRING ")"

const courier::compile_info_t courier::g_compile_info = {
	COURIER_DESCRIPTION_STRING,
	COURIER_VERSION_STRING,
	COURIER_PLATFORM_STRING,
	{
		COURIER_FMT_VERSION_STRING,
		COURIER_URIPARSER_VERSION_STRING,
		OPENSSL_VERSION_TEXT,
		AMQ_VERSION_STRING,
	}
};
