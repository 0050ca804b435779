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
#include "errors.hpp"

using namespace courier;

constexpr static int status_bad_request = 400;
constexpr static int status_forbidden = 403;
constexpr static int status_internal_server_error = 500;

transfer_error::transfer_error(int status, const std::string& message) :
	std::runtime_error(message),
	m_status(status)
{}

int transfer_error::status() const noexcept
{
	return m_status;
}

permission_denied_error::permission_denied_error(const std::string& message) :
	transfer_error(status_forbidden, message)
{}

unsupported_scheme_error::unsupported_scheme_error(const std::string& scheme) :
	transfer_error(status_bad_request, "unsupported scheme: " + scheme)
{}

unsupported_credential_error::unsupported_credential_error(const std::string& message) :
	transfer_error(status_bad_request, message)
{}

service_unavailable_error::service_unavailable_error(const std::string& reason) :
	transfer_error(status_internal_server_error, "transfer service unavailable"),
	m_reason(reason)
{}

const std::string& service_unavailable_error::reason() const noexcept
{
	return m_reason;
}

transfer_rejected_error::transfer_rejected_error(const std::string& explanation) :
	transfer_error(status_internal_server_error, "transfer not accepted: " + explanation),
	m_explanation(explanation)
{}

const std::string& transfer_rejected_error::explanation() const noexcept
{
	return m_explanation;
}
