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
#ifndef _COURIER_ERRORS_HPP
#define _COURIER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace courier {

/*
** A request that could not be turned into a running transfer.
** Carries an HTTP-style status code for the request layer to report.
*/
class transfer_error : public std::runtime_error
{
public:
	transfer_error(int status, const std::string& message);

	int status() const noexcept;

private:
	int m_status;
};

class permission_denied_error : public transfer_error
{
public:
	explicit permission_denied_error(const std::string& message);
};

class unsupported_scheme_error : public transfer_error
{
public:
	explicit unsupported_scheme_error(const std::string& scheme);
};

class unsupported_credential_error : public transfer_error
{
public:
	explicit unsupported_credential_error(const std::string& message);
};

/* No route to the execution service, or it didn't answer in time. */
class service_unavailable_error : public transfer_error
{
public:
	explicit service_unavailable_error(const std::string& reason);

	const std::string& reason() const noexcept;

private:
	std::string m_reason;
};

/* The execution service explicitly declined the transfer. */
class transfer_rejected_error : public transfer_error
{
public:
	explicit transfer_rejected_error(const std::string& explanation);

	const std::string& explanation() const noexcept;

private:
	std::string m_explanation;
};

}

#endif /* _COURIER_ERRORS_HPP */
