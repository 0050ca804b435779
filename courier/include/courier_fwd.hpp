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
#ifndef _COURIER_FWD_HPP
#define _COURIER_FWD_HPP

/* Forward Declarations */
#include <cstdio>
#include <cstdint>
#include <memory>
#include <filesystem>

#include "config.h"

namespace courier { namespace filesystem = std::filesystem; }

#include <openssl/ossl_typ.h>

/* <uriparser/Uri.h> */
struct UriUriStructA;
typedef struct UriUriStructA UriUriA;

/* <amqp.h> */
struct amqp_socket_t_;
typedef struct amqp_socket_t_ amqp_socket_t;

struct amqp_bytes_t_;
typedef struct amqp_bytes_t_ amqp_bytes_t;

struct amqp_connection_state_t_;
typedef struct amqp_connection_state_t_ *amqp_connection_state_t;

namespace courier
{

struct deleter_uri { void operator()(UriUriA *uri) const noexcept; };
using uri_ptr = std::unique_ptr<UriUriA, deleter_uri>;

struct deleter_x509 { void operator()(X509 *ptr) const noexcept; };
using x509_ptr = std::unique_ptr<X509, deleter_x509>;

struct deleter_evp_pkey { void operator()(EVP_PKEY *ptr) const noexcept; };
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, deleter_evp_pkey>;

struct deleter_bio { void operator()(BIO *ptr) const noexcept; };
using bio_ptr = std::unique_ptr<BIO, deleter_bio>;

struct deleter_amqp_conn { void operator()(amqp_connection_state_t conn) const noexcept; };
using amqp_conn_ptr = std::unique_ptr<amqp_connection_state_t_, deleter_amqp_conn>;

struct deleter_cstdio { void operator()(FILE *f) const noexcept; };
using cstdio_ptr = std::unique_ptr<FILE, deleter_cstdio>;
using file_ptr = cstdio_ptr;

using transfer_id = int64_t;

class transfer;
class transfer_registry;
class orchestrator;
class execution_service;
class notification_listener;
class client_channel;
class amqp_consumer;
}

#endif /* _COURIER_FWD_HPP */
