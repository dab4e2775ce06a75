/*
    Copyright (c) 2011-2015 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.

    This file is part of Runas.

    Runas is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Runas is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef RUNAS_ERRORS_HPP
#define RUNAS_ERRORS_HPP

#include "runas/format.hpp"

#include <memory>
#include <system_error>
#include <type_traits>

namespace runas { namespace error {

enum request_errors {
    missing_reader = 1,
    unreadable_body,
    unknown_endpoint,
    method_not_allowed
};

enum discovery_errors {
    null_document = 1,
    parse_error,
    malformed_encoding
};

enum cache_errors {
    cache_disabled = 1,
    cache_corrupted,
    cache_unavailable
};

enum provider_errors {
    mfa_required = 1,
    access_denied,
    request_failed,
    invalid_response,
    spawn_failed
};

enum broker_errors {
    no_active_profile = 1,
    resolve_failed,
    mfa_code_required,
    invalid_mfa_code,
    provider_failure
};

enum resolver_errors {
    profile_not_found = 1,
    invalid_profile,
    unreadable_config
};

enum platform_errors {
    capabilities_failed = 1,
    loopback_not_found,
    address_failed,
    privileges_failed
};

auto
make_error_code(request_errors code) -> std::error_code;

auto
make_error_code(discovery_errors code) -> std::error_code;

auto
make_error_code(cache_errors code) -> std::error_code;

auto
make_error_code(provider_errors code) -> std::error_code;

auto
make_error_code(broker_errors code) -> std::error_code;

auto
make_error_code(resolver_errors code) -> std::error_code;

auto
make_error_code(platform_errors code) -> std::error_code;

// Generic exception

struct error_t:
    public std::system_error
{
    static const std::error_code kInvalidArgumentErrorCode;

    template<class... Args>
    error_t(const std::string& fmt, const Args&... args):
        std::system_error(kInvalidArgumentErrorCode, runas::format(fmt, args...))
    {}

    template<class... Args>
    error_t(std::error_code ec, const std::string& fmt, const Args&... args):
        std::system_error(std::move(ec), runas::format(fmt, args...))
    {}

    template<class E, class... Args, class = typename std::enable_if<
        std::is_error_code_enum<E>::value || std::is_error_condition_enum<E>::value
    >::type>
    error_t(const E err, const std::string& fmt, const Args&... args):
        std::system_error(make_error_code(err), runas::format(fmt, args...))
    {}
};

std::string
to_string(const std::system_error& e);

} // namespace error

using error::error_t;

} // namespace runas

namespace std {

template<>
struct is_error_code_enum<runas::error::request_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::discovery_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::cache_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::provider_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::broker_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::resolver_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<runas::error::platform_errors>:
    public true_type
{ };

} // namespace std

#endif
