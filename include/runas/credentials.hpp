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

#ifndef RUNAS_CREDENTIALS_HPP
#define RUNAS_CREDENTIALS_HPP

#include "runas/common.hpp"

#include <chrono>

namespace runas {

typedef std::chrono::system_clock clock_type;

struct principal_t {
    std::string account;
    std::string user_name;
    std::string arn;
};

struct role_config_t {
    // Name the configuration was resolved from, as selected by the client.
    std::string profile;

    std::string source_profile;
    std::string role_arn;
    std::string mfa_serial;
    std::string external_id;

    std::chrono::seconds session_duration;
    std::chrono::seconds role_duration;
};

struct session_credentials_t {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    clock_type::time_point expiration;

    bool
    expired(clock_type::time_point now = clock_type::now()) const {
        return expiration <= now;
    }
};

struct role_credentials_t {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    // What the metadata endpoint reports, not what the provider returned.
    clock_type::time_point expiration;
};

// Time formatting

namespace chrono {

// 2006-01-02T15:04:05Z
auto
to_rfc3339(clock_type::time_point time) -> std::string;

// Accepts both the 'Z' and the numeric '+hh:mm' offset forms, fractional seconds are dropped.
auto
from_rfc3339(const std::string& text) -> clock_type::time_point;

// Human readable local time, e.g. "2006-01-02 15:04:05 -0700 MST".
auto
to_local(clock_type::time_point time) -> std::string;

} // namespace chrono

// Serialization of the session credentials cache blob.

auto
to_json(const session_credentials_t& credentials) -> std::string;

auto
session_from_json(const std::string& blob) -> session_credentials_t;

// The fixed instance metadata document served to the SDKs.
auto
to_metadata_json(const role_credentials_t& credentials, clock_type::time_point updated) -> std::string;

} // namespace runas

#endif
