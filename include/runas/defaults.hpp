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

#ifndef RUNAS_DEFAULTS_HPP
#define RUNAS_DEFAULTS_HPP

#include "runas/forwards.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace runas {

struct defaults {
    // Well-known metadata endpoint.
    static const std::string metadata_address;
    static const port_t      metadata_port;
    static const std::size_t workers;

    // Endpoint paths.
    static const std::string home_path;
    static const std::string mfa_path;
    static const std::string profile_path;
    static const std::string credentials_path;
    static const std::string list_roles_path;
    static const std::string refresh_path;

    // Request body limits, in bytes.
    static const std::size_t mfa_read_limit;
    static const std::size_t profile_read_limit;

    // MFA codes are exactly this long.
    static const std::size_t mfa_code_length;

    // Provider limits.
    static const std::chrono::seconds session_duration;
    static const std::chrono::seconds assume_role_duration;
    static const std::chrono::seconds assume_role_min_duration;

    // Credential cache file prefix, the source profile name is appended.
    static const std::string cache_prefix;

    // Profiles.
    static const std::string profiles_path;
    static const std::string default_profile;

    // Identity provider client.
    static const std::string provider_command;

    // Logging.
    static const std::string logging_backend;
    static const std::string logging_config;
};

} // namespace runas

#endif
