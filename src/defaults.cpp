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

#include "runas/defaults.hpp"

using namespace runas;

const std::string defaults::metadata_address = "169.254.169.254";
const port_t      defaults::metadata_port    = 80;
const std::size_t defaults::workers          = 4;

const std::string defaults::home_path        = "/";
const std::string defaults::mfa_path         = "/mfa";
const std::string defaults::profile_path     = "/profile";
const std::string defaults::credentials_path = "/latest/meta-data/iam/security-credentials/";
const std::string defaults::list_roles_path  = "/list-roles";
const std::string defaults::refresh_path     = "/refresh";

const std::size_t defaults::mfa_read_limit     = 64;
const std::size_t defaults::profile_read_limit = 4096;

const std::size_t defaults::mfa_code_length = 6;

const std::chrono::seconds defaults::session_duration         = std::chrono::hours(12);
const std::chrono::seconds defaults::assume_role_duration     = std::chrono::hours(1);
const std::chrono::seconds defaults::assume_role_min_duration = std::chrono::minutes(15);

const std::string defaults::cache_prefix = ".aws_session_token_";

const std::string defaults::profiles_path   = "~/.aws/config";
const std::string defaults::default_profile = "default";

const std::string defaults::provider_command = "aws";

const std::string defaults::logging_backend = "core";

const std::string defaults::logging_config = R"({
    "core": [{
        "type": "blocking",
        "formatter": {
            "type": "string",
            "sevmap": ["DEBUG", "INFO", "WARNING", "ERROR"],
            "pattern": "{timestamp} {severity:s}: {message}, [{...}]"
        },
        "sinks": [{
            "type": "console"
        }]
    }]
})";
