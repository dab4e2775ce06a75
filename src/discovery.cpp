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


#include "runas/discovery.hpp"

#include "runas/api/policy.hpp"
#include "runas/logging.hpp"

#include <algorithm>

#include <json/json.h>

using namespace runas;
using namespace runas::discovery;

namespace {

const char kAssumeRoleAction[] = "sts:AssumeRole";

bool
allows_assume_role(const Json::Value& action) {
    if(action.isString()) {
        return action.asString() == kAssumeRoleAction;
    }

    if(action.isArray()) {
        for(const auto& item: action) {
            if(item.isString() && item.asString() == kAssumeRoleAction) {
                return true;
            }
        }
    }

    return false;
}

void
flatten(const Json::Value& resource, std::vector<std::string>& roles) {
    if(resource.isString()) {
        roles.push_back(resource.asString());
    } else if(resource.isArray()) {
        for(const auto& item: resource) {
            if(item.isString()) {
                roles.push_back(item.asString());
            }
        }
    }
}

int
from_hex(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;

    return -1;
}

} // namespace

namespace runas { namespace discovery {

auto
dedup(std::vector<std::string> roles) -> role_set_t {
    std::sort(roles.begin(), roles.end());
    roles.erase(std::unique(roles.begin(), roles.end()), roles.end());

    return roles;
}

auto
extract_roles(const boost::optional<std::string>& document) -> role_set_t {
    if(!document) {
        throw error_t(error::null_document, "policy document is missing");
    }

    if(document->empty()) {
        return role_set_t();
    }

    Json::Reader reader(Json::Features::strictMode());
    Json::Value root;

    if(!reader.parse(*document, root)) {
        throw error_t(error::parse_error, "unable to parse policy document - {}",
            reader.getFormattedErrorMessages());
    }

    if(!root.isObject()) {
        throw error_t(error::parse_error, "policy document must be an object");
    }

    const auto& statements = root["Statement"];

    if(!statements.isArray()) {
        return role_set_t();
    }

    std::vector<std::string> roles;

    for(const auto& statement: statements) {
        if(!statement.isObject()) {
            continue;
        }

        const auto& effect = statement["Effect"];

        if(!effect.isString() || effect.asString() != "Allow") {
            continue;
        }

        if(allows_assume_role(statement["Action"])) {
            flatten(statement["Resource"], roles);
        }
    }

    return dedup(std::move(roles));
}

auto
url_decode(const std::string& text) -> std::string {
    std::string result;
    result.reserve(text.size());

    for(std::size_t i = 0; i < text.size(); ++i) {
        switch(text[i]) {
        case '%': {
            const int hi = i + 2 < text.size() ? from_hex(text[i + 1]) : -1;
            const int lo = i + 2 < text.size() ? from_hex(text[i + 2]) : -1;

            if(hi < 0 || lo < 0) {
                throw error_t(error::malformed_encoding, "invalid escape sequence at offset {}", i);
            }

            result.push_back(static_cast<char>(hi << 4 | lo));
            i += 2;
        } break;
        case '+':
            result.push_back(' ');
            break;
        default:
            result.push_back(text[i]);
        }
    }

    return result;
}

auto
discover(api::policy_t& source, const std::string& profile, const principal_t& principal,
         logging::logger_t& log) -> role_set_t
{
    const auto documents = source.documents(profile, principal);

    std::vector<std::string> roles;

    for(const auto& document: documents) {
        try {
            auto found = extract_roles(document);

            roles.insert(roles.end(), found.begin(), found.end());
        } catch(const std::system_error& e) {
            RUNAS_LOG_WARNING(log, "skipping policy document of '{}': {}", principal.user_name,
                error::to_string(e));
        }
    }

    RUNAS_LOG_DEBUG(log, "discovered {:d} role(s) from {:d} document(s) of '{}'", roles.size(),
        documents.size(), principal.user_name);

    return dedup(std::move(roles));
}

}} // namespace runas::discovery
