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

#include "runas/credentials.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include <json/json.h>

using namespace runas;

namespace {

auto
to_time_t(clock_type::time_point time) -> std::time_t {
    return clock_type::to_time_t(time);
}

auto
format_tm(const std::tm& tm, const char* pattern) -> std::string {
    char buffer[64];

    const size_t size = std::strftime(buffer, sizeof(buffer), pattern, &tm);

    return std::string(buffer, size);
}

auto
require_string(const Json::Value& object, const char* key) -> std::string {
    const auto& value = object[key];

    if(!value.isString() || value.asString().empty()) {
        throw error_t(error::cache_corrupted, "field '{}' is missing", key);
    }

    return value.asString();
}

} // namespace

namespace runas { namespace chrono {

auto
to_rfc3339(clock_type::time_point time) -> std::string {
    const std::time_t value = to_time_t(time);
    std::tm tm;

    ::gmtime_r(&value, &tm);

    return format_tm(tm, "%Y-%m-%dT%H:%M:%SZ");
}

auto
from_rfc3339(const std::string& text) -> clock_type::time_point {
    std::tm tm = std::tm();

    const char* tail = ::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);

    if(tail == nullptr) {
        throw error_t("unable to parse time '{}'", text);
    }

    // Fractional seconds carry nothing the expiry logic cares about.
    if(*tail == '.') {
        do { ++tail; } while(std::isdigit(static_cast<unsigned char>(*tail)));
    }

    long offset = 0;

    if(*tail == 'Z' || *tail == 'z') {
        ++tail;
    } else if(*tail == '+' || *tail == '-') {
        const int sign = *tail == '-' ? -1 : 1;
        int hours = 0, minutes = 0;

        if(std::sscanf(tail + 1, "%2d:%2d", &hours, &minutes) != 2 &&
           std::sscanf(tail + 1, "%2d%2d",  &hours, &minutes) != 2)
        {
            throw error_t("unable to parse time zone offset in '{}'", text);
        }

        offset = sign * (hours * 3600L + minutes * 60L);
        tail += std::string(tail).size();
    } else if(*tail != '\0') {
        throw error_t("unexpected trailing characters in '{}'", text);
    }

    if(*tail != '\0') {
        throw error_t("unexpected trailing characters in '{}'", text);
    }

    return clock_type::from_time_t(::timegm(&tm) - offset);
}

auto
to_local(clock_type::time_point time) -> std::string {
    const std::time_t value = to_time_t(time);
    std::tm tm;

    ::localtime_r(&value, &tm);

    return format_tm(tm, "%Y-%m-%d %H:%M:%S %z %Z");
}

}} // namespace runas::chrono

namespace runas {

auto
to_json(const session_credentials_t& credentials) -> std::string {
    Json::Value root(Json::objectValue);

    root["AccessKeyId"]     = credentials.access_key_id;
    root["SecretAccessKey"] = credentials.secret_access_key;
    root["SessionToken"]    = credentials.session_token;
    root["Expiration"]      = chrono::to_rfc3339(credentials.expiration);

    Json::FastWriter writer;
    writer.omitEndingLineFeed();

    return writer.write(root);
}

auto
session_from_json(const std::string& blob) -> session_credentials_t {
    Json::Reader reader(Json::Features::strictMode());
    Json::Value root;

    if(!reader.parse(blob, root)) {
        throw error_t(error::cache_corrupted, "unable to parse credentials - {}",
            reader.getFormattedErrorMessages());
    }

    if(!root.isObject()) {
        throw error_t(error::cache_corrupted, "credentials must be an object");
    }

    session_credentials_t credentials;

    credentials.access_key_id     = require_string(root, "AccessKeyId");
    credentials.secret_access_key = require_string(root, "SecretAccessKey");
    credentials.session_token     = require_string(root, "SessionToken");

    try {
        credentials.expiration = chrono::from_rfc3339(require_string(root, "Expiration"));
    } catch(const std::system_error& e) {
        throw error_t(error::cache_corrupted, "{}", e.what());
    }

    return credentials;
}

auto
to_metadata_json(const role_credentials_t& credentials, clock_type::time_point updated) -> std::string {
    Json::Value root(Json::objectValue);

    root["Code"]            = "Success";
    root["LastUpdated"]     = chrono::to_rfc3339(updated);
    root["Type"]            = "AWS-HMAC";
    root["AccessKeyId"]     = credentials.access_key_id;
    root["SecretAccessKey"] = credentials.secret_access_key;
    root["Token"]           = credentials.session_token;
    root["Expiration"]      = chrono::to_rfc3339(credentials.expiration);

    Json::FastWriter writer;
    writer.omitEndingLineFeed();

    return writer.write(root);
}

} // namespace runas
