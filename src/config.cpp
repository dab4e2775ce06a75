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


#include "runas/config.hpp"

#include "runas/defaults.hpp"
#include "runas/logging.hpp"

#include <cstdlib>
#include <sstream>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <json/json.h>

namespace fs = boost::filesystem;

namespace runas {

namespace {

auto
section(const Json::Value& root, const char* name) -> const Json::Value& {
    const auto& value = root[name];

    if(!value.isNull() && !value.isObject()) {
        throw error_t("invalid configuration for \"{}\" section - must be an object", name);
    }

    return value;
}

auto
string_at(const Json::Value& source, const char* key, const std::string& fallback) -> std::string {
    const auto& value = source[key];

    if(value.isNull()) {
        return fallback;
    }

    if(!value.isString()) {
        throw error_t("invalid configuration for \"{}\" - must be a string", key);
    }

    return value.asString();
}

auto
uint_at(const Json::Value& source, const char* key, Json::UInt64 fallback) -> Json::UInt64 {
    const auto& value = source[key];

    if(value.isNull()) {
        return fallback;
    }

    if(!value.isIntegral() || !value.isConvertibleTo(Json::uintValue)) {
        throw error_t("invalid configuration for \"{}\" - must be a non-negative integer", key);
    }

    return value.asUInt64();
}

auto
serialize(const Json::Value& value) -> std::string {
    Json::FastWriter writer;
    writer.omitEndingLineFeed();

    return writer.write(value);
}

} // namespace

auto
make_config() -> std::unique_ptr<config_t> {
    return parse_config("{}");
}

auto
make_config(const std::string& source_file) -> std::unique_ptr<config_t> {
    const auto source_file_status = fs::status(source_file);

    if(!fs::exists(source_file_status) || !fs::is_regular_file(source_file_status)) {
        throw error_t("configuration file path is invalid");
    }

    fs::ifstream stream(source_file);

    if(!stream) {
        throw error_t("unable to read configuration file");
    }

    std::stringstream buffer;
    buffer << stream.rdbuf();

    return parse_config(buffer.str());
}

auto
parse_config(const std::string& source) -> std::unique_ptr<config_t> {
    auto features = Json::Features::strictMode();
    features.allowComments_ = true;

    Json::Reader reader(features);
    Json::Value root;

    if(!reader.parse(source, root)) {
        throw error_t("configuration file is corrupted - {}", reader.getFormattedErrorMessages());
    }

    if(!root.isObject()) {
        throw error_t("configuration file must contain an object");
    }

    std::unique_ptr<config_t> config(new config_t());

    const auto& server = section(root, "server");

    config->server.address   = string_at(server, "address", defaults::metadata_address);
    config->server.interface = string_at(server, "interface", std::string());

    const auto port = uint_at(server, "port", defaults::metadata_port);

    if(port == 0 || port > 65535) {
        throw error_t("invalid configuration for \"port\" - {} is out of range", port);
    }

    config->server.port    = static_cast<port_t>(port);
    config->server.workers = uint_at(server, "workers", defaults::workers);

    if(config->server.workers == 0) {
        throw error_t("worker pool size must be positive");
    }

    config->cache.path = path::expand(string_at(section(root, "cache"), "path", std::string()));

    if(config->cache.path.empty()) {
        config->cache.path = path::user_cache_dir();
    }

    const auto& profiles = section(root, "profiles");

    config->profiles.config = path::expand(string_at(profiles, "config", defaults::profiles_path));
    config->profiles.default_profile = string_at(profiles, "default", defaults::default_profile);

    const auto& provider = section(root, "provider");

    config->provider.command = string_at(provider, "command", defaults::provider_command);
    config->provider.region  = string_at(provider, "region", std::string());

    config->profile = string_at(root, "profile", std::string());

    const auto& logging_section = section(root, "logging");

    if(logging_section.isMember("loggers")) {
        if(!logging_section["loggers"].isObject()) {
            throw error_t("invalid configuration for \"loggers\" section - must be an object");
        }

        config->logging.loggers = serialize(logging_section["loggers"]);
    } else {
        config->logging.loggers = defaults::logging_config;
    }

    config->logging.severity = logging::severity_of(string_at(logging_section, "severity", "info"));

    return config;
}

namespace path {

auto
expand(const std::string& path) -> std::string {
    if(path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    const char* home = ::getenv("HOME");

    if(home == nullptr) {
        throw error_t("unable to expand '{}' - HOME is not set", path);
    }

    return std::string(home) + path.substr(1);
}

auto
user_cache_dir() -> std::string {
    const char* xdg = ::getenv("XDG_CACHE_HOME");

    if(xdg != nullptr && *xdg != '\0') {
        return xdg;
    }

    const char* home = ::getenv("HOME");

    if(home != nullptr && *home != '\0') {
        return (fs::path(home) / ".cache").string();
    }

    return std::string();
}

} // namespace path

} // namespace runas
