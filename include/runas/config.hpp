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


#ifndef RUNAS_CONFIG_HPP
#define RUNAS_CONFIG_HPP

#include "runas/common.hpp"

namespace runas {

struct config_t {
    struct server_t {
        std::string address;
        port_t port;

        // Loopback interface to carry the metadata address, detected when empty.
        std::string interface;

        std::size_t workers;
    } server;

    struct cache_t {
        // Session credentials cache directory, empty disables caching.
        std::string path;
    } cache;

    struct profiles_t {
        std::string config;
        std::string default_profile;
    } profiles;

    struct provider_t {
        std::string command;
        std::string region;
    } provider;

    // Initial profile.
    std::string profile;

    struct logging_t {
        // Serialized blackhole configuration, keyed by logger name.
        std::string loggers;
        logging::priorities severity;
    } logging;
};

// Built-in defaults, used as is when no configuration file is given.
auto
make_config() -> std::unique_ptr<config_t>;

auto
make_config(const std::string& source_file) -> std::unique_ptr<config_t>;

auto
parse_config(const std::string& source) -> std::unique_ptr<config_t>;

namespace path {

// Expands a leading '~' to the home directory.
auto
expand(const std::string& path) -> std::string;

// Per-user cache directory: $XDG_CACHE_HOME or $HOME/.cache. Empty when neither is set.
auto
user_cache_dir() -> std::string;

} // namespace path

} // namespace runas

#endif
