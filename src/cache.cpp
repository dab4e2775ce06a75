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


#include "runas/cache.hpp"

#include "runas/defaults.hpp"
#include "runas/logging.hpp"

#include <sstream>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

using namespace runas;

namespace fs = boost::filesystem;

session_cache_t::session_cache_t(std::shared_ptr<logging::logger_t> log, const std::string& directory):
    m_log(std::move(log)),
    m_directory(directory)
{ }

bool
session_cache_t::enabled() const {
    return !m_directory.empty();
}

auto
session_cache_t::path(const std::string& profile) const -> std::string {
    if(!enabled() || profile.empty()) {
        return std::string();
    }

    return (m_directory / (defaults::cache_prefix + profile)).string();
}

auto
session_cache_t::read(const std::string& profile) const -> boost::optional<session_credentials_t> {
    const auto file_path = path(profile);

    if(file_path.empty()) {
        return boost::none;
    }

    fs::ifstream stream(file_path);

    if(!stream) {
        RUNAS_LOG_DEBUG(m_log, "no cached credentials for '{}', path: {}", profile, file_path);
        return boost::none;
    }

    std::stringstream buffer;
    buffer << stream.rdbuf();

    session_credentials_t credentials;

    try {
        credentials = session_from_json(buffer.str());
    } catch(const std::system_error& e) {
        RUNAS_LOG_DEBUG(m_log, "ignoring cached credentials for '{}': {}", profile, error::to_string(e));
        return boost::none;
    }

    if(credentials.expired()) {
        RUNAS_LOG_DEBUG(m_log, "cached credentials for '{}' have expired at {}", profile,
            chrono::to_rfc3339(credentials.expiration));
        return boost::none;
    }

    return credentials;
}

void
session_cache_t::write(const std::string& profile, const session_credentials_t& credentials) {
    const auto file_path = path(profile);

    if(file_path.empty()) {
        throw error_t(error::cache_disabled, "unable to cache credentials for '{}'", profile);
    }

    boost::system::error_code ec;

    const auto status = fs::status(m_directory, ec);

    if(status.type() == fs::status_error) {
        throw error_t(error::cache_unavailable, "unable to access cache directory '{}' - {}",
            m_directory.string(), ec.message());
    }

    if(!fs::exists(status)) {
        RUNAS_LOG_INFO(m_log, "creating cache directory: {}", m_directory.string());

        ec.clear();
        fs::create_directories(m_directory, ec);

        if(ec) {
            throw error_t(error::cache_unavailable, "unable to create cache directory - {}",
                ec.message());
        }
    } else if(!fs::is_directory(status)) {
        throw error_t(error::cache_unavailable, "cache location '{}' is not a directory",
            m_directory.string());
    }

    fs::ofstream stream(file_path, fs::ofstream::out | fs::ofstream::trunc);

    if(!stream) {
        throw error_t(error::cache_unavailable, "unable to open '{}' for writing", file_path);
    }

    ec.clear();
    fs::permissions(file_path, fs::owner_read | fs::owner_write, ec);

    if(ec) {
        throw error_t(error::cache_unavailable, "unable to restrict access to '{}' - {}", file_path,
            ec.message());
    }

    RUNAS_LOG_DEBUG(m_log, "caching credentials for '{}', path: {}", profile, file_path);

    stream << to_json(credentials);
    stream.close();

    if(!stream) {
        throw error_t(error::cache_unavailable, "unable to write '{}'", file_path);
    }
}

void
session_cache_t::remove(const std::string& profile) {
    const auto file_path = path(profile);

    if(file_path.empty()) {
        return;
    }

    boost::system::error_code ec;

    const auto status = fs::status(file_path, ec);

    if(status.type() == fs::status_error) {
        throw error_t(error::cache_unavailable, "unable to access '{}' - {}", file_path, ec.message());
    }

    if(!fs::exists(status)) {
        return;
    }

    RUNAS_LOG_DEBUG(m_log, "removing cached credentials for '{}', path: {}", profile, file_path);

    ec.clear();
    fs::remove(file_path, ec);

    if(ec) {
        throw error_t(error::cache_unavailable, "unable to remove '{}' - {}", file_path, ec.message());
    }
}
