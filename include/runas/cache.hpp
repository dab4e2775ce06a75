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


#ifndef RUNAS_CACHE_HPP
#define RUNAS_CACHE_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/optional/optional.hpp>

namespace runas {

// File-backed session credentials cache, one file per source profile. Caching is disabled when
// constructed with an empty directory.
class session_cache_t {
    const std::shared_ptr<logging::logger_t> m_log;
    const boost::filesystem::path m_directory;

public:
    session_cache_t(std::shared_ptr<logging::logger_t> log, const std::string& directory);

    bool
    enabled() const;

    // Cache file location for the profile, empty when caching is disabled or the profile is empty.
    auto
    path(const std::string& profile) const -> std::string;

    // Missing, unreadable, malformed and expired entries all read as absent.
    auto
    read(const std::string& profile) const -> boost::optional<session_credentials_t>;

    void
    write(const std::string& profile, const session_credentials_t& credentials);

    void
    remove(const std::string& profile);
};

} // namespace runas

#endif
