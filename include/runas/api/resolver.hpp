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

#ifndef RUNAS_API_RESOLVER_HPP
#define RUNAS_API_RESOLVER_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"

namespace runas { namespace api {

// Turns a named profile into a role configuration.
class resolver_t {
public:
    virtual
   ~resolver_t() {
        // Empty.
    }

    // Throws error_t with a resolver_errors code when the profile can't be resolved.
    virtual
    role_config_t
    resolve(const std::string& profile) = 0;

    // Names of all configured profiles, or only of those which assume a role.
    virtual
    std::vector<std::string>
    profiles(bool roles_only) = 0;
};

}} // namespace runas::api

#endif
