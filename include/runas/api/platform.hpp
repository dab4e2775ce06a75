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

#ifndef RUNAS_API_PLATFORM_HPP
#define RUNAS_API_PLATFORM_HPP

#include "runas/common.hpp"

namespace runas { namespace api {

// OS specific privilege and network plumbing. Every mutating call throws error_t with a
// platform_errors code on failure.
class platform_t {
public:
    virtual
   ~platform_t() {
        // Empty.
    }

    // Raises whatever the process needs to bind a low port and to configure the network. A no-op
    // where the platform has no such notion.
    virtual
    void
    elevate() = 0;

    // Name of the loopback interface.
    virtual
    std::string
    loopback() = 0;

    virtual
    void
    configure_address(const std::string& interface, const std::string& address) = 0;

    virtual
    void
    remove_address(const std::string& interface, const std::string& address) = 0;

    virtual
    void
    drop_privileges() = 0;

    // Whether the process is still able to undo the network configuration.
    virtual
    bool
    privileged() const = 0;
};

}} // namespace runas::api

#endif
