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


#ifndef RUNAS_PLATFORM_LINUX_HPP
#define RUNAS_PLATFORM_LINUX_HPP

#include "runas/api/platform.hpp"

namespace runas { namespace platform {

// Works either under sudo or with file capabilities granted to the executable:
//
//   setcap "cap_net_admin,cap_net_bind_service,cap_setgid,cap_setuid=p" runas-metadata
//
// The loopback alias is managed with ip(8).
class linux_t:
    public api::platform_t
{
    const std::shared_ptr<logging::logger_t> m_log;

public:
    explicit
    linux_t(std::shared_ptr<logging::logger_t> log);

    virtual
    void
    elevate();

    virtual
    std::string
    loopback();

    virtual
    void
    configure_address(const std::string& interface, const std::string& address);

    virtual
    void
    remove_address(const std::string& interface, const std::string& address);

    virtual
    void
    drop_privileges();

    virtual
    bool
    privileged() const;

private:
    void
    ip(const std::string& action, const std::string& interface, const std::string& address);
};

}} // namespace runas::platform

#endif
