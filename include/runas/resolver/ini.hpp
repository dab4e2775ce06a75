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


#ifndef RUNAS_RESOLVER_INI_HPP
#define RUNAS_RESOLVER_INI_HPP

#include "runas/api/resolver.hpp"

#include <boost/property_tree/ptree_fwd.hpp>

namespace runas { namespace resolver {

// Resolves profiles from an INI file laid out like the provider's shared configuration file:
//
//   [default]
//   mfa_serial = arn:aws:iam::123456789012:mfa/user
//
//   [profile admin]
//   source_profile = default
//   role_arn = arn:aws:iam::123456789012:role/admin
//
// A bare role ARN is accepted as a profile name as well, it assumes that role from the default
// profile. The file is re-read on every call.
class ini_t:
    public api::resolver_t
{
    const std::shared_ptr<logging::logger_t> m_log;

    const std::string m_path;
    const std::string m_default;

public:
    ini_t(std::shared_ptr<logging::logger_t> log, std::string path, std::string default_profile);

    virtual
    role_config_t
    resolve(const std::string& profile);

    virtual
    std::vector<std::string>
    profiles(bool roles_only);

private:
    auto
    load() const -> boost::property_tree::ptree;
};

}} // namespace runas::resolver

#endif
