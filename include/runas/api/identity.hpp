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

#ifndef RUNAS_API_IDENTITY_HPP
#define RUNAS_API_IDENTITY_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"

namespace runas { namespace api {

// Identity provider client. Implementations report failures by throwing error_t with one of the
// provider_errors codes; retries and timeouts are their own business.
class identity_t {
public:
    virtual
   ~identity_t() {
        // Empty.
    }

    // Resolves who owns the long-term credentials of the given profile.
    virtual
    principal_t
    caller_identity(const std::string& profile) = 0;

    // Issues a session token for the given profile. When the profile is protected by an MFA
    // device and no code is given, provider_errors::mfa_required is thrown.
    virtual
    session_credentials_t
    session_token(const std::string& profile,
                  std::chrono::seconds duration,
                  const std::string& mfa_serial,
                  const std::string& mfa_code) = 0;

    virtual
    role_credentials_t
    assume_role(const session_credentials_t& session,
                const std::string& role_arn,
                const std::string& session_name,
                const std::string& external_id,
                std::chrono::seconds duration) = 0;
};

}} // namespace runas::api

#endif
