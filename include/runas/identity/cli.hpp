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


#ifndef RUNAS_IDENTITY_CLI_HPP
#define RUNAS_IDENTITY_CLI_HPP

#include "runas/api/identity.hpp"
#include "runas/api/policy.hpp"

namespace runas { namespace identity {

// Settings shared by the command line backed collaborators.
struct cli_options_t {
    // Executable of the provider command line client, looked up in PATH.
    std::string command;

    // Overrides the region of the profile when not empty.
    std::string region;
};

// Talks to the identity provider through its command line client, one child process per call.
class cli_t:
    public api::identity_t
{
    const std::shared_ptr<logging::logger_t> m_log;
    const cli_options_t m_options;

public:
    cli_t(std::shared_ptr<logging::logger_t> log, cli_options_t options);

    virtual
    principal_t
    caller_identity(const std::string& profile);

    virtual
    session_credentials_t
    session_token(const std::string& profile,
                  std::chrono::seconds duration,
                  const std::string& mfa_serial,
                  const std::string& mfa_code);

    virtual
    role_credentials_t
    assume_role(const session_credentials_t& session,
                const std::string& role_arn,
                const std::string& session_name,
                const std::string& external_id,
                std::chrono::seconds duration);
};

class cli_policy_t:
    public api::policy_t
{
    const std::shared_ptr<logging::logger_t> m_log;
    const cli_options_t m_options;

public:
    cli_policy_t(std::shared_ptr<logging::logger_t> log, cli_options_t options);

    virtual
    document_list_t
    documents(const std::string& profile, const principal_t& principal);

private:
    void
    inline_policies(const std::string& profile, const std::string& kind, const std::string& name,
                    document_list_t& documents);

    void
    attached_policies(const std::string& profile, const std::string& kind, const std::string& name,
                      document_list_t& documents);
};

// Splits "An error occurred (Code) when calling the Operation operation: message" into its
// error code and message. Output of any other shape yields an empty code.
auto
parse_cli_error(const std::string& output) -> std::pair<std::string, std::string>;

// Last '/' separated component of the ARN.
auto
user_name_of(const std::string& arn) -> std::string;

}} // namespace runas::identity

#endif
