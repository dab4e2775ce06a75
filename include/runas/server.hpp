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


#ifndef RUNAS_SERVER_HPP
#define RUNAS_SERVER_HPP

#include "runas/common.hpp"
#include "runas/locked_ptr.hpp"

#include <functional>

namespace runas {

struct request_t {
    // Hands out at most the given number of bytes of the body. May be empty, which is reported as
    // a missing reader.
    typedef std::function<std::string(std::size_t)> reader_type;

    std::string method;
    std::string path;
    std::string protocol;

    reader_type reader;
};

struct response_t {
    int status;
    std::string content_type;
    std::string body;
};

// What a failed request turns into: the error it failed with, the fixed message sent back and
// the status code.
struct handler_error_t {
    std::error_code kind;
    std::string message;
    int status;
};

// Maps an error onto the response the client gets. Unclassified errors get the fallback
// message and status 500, their details are never sent back.
auto
make_handler_error(const std::system_error& e, const std::string& fallback) -> handler_error_t;

class server_t {
public:
    struct settings_t {
        std::string address;
        port_t port;

        // Detected when empty.
        std::string interface;

        std::size_t workers;

        // Selected right after the service becomes ready, when not empty.
        std::string profile;
    };

private:
    const std::shared_ptr<logging::logger_t> m_log;

    const std::shared_ptr<broker_t> m_broker;
    const std::shared_ptr<api::resolver_t> m_resolver;

    // Optional, without it only the configured profiles are listed.
    const std::shared_ptr<api::policy_t> m_policy;

    const std::shared_ptr<api::platform_t> m_platform;

    const settings_t m_settings;

    // Roles discovered from the policies, by source profile. Dropped on refresh.
    synchronized<std::map<std::string, std::vector<std::string>>> m_discovered;

public:
    server_t(std::shared_ptr<logging::logger_t> log,
             std::shared_ptr<broker_t> broker,
             std::shared_ptr<api::resolver_t> resolver,
             std::shared_ptr<api::policy_t> policy,
             std::shared_ptr<api::platform_t> platform,
             settings_t settings);

   ~server_t();

    RUNAS_DECLARE_NONCOPYABLE(server_t)

    // Configures the network, serves until a termination signal arrives and then tears the network
    // configuration down again. Throws when the service can't be started.
    void
    run();

    // Serves a single request. Every response goes through the access log.
    auto
    handle(const request_t& request) -> response_t;

    // Configured role profiles merged with the roles discovered from the principal's policies.
    auto
    roles() -> std::vector<std::string>;

private:
    auto
    on_home(const request_t& request) -> response_t;

    auto
    on_mfa(const request_t& request) -> response_t;

    auto
    on_profile(const request_t& request) -> response_t;

    auto
    on_credentials(const request_t& request, const std::string& name) -> response_t;

    auto
    on_list_roles(const request_t& request) -> response_t;

    auto
    on_refresh(const request_t& request) -> response_t;

    auto
    reject(const request_t& request, const std::system_error& e, const std::string& fallback)
        -> response_t;

    void
    configure_address(const std::string& interface);

    void
    serve(const std::shared_ptr<restbed::Session>& session);
};

} // namespace runas

#endif
