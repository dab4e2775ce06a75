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


#include "runas/server.hpp"

#include "runas/api/platform.hpp"
#include "runas/api/policy.hpp"
#include "runas/api/resolver.hpp"
#include "runas/broker.hpp"
#include "runas/credentials.hpp"
#include "runas/defaults.hpp"
#include "runas/discovery.hpp"
#include "runas/logging.hpp"
#include "runas/page.hpp"

#include <algorithm>
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <set>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

#include <json/json.h>

#include <restbed>

using namespace runas;

namespace {

const std::string kPlainText = "text/plain";
const std::string kHtml      = "text/html";
const std::string kJson      = "application/json";

auto
make_response(int status, const std::string& content_type, std::string body) -> response_t {
    response_t response;

    response.status       = status;
    response.content_type = content_type;
    response.body         = std::move(body);

    return response;
}

void
expect(const request_t& request, const char* method) {
    if(request.method != method) {
        throw error_t(error::method_not_allowed, "{} is not allowed on '{}'", request.method,
            request.path);
    }
}

auto
read(const request_t& request, std::size_t limit) -> std::string {
    if(!request.reader) {
        throw error_t(error::missing_reader, "'{}' request carries no body", request.path);
    }

    auto body = request.reader(limit);

    if(body.size() > limit) {
        body.resize(limit);
    }

    return body;
}

// Forwards the HTTP library's own diagnostics into the service log.
class restbed_logger_t:
    public restbed::Logger
{
    const std::shared_ptr<logging::logger_t> m_log;

public:
    explicit
    restbed_logger_t(std::shared_ptr<logging::logger_t> log):
        m_log(std::move(log))
    { }

    virtual
    void
    stop() {
        // Empty.
    }

    virtual
    void
    start(const std::shared_ptr<const restbed::Settings>&) {
        // Empty.
    }

    virtual
    void
    log(const Level level, const char* format, ...) {
        va_list args;
        va_start(args, format);
        emit(level, format, args);
        va_end(args);
    }

    virtual
    void
    log_if(bool expression, const Level level, const char* format, ...) {
        if(!expression) {
            return;
        }

        va_list args;
        va_start(args, format);
        emit(level, format, args);
        va_end(args);
    }

private:
    void
    emit(const Level level, const char* format, va_list args) {
        char buffer[1024];

        std::vsnprintf(buffer, sizeof(buffer), format, args);

        switch(level) {
        case Level::DEBUG:
            RUNAS_LOG_DEBUG(m_log, "{}", buffer);
            break;
        case Level::INFO:
            RUNAS_LOG_INFO(m_log, "{}", buffer);
            break;
        case Level::WARNING:
        case Level::SECURITY:
            RUNAS_LOG_WARNING(m_log, "{}", buffer);
            break;
        default:
            RUNAS_LOG_ERROR(m_log, "{}", buffer);
        }
    }
};

// Removes the loopback alias on the way out, as long as the process is still able to.
struct alias_guard_t {
    logging::logger_t& log;
    api::platform_t& platform;

    const std::string interface;
    const std::string address;

   ~alias_guard_t() {
        if(!platform.privileged()) {
            RUNAS_LOG_DEBUG(log, "leaving address {} on '{}' in place", address, interface);
            return;
        }

        try {
            platform.remove_address(interface, address);
        } catch(const std::system_error& e) {
            RUNAS_LOG_DEBUG(log, "unable to remove the network configuration: {}", error::to_string(e));
        }
    }
};

} // namespace

namespace runas {

auto
make_handler_error(const std::system_error& e, const std::string& fallback) -> handler_error_t {
    const auto& code = e.code();

    if(code == error::missing_reader) {
        return handler_error_t{code, "Missing request body", 500};
    } else if(code == error::unreadable_body) {
        return handler_error_t{code, "Error reading request data", 500};
    } else if(code == error::unknown_endpoint) {
        return handler_error_t{code, "Not Found", 404};
    } else if(code == error::method_not_allowed) {
        return handler_error_t{code, "Method Not Allowed", 405};
    } else if(code == error::mfa_code_required) {
        return handler_error_t{code, "MFA code required", 401};
    } else if(code == error::invalid_mfa_code) {
        return handler_error_t{code, "Invalid MFA Code", 401};
    } else if(code == error::resolve_failed) {
        return handler_error_t{code, "Error resolving profile config", 500};
    }

    return handler_error_t{code, fallback, 500};
}

} // namespace runas

server_t::server_t(std::shared_ptr<logging::logger_t> log,
                   std::shared_ptr<broker_t> broker,
                   std::shared_ptr<api::resolver_t> resolver,
                   std::shared_ptr<api::policy_t> policy,
                   std::shared_ptr<api::platform_t> platform,
                   settings_t settings):
    m_log(std::move(log)),
    m_broker(std::move(broker)),
    m_resolver(std::move(resolver)),
    m_policy(std::move(policy)),
    m_platform(std::move(platform)),
    m_settings(std::move(settings))
{ }

server_t::~server_t() {
    // Empty.
}

void
server_t::run() {
    m_platform->elevate();

    const auto interface = m_settings.interface.empty() ? m_platform->loopback() : m_settings.interface;

    configure_address(interface);

    alias_guard_t guard{*m_log, *m_platform, interface, m_settings.address};

    auto settings = std::make_shared<restbed::Settings>();

    settings->set_bind_address(m_settings.address);
    settings->set_port(m_settings.port);
    settings->set_worker_limit(m_settings.workers);
    settings->set_default_header("Connection", "close");
    settings->set_default_header("Server", format("runas/{}.{}.{}", RUNAS_VERSION_MAJOR,
        RUNAS_VERSION_MINOR, RUNAS_VERSION_RELEASE));

    restbed::Service service;

    const auto handler = std::bind(&server_t::serve, this, std::placeholders::_1);

    const std::vector<std::string> methods = {
        "GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS", "PATCH"
    };

    std::vector<std::set<std::string>> paths = {
        { defaults::home_path },
        { defaults::mfa_path },
        { defaults::profile_path },
        { defaults::credentials_path, defaults::credentials_path + "{name: .*}" },
        { defaults::list_roles_path },
        { defaults::refresh_path }
    };

    for(auto it = paths.begin(); it != paths.end(); ++it) {
        auto resource = std::make_shared<restbed::Resource>();

        resource->set_paths(*it);

        for(auto method = methods.begin(); method != methods.end(); ++method) {
            resource->set_method_handler(*method, handler);
        }

        service.publish(resource);
    }

    service.set_not_found_handler(handler);
    service.set_method_not_allowed_handler(handler);
    service.set_logger(std::make_shared<restbed_logger_t>(m_log));

    std::string failure;

    service.set_ready_handler([&](restbed::Service& self) {
        try {
            m_platform->drop_privileges();
        } catch(const std::system_error& e) {
            failure = error::to_string(e);

            RUNAS_LOG_ERROR(m_log, "unable to drop privileges, will not continue: {}", failure);

            self.stop();
            return;
        }

        if(m_settings.profile.empty()) {
            RUNAS_LOG_INFO(m_log, "metadata service ready on http://{}:{} without an initial profile, "
                "set one via the web interface", m_settings.address, m_settings.port);
            return;
        }

        RUNAS_LOG_INFO(m_log, "metadata service ready on http://{}:{} using initial profile '{}'",
            m_settings.address, m_settings.port, m_settings.profile);

        const std::string profile = m_settings.profile;

        request_t request;

        request.method   = "POST";
        request.path     = defaults::profile_path;
        request.protocol = "HTTP/1.1";
        request.reader   = [profile](std::size_t) -> std::string { return profile; };

        handle(request);
    });

    for(int signum: { SIGINT, SIGQUIT, SIGTERM }) {
        service.set_signal_handler(signum, [this, &service](const int signal) {
            RUNAS_LOG_DEBUG(m_log, "metadata service got signal: {}", ::strsignal(signal));
            service.stop();
        });
    }

    service.start(settings);

    RUNAS_LOG_INFO(m_log, "metadata service has been stopped");

    if(!failure.empty()) {
        throw error_t(error::privileges_failed, "{}", failure);
    }
}

auto
server_t::handle(const request_t& request) -> response_t {
    const auto& path = request.path;

    std::string fallback = "Internal Server Error";
    response_t response;

    try {
        if(path == defaults::home_path) {
            expect(request, "GET");
            fallback = "Error building content";
            response = on_home(request);
        } else if(path == defaults::mfa_path) {
            expect(request, "POST");
            fallback = "Error getting session credentials";
            response = on_mfa(request);
        } else if(path == defaults::profile_path) {
            if(request.method != "GET") {
                expect(request, "POST");
            }

            fallback = "Error getting session credentials";
            response = on_profile(request);
        } else if(boost::starts_with(path, defaults::credentials_path) ||
                  path + "/" == defaults::credentials_path)
        {
            expect(request, "GET");
            fallback = "Error getting role credentials";

            const auto name = path.size() > defaults::credentials_path.size() ?
                path.substr(defaults::credentials_path.size()) :
                std::string();

            response = on_credentials(request, name);
        } else if(path == defaults::list_roles_path) {
            expect(request, "GET");
            fallback = "Error building role list";
            response = on_list_roles(request);
        } else if(path == defaults::refresh_path) {
            expect(request, "POST");
            response = on_refresh(request);
        } else {
            throw error_t(error::unknown_endpoint, "no endpoint serves '{}'", path);
        }
    } catch(const std::system_error& e) {
        response = reject(request, e, fallback);
    } catch(const std::exception& e) {
        RUNAS_LOG_ERROR(m_log, "{} {} failed unexpectedly: {}", request.method, path, e.what());
        response = make_response(500, kPlainText, fallback);
    }

    RUNAS_LOG_INFO(m_log, "{} {} {} {:d} {:d}", request.method, path, request.protocol, response.status,
        response.body.size());

    return response;
}

auto
server_t::roles() -> std::vector<std::string> {
    std::vector<std::string> names;

    try {
        names = m_resolver->profiles(true);
    } catch(const std::system_error& e) {
        RUNAS_LOG_WARNING(m_log, "unable to list configured profiles: {}", error::to_string(e));
    }

    const auto config    = m_broker->config();
    const auto principal = m_broker->principal();

    if(!m_policy || !config || !principal) {
        return discovery::dedup(std::move(names));
    }

    auto discovered = m_discovered.synchronize();
    auto it = discovered->find(config->source_profile);

    if(it == discovered->end()) {
        try {
            it = discovered->emplace(
                config->source_profile,
                discovery::discover(*m_policy, config->source_profile, *principal, *m_log)
            ).first;
        } catch(const std::system_error& e) {
            RUNAS_LOG_WARNING(m_log, "unable to discover roles of '{}': {}", principal->user_name,
                error::to_string(e));
            return discovery::dedup(std::move(names));
        }
    }

    names.insert(names.end(), it->second.begin(), it->second.end());

    return discovery::dedup(std::move(names));
}

auto
server_t::on_home(const request_t& request) -> response_t {
    page::endpoints_t endpoints;

    endpoints.profile = defaults::profile_path;
    endpoints.mfa     = defaults::mfa_path;
    endpoints.refresh = defaults::refresh_path;

    return make_response(200, kHtml, page::render(endpoints, roles()));
}

auto
server_t::on_mfa(const request_t& request) -> response_t {
    const auto code = read(request, defaults::mfa_read_limit);

    return make_response(200, kPlainText, chrono::to_local(m_broker->submit_mfa(code)));
}

auto
server_t::on_profile(const request_t& request) -> response_t {
    if(request.method == "GET") {
        return make_response(200, kPlainText, m_broker->profile());
    }

    const auto profile = read(request, defaults::profile_read_limit);

    return make_response(200, kPlainText, chrono::to_local(m_broker->select(profile)));
}

auto
server_t::on_credentials(const request_t& request, const std::string& name) -> response_t {
    if(name.empty() || name == "/") {
        return make_response(200, kPlainText, m_broker->profile());
    }

    role_credentials_t credentials;

    try {
        credentials = m_broker->role_credentials();
    } catch(const std::system_error& e) {
        // Whatever the reason, SDKs only need to know that there are no credentials.
        throw error_t(error::provider_failure, "{}", e.what());
    }

    return make_response(200, kJson, to_metadata_json(credentials, clock_type::now()));
}

auto
server_t::on_list_roles(const request_t& request) -> response_t {
    Json::Value array(Json::arrayValue);

    const auto names = roles();

    for(auto it = names.begin(); it != names.end(); ++it) {
        array.append(*it);
    }

    Json::FastWriter writer;
    writer.omitEndingLineFeed();

    return make_response(200, kJson, writer.write(array));
}

auto
server_t::on_refresh(const request_t& request) -> response_t {
    m_broker->refresh();
    m_discovered->clear();

    return make_response(200, kPlainText, "success");
}

auto
server_t::reject(const request_t& request, const std::system_error& e, const std::string& fallback)
    -> response_t
{
    const auto failure = make_handler_error(e, fallback);

    if(failure.status == 401 || failure.status == 404 || failure.status == 405) {
        RUNAS_LOG_DEBUG(m_log, "{} {} rejected: {}", request.method, request.path, error::to_string(e));
    } else {
        RUNAS_LOG_ERROR(m_log, "{} {} failed: {}", request.method, request.path, error::to_string(e));
    }

    return make_response(failure.status, kPlainText, failure.message);
}

void
server_t::configure_address(const std::string& interface) {
    RUNAS_LOG_DEBUG(m_log, "configuring address {} on '{}'", m_settings.address, interface);

    try {
        m_platform->configure_address(interface, m_settings.address);
    } catch(const std::system_error& e) {
        RUNAS_LOG_DEBUG(m_log, "unable to configure address, retrying: {}", error::to_string(e));

        m_platform->remove_address(interface, m_settings.address);
        m_platform->configure_address(interface, m_settings.address);
    }
}

void
server_t::serve(const std::shared_ptr<restbed::Session>& session) {
    const auto request = session->get_request();

    request_t incoming;

    incoming.method   = request->get_method();
    incoming.path     = request->get_path();
    incoming.protocol = format("{}/{:.1f}", request->get_protocol(), request->get_version());

    auto reply = [this](const std::shared_ptr<restbed::Session>& session, const request_t& request) {
        const auto response = handle(request);

        session->close(response.status, response.body, {
            { "Content-Type",   response.content_type               },
            { "Content-Length", std::to_string(response.body.size()) }
        });
    };

    const auto header = request->get_header("Content-Length", std::string());

    std::size_t length = 0;

    if(!header.empty()) {
        try {
            length = boost::lexical_cast<std::size_t>(header);
        } catch(const boost::bad_lexical_cast&) {
            incoming.reader = [header](std::size_t) -> std::string {
                throw error_t(error::unreadable_body, "invalid content length '{}'", header);
            };

            return reply(session, incoming);
        }
    }

    if(length == 0) {
        incoming.reader = [](std::size_t) -> std::string { return std::string(); };
        return reply(session, incoming);
    }

    // Nothing reads more than this, the rest of the body is never fetched.
    length = std::min(length, std::max(defaults::mfa_read_limit, defaults::profile_read_limit));

    session->fetch(length, [incoming, reply](const std::shared_ptr<restbed::Session> session,
                                             const restbed::Bytes& bytes) mutable
    {
        const std::string body(bytes.begin(), bytes.end());

        incoming.reader = [body](std::size_t limit) -> std::string { return body.substr(0, limit); };

        reply(session, incoming);
    });
}
