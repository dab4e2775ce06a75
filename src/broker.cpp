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


#include "runas/broker.hpp"

#include "runas/api/identity.hpp"
#include "runas/api/resolver.hpp"
#include "runas/cache.hpp"
#include "runas/defaults.hpp"
#include "runas/logging.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/predicate.hpp>

using namespace runas;

namespace {

const std::string kMfaFailurePrefix = "MultiFactorAuthentication failed";

bool
numeric(const std::string& code) {
    return std::all_of(code.begin(), code.end(), [](char c) -> bool {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

broker_t::broker_t(std::shared_ptr<logging::logger_t> log,
                   std::shared_ptr<api::resolver_t> resolver,
                   std::shared_ptr<api::identity_t> identity,
                   std::shared_ptr<session_cache_t> cache):
    m_log(std::move(log)),
    m_resolver(std::move(resolver)),
    m_identity(std::move(identity)),
    m_cache(std::move(cache))
{ }

broker_t::~broker_t() {
    // Empty.
}

auto
broker_t::select(const std::string& profile) -> clock_type::time_point {
    auto session = m_session.synchronize();

    role_config_t config;

    try {
        config = m_resolver->resolve(profile);
    } catch(const std::system_error& e) {
        RUNAS_LOG_ERROR(m_log, "unable to resolve profile '{}': {}", profile, error::to_string(e));
        throw error_t(error::resolve_failed, "unable to resolve profile '{}'", profile);
    }

    RUNAS_LOG_DEBUG(m_log, "resolved profile '{}', source: '{}', role: '{}'", profile,
        config.source_profile, config.role_arn);

    if(!session->config || session->config->source_profile != config.source_profile) {
        if(session->config) {
            RUNAS_LOG_INFO(m_log, "switching source profile from '{}' to '{}'",
                session->config->source_profile, config.source_profile);
        }

        session->credentials = boost::none;
        session->state = state_t::no_session;
    }

    session->profile = profile;
    session->config  = config;

    return establish(*session, std::string());
}

auto
broker_t::submit_mfa(const std::string& code) -> clock_type::time_point {
    if(code.size() < defaults::mfa_code_length) {
        throw error_t(error::invalid_mfa_code, "MFA code is too short");
    }

    const auto token = code.substr(0, defaults::mfa_code_length);

    if(!numeric(token)) {
        throw error_t(error::invalid_mfa_code, "MFA code must be numeric");
    }

    auto session = m_session.synchronize();

    if(!session->config) {
        throw error_t(error::no_active_profile, "no profile has been selected");
    }

    // The code is only meaningful for a fresh request, so neither the session nor the cache are
    // consulted. A still valid session is kept until the new one has been obtained.
    return establish(*session, token);
}

auto
broker_t::role_credentials() -> role_credentials_t {
    auto session = m_session.synchronize();

    if(!session->config) {
        throw error_t(error::no_active_profile, "no profile has been selected");
    }

    const auto config = *session->config;

    if(config.role_arn.empty()) {
        throw error_t(error::provider_failure, "profile '{}' does not assume a role", session->profile);
    }

    if(!session->credentials || session->credentials->expired()) {
        establish(*session, std::string());
    }

    if(!session->principal) {
        identify(*session);
    }

    if(!session->principal) {
        throw error_t(error::provider_failure, "unable to determine the role session name");
    }

    RUNAS_LOG_DEBUG(m_log, "assuming role '{}' as '{}'", config.role_arn, session->principal->user_name);

    role_credentials_t credentials;

    try {
        credentials = m_identity->assume_role(
            *session->credentials,
            config.role_arn,
            session->principal->user_name,
            config.external_id,
            config.role_duration
        );
    } catch(const std::system_error& e) {
        RUNAS_LOG_ERROR(m_log, "unable to assume role '{}': {}", config.role_arn, error::to_string(e));
        throw error_t(error::provider_failure, "unable to assume role '{}'", config.role_arn);
    }

    // One second past the shortest role lifetime, so that clients never see a freshly issued
    // credential as already stale.
    credentials.expiration = clock_type::now() + defaults::assume_role_min_duration + std::chrono::seconds(1);

    session->state = state_t::role_credentials_ready;

    return credentials;
}

void
broker_t::refresh() {
    auto session = m_session.synchronize();

    if(!session->config) {
        return;
    }

    RUNAS_LOG_DEBUG(m_log, "expiring credentials of '{}'", session->config->source_profile);

    session->credentials = boost::none;
    session->state = state_t::no_session;

    try {
        m_cache->remove(session->config->source_profile);
    } catch(const std::system_error& e) {
        RUNAS_LOG_DEBUG(m_log, "unable to remove cached credentials: {}", error::to_string(e));
    }
}

auto
broker_t::profile() const -> std::string {
    return m_session->profile;
}

auto
broker_t::state() const -> state_t {
    return m_session->state;
}

auto
broker_t::config() const -> boost::optional<role_config_t> {
    return m_session->config;
}

auto
broker_t::principal() const -> boost::optional<principal_t> {
    return m_session->principal;
}

auto
broker_t::credentials() const -> boost::optional<session_credentials_t> {
    return m_session.apply([](const session_t& session) -> boost::optional<session_credentials_t> {
        if(session.credentials && !session.credentials->expired()) {
            return session.credentials;
        }

        return boost::none;
    });
}

auto
broker_t::expiration() const -> boost::optional<clock_type::time_point> {
    return m_session.apply([](const session_t& session) -> boost::optional<clock_type::time_point> {
        if(session.credentials) {
            return session.credentials->expiration;
        }

        return boost::none;
    });
}

auto
broker_t::establish(session_t& session, const std::string& code) -> clock_type::time_point {
    const auto& config = *session.config;

    const bool valid = session.credentials && !session.credentials->expired();

    if(valid && code.empty()) {
        RUNAS_LOG_DEBUG(m_log, "reusing session of '{}'", config.source_profile);

        if(session.state != state_t::role_credentials_ready) {
            session.state = state_t::session_established;
        }

        return session.credentials->expiration;
    }

    if(!valid) {
        session.credentials = boost::none;
    }

    boost::optional<session_credentials_t> credentials;

    if(code.empty()) {
        credentials = m_cache->read(config.source_profile);
    }

    if(credentials) {
        RUNAS_LOG_DEBUG(m_log, "using cached session of '{}'", config.source_profile);
    } else {
        try {
            credentials = m_identity->session_token(
                config.source_profile,
                config.session_duration,
                config.mfa_serial,
                code
            );
        } catch(const std::system_error& e) {
            reject(session, e);
        }

        RUNAS_LOG_INFO(m_log, "obtained session for '{}', expires at {}", config.source_profile,
            chrono::to_rfc3339(credentials->expiration));

        if(m_cache->enabled()) {
            try {
                m_cache->write(config.source_profile, *credentials);
            } catch(const std::system_error& e) {
                RUNAS_LOG_WARNING(m_log, "unable to cache session of '{}': {}", config.source_profile,
                    error::to_string(e));
            }
        }
    }

    session.credentials = credentials;
    session.state = state_t::session_established;

    if(!session.principal) {
        identify(session);
    }

    return session.credentials->expiration;
}

void
broker_t::identify(session_t& session) {
    const auto& source = session.config->source_profile;

    try {
        session.principal = m_identity->caller_identity(source);
    } catch(const std::system_error& e) {
        RUNAS_LOG_WARNING(m_log, "unable to resolve the caller identity of '{}': {}", source,
            error::to_string(e));
        return;
    }

    RUNAS_LOG_INFO(m_log, "running as '{}' in account {}", session.principal->arn,
        session.principal->account);
}

// A session which is still valid survives a rejected request and keeps its state.
void
broker_t::reject(session_t& session, const std::system_error& e) {
    const bool mfa = e.code() == error::mfa_required || (
        e.code() == error::access_denied && boost::starts_with(e.what(), kMfaFailurePrefix)
    );

    if(mfa) {
        RUNAS_LOG_DEBUG(m_log, "session request for '{}' requires an MFA code: {}",
            session.config->source_profile, error::to_string(e));

        if(!session.credentials) {
            session.state = state_t::session_mfa_pending;
        }

        throw error_t(error::mfa_code_required, "MFA code required");
    }

    RUNAS_LOG_ERROR(m_log, "unable to obtain session for '{}': {}", session.config->source_profile,
        error::to_string(e));

    if(!session.credentials) {
        session.state = state_t::no_session;
    }

    throw error_t(error::provider_failure, "unable to obtain session for '{}'",
        session.config->source_profile);
}

namespace runas {

auto
to_string(broker_t::state_t state) -> std::string {
    switch(state) {
    case broker_t::state_t::no_session:
        return "no_session";
    case broker_t::state_t::session_established:
        return "session_established";
    case broker_t::state_t::session_mfa_pending:
        return "session_mfa_pending";
    case broker_t::state_t::role_credentials_ready:
        return "role_credentials_ready";
    }

    return "unknown";
}

} // namespace runas
