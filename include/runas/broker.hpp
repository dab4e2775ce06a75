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


#ifndef RUNAS_BROKER_HPP
#define RUNAS_BROKER_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"
#include "runas/locked_ptr.hpp"

#include <boost/optional/optional.hpp>

namespace runas {

// Owns the credentials lifecycle of the active profile: the base session obtained from the
// identity provider, the MFA challenge which may gate it and the role credentials derived from
// it. All of the state lives behind a single lock, every operation holds it for its whole
// duration.
class broker_t {
public:
    enum class state_t {
        no_session,
        session_established,
        session_mfa_pending,
        role_credentials_ready
    };

private:
    struct session_t {
        std::string profile;

        boost::optional<role_config_t> config;
        boost::optional<session_credentials_t> credentials;
        boost::optional<principal_t> principal;

        state_t state = state_t::no_session;
    };

    const std::shared_ptr<logging::logger_t> m_log;

    const std::shared_ptr<api::resolver_t> m_resolver;
    const std::shared_ptr<api::identity_t> m_identity;
    const std::shared_ptr<session_cache_t> m_cache;

    synchronized<session_t> m_session;

public:
    broker_t(std::shared_ptr<logging::logger_t> log,
             std::shared_ptr<api::resolver_t> resolver,
             std::shared_ptr<api::identity_t> identity,
             std::shared_ptr<session_cache_t> cache);

   ~broker_t();

    RUNAS_DECLARE_NONCOPYABLE(broker_t)

    // Makes the profile active and returns the expiration of its session. Profiles sharing the
    // source profile of the active one reuse its session while it is valid.
    auto
    select(const std::string& profile) -> clock_type::time_point;

    // Re-issues the session request of the active profile with the MFA code attached. Only the
    // first six characters are used, all of which must be digits. A valid session is replaced
    // only once the new one has been obtained.
    auto
    submit_mfa(const std::string& code) -> clock_type::time_point;

    // Derives role credentials for the active profile. Nothing derived here is retained.
    auto
    role_credentials() -> role_credentials_t;

    // Expires the session and drops its cache file. Does nothing without an active profile.
    void
    refresh();

    // Observers

    auto
    profile() const -> std::string;

    auto
    state() const -> state_t;

    auto
    config() const -> boost::optional<role_config_t>;

    auto
    principal() const -> boost::optional<principal_t>;

    // Valid session credentials, if any.
    auto
    credentials() const -> boost::optional<session_credentials_t>;

    auto
    expiration() const -> boost::optional<clock_type::time_point>;

private:
    auto
    establish(session_t& session, const std::string& code) -> clock_type::time_point;

    void
    identify(session_t& session);

    __attribute__((noreturn))
    void
    reject(session_t& session, const std::system_error& e);
};

auto
to_string(broker_t::state_t state) -> std::string;

} // namespace runas

#endif
