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

#include "runas/errors.hpp"

using namespace runas;
using namespace runas::error;

namespace {

class request_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.server.request";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case request_errors::missing_reader:
            return "request has no body reader";
        case request_errors::unreadable_body:
            return "unable to read the request body";
        case request_errors::unknown_endpoint:
            return "no such endpoint";
        case request_errors::method_not_allowed:
            return "method is not allowed for this endpoint";
        default:
            return "runas.server.request error";
        }
    }
};

class discovery_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.discovery";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case discovery_errors::null_document:
            return "policy document is missing";
        case discovery_errors::parse_error:
            return "unable to parse the policy document";
        case discovery_errors::malformed_encoding:
            return "policy document has a malformed encoding";
        default:
            return "runas.discovery error";
        }
    }
};

class cache_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.cache";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case cache_errors::cache_disabled:
            return "credential cache is disabled";
        case cache_errors::cache_corrupted:
            return "credential cache entry is corrupted";
        case cache_errors::cache_unavailable:
            return "credential cache is not accessible";
        default:
            return "runas.cache error";
        }
    }
};

class provider_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.provider";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case provider_errors::mfa_required:
            return "multi-factor authentication is required";
        case provider_errors::access_denied:
            return "access denied";
        case provider_errors::request_failed:
            return "identity provider request has failed";
        case provider_errors::invalid_response:
            return "identity provider response is invalid";
        case provider_errors::spawn_failed:
            return "unable to start the identity provider client";
        default:
            return "runas.provider error";
        }
    }
};

class broker_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.broker";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case broker_errors::no_active_profile:
            return "no profile is active";
        case broker_errors::resolve_failed:
            return "unable to resolve the profile configuration";
        case broker_errors::mfa_code_required:
            return "MFA code required";
        case broker_errors::invalid_mfa_code:
            return "invalid MFA code";
        case broker_errors::provider_failure:
            return "unable to obtain credentials from the identity provider";
        default:
            return "runas.broker error";
        }
    }
};

class resolver_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.resolver";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case resolver_errors::profile_not_found:
            return "profile is not configured";
        case resolver_errors::invalid_profile:
            return "profile configuration is invalid";
        case resolver_errors::unreadable_config:
            return "unable to read the profile configuration";
        default:
            return "runas.resolver error";
        }
    }
};

class platform_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "runas.platform";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case platform_errors::capabilities_failed:
            return "unable to adjust process capabilities";
        case platform_errors::loopback_not_found:
            return "no loopback interface found";
        case platform_errors::address_failed:
            return "unable to configure the loopback address";
        case platform_errors::privileges_failed:
            return "unable to drop privileges";
        default:
            return "runas.platform error";
        }
    }
};

auto
request_category() -> const std::error_category& {
    static request_category_t instance;
    return instance;
}

auto
discovery_category() -> const std::error_category& {
    static discovery_category_t instance;
    return instance;
}

auto
cache_category() -> const std::error_category& {
    static cache_category_t instance;
    return instance;
}

auto
provider_category() -> const std::error_category& {
    static provider_category_t instance;
    return instance;
}

auto
broker_category() -> const std::error_category& {
    static broker_category_t instance;
    return instance;
}

auto
resolver_category() -> const std::error_category& {
    static resolver_category_t instance;
    return instance;
}

auto
platform_category() -> const std::error_category& {
    static platform_category_t instance;
    return instance;
}

} // namespace

namespace runas { namespace error {

auto
make_error_code(request_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), request_category());
}

auto
make_error_code(discovery_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), discovery_category());
}

auto
make_error_code(cache_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), cache_category());
}

auto
make_error_code(provider_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), provider_category());
}

auto
make_error_code(broker_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), broker_category());
}

auto
make_error_code(resolver_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), resolver_category());
}

auto
make_error_code(platform_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), platform_category());
}

std::string
to_string(const std::system_error& e) {
    return runas::format("[{}] {}", e.code().value(), e.what());
}

const std::error_code
error_t::kInvalidArgumentErrorCode = std::make_error_code(std::errc::invalid_argument);

}} // namespace runas::error
