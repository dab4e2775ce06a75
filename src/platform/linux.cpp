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


#include "runas/platform/linux.hpp"

#include "runas/detail/process.hpp"
#include "runas/logging.hpp"

#include <array>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional/optional.hpp>

#include <grp.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <linux/capability.h>

using namespace runas;
using namespace runas::platform;

namespace {

const std::array<int, 4> kCapabilities = {{
    CAP_NET_ADMIN,
    CAP_NET_BIND_SERVICE,
    CAP_SETGID,
    CAP_SETUID
}};

struct capabilities_t {
    __user_cap_header_struct header;
    std::array<__user_cap_data_struct, _LINUX_CAPABILITY_U32S_3> data;

    capabilities_t() {
        std::memset(&header, 0, sizeof(header));
        std::memset(data.data(), 0, sizeof(data));

        header.version = _LINUX_CAPABILITY_VERSION_3;
        header.pid = 0;
    }

    void
    load() {
        if(::syscall(SYS_capget, &header, data.data()) != 0) {
            throw error_t(error::capabilities_failed, "unable to read process capabilities - {}",
                std::strerror(errno));
        }
    }

    void
    apply() {
        if(::syscall(SYS_capset, &header, data.data()) != 0) {
            throw error_t(error::capabilities_failed, "unable to set process capabilities - {}",
                std::strerror(errno));
        }
    }

    bool
    permitted(int capability) const {
        return (data[CAP_TO_INDEX(capability)].permitted & CAP_TO_MASK(capability)) != 0;
    }

    void
    raise(int capability) {
        data[CAP_TO_INDEX(capability)].effective   |= CAP_TO_MASK(capability);
        data[CAP_TO_INDEX(capability)].inheritable |= CAP_TO_MASK(capability);
    }
};

auto
numeric_id(const char* variable) -> boost::optional<unsigned int> {
    const char* value = ::getenv(variable);

    if(value == nullptr || *value == '\0') {
        return boost::none;
    }

    try {
        return boost::lexical_cast<unsigned int>(value);
    } catch(const boost::bad_lexical_cast&) {
        throw error_t(error::privileges_failed, "{} has invalid value '{}'", variable, value);
    }
}

} // namespace

linux_t::linux_t(std::shared_ptr<logging::logger_t> log):
    m_log(std::move(log))
{ }

void
linux_t::elevate() {
    capabilities_t capabilities;
    capabilities.load();

    for(auto it = kCapabilities.begin(); it != kCapabilities.end(); ++it) {
        if(!capabilities.permitted(*it)) {
            throw error_t(error::capabilities_failed, "capability {} is not permitted, run with sudo "
                "or grant it to the executable with setcap", *it);
        }

        capabilities.raise(*it);
    }

    capabilities.apply();

    // Ambient capabilities survive the exec of ip(8).
    for(auto it = kCapabilities.begin(); it != kCapabilities.end(); ++it) {
        if(::prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_RAISE, *it, 0, 0) != 0) {
            throw error_t(error::capabilities_failed, "unable to raise ambient capability {} - {}", *it,
                std::strerror(errno));
        }
    }

    RUNAS_LOG_DEBUG(m_log, "raised network and identity capabilities");
}

std::string
linux_t::loopback() {
    ifaddrs* interfaces = nullptr;

    if(::getifaddrs(&interfaces) != 0) {
        throw error_t(error::loopback_not_found, "unable to list network interfaces - {}",
            std::strerror(errno));
    }

    std::unique_ptr<ifaddrs, void(*)(ifaddrs*)> guard(interfaces, &::freeifaddrs);

    for(auto ptr = interfaces; ptr != nullptr; ptr = ptr->ifa_next) {
        if((ptr->ifa_flags & IFF_LOOPBACK) != 0 && (ptr->ifa_flags & IFF_UP) != 0) {
            RUNAS_LOG_DEBUG(m_log, "found loopback interface '{}'", ptr->ifa_name);
            return ptr->ifa_name;
        }
    }

    throw error_t(error::loopback_not_found, "no loopback interface is up");
}

void
linux_t::configure_address(const std::string& interface, const std::string& address) {
    ip("add", interface, address);
}

void
linux_t::remove_address(const std::string& interface, const std::string& address) {
    ip("del", interface, address);
}

void
linux_t::drop_privileges() {
    if(::geteuid() == 0) {
        const auto uid = numeric_id("SUDO_UID");
        const auto gid = numeric_id("SUDO_GID");

        if(!uid || !gid) {
            RUNAS_LOG_WARNING(m_log, "not started through sudo, keeping root privileges");
            return;
        }

        const gid_t groups[] = { static_cast<gid_t>(*gid) };

        if(::setgroups(1, groups) != 0 || ::setgid(*gid) != 0 || ::setuid(*uid) != 0) {
            throw error_t(error::privileges_failed, "unable to switch to uid {}, gid {} - {}", *uid,
                *gid, std::strerror(errno));
        }

        RUNAS_LOG_INFO(m_log, "dropped privileges to uid {}, gid {}", *uid, *gid);
        return;
    }

    if(::prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) != 0) {
        throw error_t(error::privileges_failed, "unable to clear ambient capabilities - {}",
            std::strerror(errno));
    }

    capabilities_t capabilities;

    try {
        capabilities.apply();
    } catch(const std::system_error& e) {
        throw error_t(error::privileges_failed, "{}", e.what());
    }

    RUNAS_LOG_INFO(m_log, "dropped all capabilities");
}

bool
linux_t::privileged() const {
    return ::geteuid() == 0;
}

void
linux_t::ip(const std::string& action, const std::string& interface, const std::string& address) {
    const std::vector<std::string> args = {
        "-4", "addr", action, address + "/32", "dev", interface
    };

    detail::process::result_t result;

    try {
        result = detail::process::run("ip", args, detail::process::string_map_t());
    } catch(const std::system_error& e) {
        throw error_t(error::address_failed, "{}", e.what());
    }

    if(result.status != 0) {
        throw error_t(error::address_failed, "unable to {} address {} on '{}' - {}", action, address,
            interface, boost::algorithm::trim_copy(result.err));
    }

    RUNAS_LOG_DEBUG(m_log, "{} address {} on '{}'", action == "add" ? "configured" : "removed",
        address, interface);
}
