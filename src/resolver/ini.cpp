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


#include "runas/resolver/ini.hpp"

#include "runas/defaults.hpp"
#include "runas/logging.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional/optional.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace runas;
using namespace runas::resolver;

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace {

const std::string kProfilePrefix = "profile ";

auto
section_of(const pt::ptree& tree, const std::string& profile) -> boost::optional<const pt::ptree&> {
    auto it = tree.find(kProfilePrefix + profile);

    if(it == tree.not_found() && profile == defaults::default_profile) {
        it = tree.find(profile);
    }

    if(it == tree.not_found()) {
        return boost::none;
    }

    return it->second;
}

auto
value_of(const boost::optional<const pt::ptree&>& section, const char* key) -> std::string {
    if(!section) {
        return std::string();
    }

    return section->get<std::string>(pt::ptree::path_type(key, '\0'), std::string());
}

auto
seconds_of(const std::string& profile, const boost::optional<const pt::ptree&>& section, const char* key,
           std::chrono::seconds fallback) -> std::chrono::seconds
{
    const auto value = value_of(section, key);

    if(value.empty()) {
        return fallback;
    }

    unsigned long seconds = 0;

    try {
        seconds = boost::lexical_cast<unsigned long>(value);
    } catch(const boost::bad_lexical_cast&) {
        throw error_t(error::invalid_profile, "profile '{}' has invalid '{}' value '{}'", profile, key,
            value);
    }

    return std::chrono::seconds(seconds);
}

} // namespace

ini_t::ini_t(std::shared_ptr<logging::logger_t> log, std::string path, std::string default_profile):
    m_log(std::move(log)),
    m_path(std::move(path)),
    m_default(std::move(default_profile))
{ }

role_config_t
ini_t::resolve(const std::string& profile) {
    if(profile.empty()) {
        throw error_t(error::profile_not_found, "profile name is empty");
    }

    const auto tree = load();

    role_config_t config;

    config.profile = profile;
    config.session_duration = defaults::session_duration;
    config.role_duration = defaults::assume_role_duration;

    if(boost::starts_with(profile, "arn:")) {
        const auto source = section_of(tree, m_default);

        config.source_profile = m_default;
        config.role_arn = profile;
        config.mfa_serial = value_of(source, "mfa_serial");

        return config;
    }

    const auto section = section_of(tree, profile);

    if(!section) {
        throw error_t(error::profile_not_found, "profile '{}' is not configured in '{}'", profile, m_path);
    }

    config.role_arn = value_of(section, "role_arn");
    config.source_profile = value_of(section, "source_profile");

    if(config.source_profile.empty()) {
        config.source_profile = config.role_arn.empty() ? profile : m_default;
    }

    config.mfa_serial = value_of(section, "mfa_serial");

    if(config.mfa_serial.empty() && config.source_profile != profile) {
        config.mfa_serial = value_of(section_of(tree, config.source_profile), "mfa_serial");
    }

    config.external_id = value_of(section, "external_id");

    config.role_duration = seconds_of(profile, section, "duration_seconds", config.role_duration);
    config.session_duration = seconds_of(profile, section, "session_token_duration",
        config.session_duration);

    RUNAS_LOG_DEBUG(m_log, "profile '{}' uses source '{}', role '{}'", profile, config.source_profile,
        config.role_arn);

    return config;
}

std::vector<std::string>
ini_t::profiles(bool roles_only) {
    const auto tree = load();

    std::vector<std::string> names;

    for(auto it = tree.begin(); it != tree.end(); ++it) {
        std::string name;

        if(boost::starts_with(it->first, kProfilePrefix)) {
            name = it->first.substr(kProfilePrefix.size());
        } else if(it->first == defaults::default_profile) {
            name = it->first;
        } else {
            continue;
        }

        const boost::optional<const pt::ptree&> section(it->second);

        if(roles_only && value_of(section, "role_arn").empty()) {
            continue;
        }

        names.push_back(name);
    }

    return names;
}

auto
ini_t::load() const -> pt::ptree {
    fs::ifstream stream(m_path);

    if(!stream) {
        throw error_t(error::unreadable_config, "unable to read profiles from '{}'", m_path);
    }

    pt::ptree tree;

    try {
        pt::read_ini(stream, tree);
    } catch(const pt::ini_parser_error& e) {
        throw error_t(error::unreadable_config, "unable to parse '{}' - {}", m_path, e.what());
    }

    return tree;
}
