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


#include <iostream>
#include <sstream>

#include <boost/program_options.hpp>

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/config/json.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/extensions/writer.hpp>
#include <blackhole/logger.hpp>
#include <blackhole/record.hpp>
#include <blackhole/registry.hpp>
#include <blackhole/root.hpp>
#include <blackhole/wrapper.hpp>

#include "runas/broker.hpp"
#include "runas/cache.hpp"
#include "runas/common.hpp"
#include "runas/config.hpp"
#include "runas/errors.hpp"
#include "runas/identity/cli.hpp"
#include "runas/logging.hpp"
#include "runas/platform/linux.hpp"
#include "runas/resolver/ini.hpp"
#include "runas/server.hpp"

using namespace runas;

namespace po = boost::program_options;

int
main(int argc, char* argv[]) {
    po::options_description general_options("General options");
    po::variables_map vm;

    general_options.add_options()
        ("help,h", "show this message")
        ("configuration,c", po::value<std::string>(), "location of the configuration file")
        ("profile,p", po::value<std::string>(), "initial profile")
        ("cache-dir", po::value<std::string>(), "session credentials cache directory")
        ("logging,l", po::value<std::string>()->default_value("core"), "logging backend")
        ("verbose", "log debug messages")
        ("version,v", "show version and build information");

    try {
        po::store(po::command_line_parser(argc, argv).options(general_options).run(), vm);
        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << runas::format("ERROR: {}.", e.what()) << std::endl;
        return EXIT_FAILURE;
    }

    if(vm.count("help")) {
        std::cout << runas::format("USAGE: {} [options]", argv[0]) << std::endl;
        std::cout << general_options;
        return EXIT_SUCCESS;
    }

    if(vm.count("version")) {
        std::cout << runas::format("Runas {}.{}.{}", RUNAS_VERSION_MAJOR, RUNAS_VERSION_MINOR,
            RUNAS_VERSION_RELEASE) << std::endl;
        return EXIT_SUCCESS;
    }

    // Startup

    std::unique_ptr<config_t> config;

    try {
        if(vm.count("configuration")) {
            config = make_config(vm["configuration"].as<std::string>());
        } else {
            config = make_config();
        }

        if(vm.count("cache-dir")) {
            config->cache.path = path::expand(vm["cache-dir"].as<std::string>());
        }
    } catch(const std::system_error& e) {
        std::cerr << runas::format("ERROR: unable to initialize the configuration - {}.", error::to_string(e)) << std::endl;
        return EXIT_FAILURE;
    }

    if(vm.count("profile")) {
        config->profile = vm["profile"].as<std::string>();
    }

    if(vm.count("verbose")) {
        config->logging.severity = logging::debug;
    }

    // Logging

    const auto backend = vm["logging"].as<std::string>();

    std::unique_ptr<blackhole::root_logger_t> root;

    auto registry = blackhole::registry::configured();

    try {
        std::stringstream stream;
        stream << config->logging.loggers;

        auto log = registry->builder<blackhole::config::json_t>(stream)
            .build(backend);

        const auto severity = config->logging.severity;

        log.filter([=](const blackhole::record_t& record) -> bool {
            return record.severity() >= severity;
        });

        root.reset(new blackhole::root_logger_t(std::move(log)));
    } catch(const std::exception& e) {
        std::cerr << "ERROR: unable to initialize the logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    auto logger = logging::make_logger(*root, "runtime");

    RUNAS_LOG_INFO(logger, "initializing the metadata service");

    // Collaborators

    identity::cli_options_t options;

    options.command = config->provider.command;
    options.region  = config->provider.region;

    auto resolver = std::make_shared<resolver::ini_t>(
        logging::make_logger(*root, "resolver"),
        config->profiles.config,
        config->profiles.default_profile
    );

    auto broker = std::make_shared<broker_t>(
        logging::make_logger(*root, "broker"),
        resolver,
        std::make_shared<identity::cli_t>(logging::make_logger(*root, "identity"), options),
        std::make_shared<session_cache_t>(logging::make_logger(*root, "cache"), config->cache.path)
    );

    server_t::settings_t settings;

    settings.address   = config->server.address;
    settings.port      = config->server.port;
    settings.interface = config->server.interface;
    settings.workers   = config->server.workers;
    settings.profile   = config->profile;

    server_t server(
        logging::make_logger(*root, "server"),
        broker,
        resolver,
        std::make_shared<identity::cli_policy_t>(logging::make_logger(*root, "policy"), options),
        std::make_shared<platform::linux_t>(logging::make_logger(*root, "platform")),
        settings
    );

    try {
        server.run();
    } catch(const std::system_error& e) {
        RUNAS_LOG_ERROR(logger, "unable to run the metadata service - {}", error::to_string(e));
        return EXIT_FAILURE;
    } catch(const std::exception& e) {
        RUNAS_LOG_ERROR(logger, "unable to run the metadata service - {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
