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


#include "runas/logging.hpp"

#include <map>

#include <blackhole/handler.hpp>
#include <blackhole/root.hpp>
#include <blackhole/wrapper.hpp>

namespace runas { namespace logging {

auto
make_logger(logger_t& root, const std::string& source) -> std::shared_ptr<logger_t> {
    return std::make_shared<blackhole::wrapper_t>(root, blackhole::attributes_t{
        {"source", source}
    });
}

auto
make_null_logger() -> std::shared_ptr<logger_t> {
    // No handlers, so every record is filtered out before formatting.
    return std::make_shared<blackhole::root_logger_t>(
        std::vector<std::unique_ptr<blackhole::handler_t>>()
    );
}

auto
severity_of(const std::string& name) -> priorities {
    static const std::map<std::string, priorities> names = {
        { "debug",   debug   },
        { "info",    info    },
        { "warning", warning },
        { "error",   error   }
    };

    const auto it = names.find(name);

    if(it == names.end()) {
        throw error_t("severity \"{}\" not found", name);
    }

    return it->second;
}

}} // namespace runas::logging
