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


#ifndef RUNAS_DETAIL_PROCESS_HPP
#define RUNAS_DETAIL_PROCESS_HPP

#include "runas/common.hpp"

namespace runas { namespace detail { namespace process {

typedef std::map<std::string, std::string> string_map_t;

struct result_t {
    // Exit code, or 128 plus the signal number when the child was killed.
    int status;

    std::string out;
    std::string err;
};

// Exit code of a child which could not execute the requested command.
const int kExecFailure = 127;

// Runs the command found in PATH and collects both of its output streams. The child inherits the
// environment of the process with the given variables overridden, an empty value removes the
// variable. Throws provider_errors::spawn_failed when the child can't be started.
auto
run(const std::string& command, const std::vector<std::string>& args,
    const string_map_t& environment) -> result_t;

}}} // namespace runas::detail::process

#endif
