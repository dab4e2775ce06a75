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

#ifndef RUNAS_FORWARDS_HPP
#define RUNAS_FORWARDS_HPP

#include <memory>
#include <vector>

// Third-party forwards

namespace blackhole {
inline namespace v1 {

class logger_t;

}  // namespace v1
}  // namespace blackhole

namespace restbed {

class Session;

} // namespace restbed

namespace runas {

class broker_t;
class server_t;
class session_cache_t;

struct config_t;
struct principal_t;
struct role_config_t;
struct role_credentials_t;
struct session_credentials_t;

typedef unsigned short port_t;

} // namespace runas

namespace runas { namespace api {

class identity_t;
class platform_t;
class policy_t;
class resolver_t;

}} // namespace runas::api

namespace runas { namespace logging {

enum priorities: int {
    debug   =  0,
    info    =  1,
    warning =  2,
    error   =  3
};

// Import the logger in our namespace.
using blackhole::logger_t;

}} // namespace runas::logging

#endif
