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

#ifndef RUNAS_LOGGING_HPP
#define RUNAS_LOGGING_HPP

#include "runas/common.hpp"
#include "runas/format.hpp"

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/logger.hpp>

#define RUNAS_LOG(__log__, __severity__, ...) \
    ::runas::detail::logging::log(__log__, __severity__, __VA_ARGS__)

#define RUNAS_LOG_DEBUG(__log__, ...) \
    RUNAS_LOG(__log__, ::runas::logging::debug, __VA_ARGS__)

#define RUNAS_LOG_INFO(__log__, ...) \
    RUNAS_LOG(__log__, ::runas::logging::info, __VA_ARGS__)

#define RUNAS_LOG_WARNING(__log__, ...) \
    RUNAS_LOG(__log__, ::runas::logging::warning, __VA_ARGS__)

#define RUNAS_LOG_ERROR(__log__, ...) \
    RUNAS_LOG(__log__, ::runas::logging::error, __VA_ARGS__)

namespace runas { namespace detail { namespace logging {

template<typename T> inline auto logger_ref(T& log) -> T& { return log; }
template<typename T> inline auto logger_ref(std::shared_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::shared_ptr<T>& log) -> T& { return *log; }

template<typename T>
auto
make_facade(T&& log) -> blackhole::logger_facade<runas::logging::logger_t> {
    return blackhole::logger_facade<runas::logging::logger_t>(logger_ref(log));
}

template<typename Log, typename Message>
auto
log(Log&& log, runas::logging::priorities severity, Message&& message) -> void {
    make_facade(log).log(severity, std::forward<Message>(message));
}

template<typename Log, typename Message, typename... Args>
auto
log(Log&& log, runas::logging::priorities severity, Message&& message, const Args&... args) -> void {
    make_facade(log).log(severity, std::forward<Message>(message), args...);
}

}}}  // namespace runas::detail::logging

namespace runas { namespace logging {

// Creates a child logger tagging every record with the originating component.
auto
make_logger(logger_t& root, const std::string& source) -> std::shared_ptr<logger_t>;

// A logger which drops everything, handy when a component is used outside of the runtime.
auto
make_null_logger() -> std::shared_ptr<logger_t>;

// Maps "debug", "info", "warning" and "error" onto priorities, throws error_t otherwise.
auto
severity_of(const std::string& name) -> priorities;

}}  // namespace runas::logging

#endif
