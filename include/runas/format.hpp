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


#ifndef RUNAS_FORMAT_HPP
#define RUNAS_FORMAT_HPP

#include <blackhole/extensions/format.hpp>

#include <string>

namespace runas {

// Without arguments the text is taken literally, braces included.
inline
std::string
format(const std::string& text) {
    return text;
}

// A broken pattern must never take an error path down with it, so it is reported inline.
template<class Arg, class... Args>
inline
std::string
format(const std::string& pattern, const Arg& arg, const Args&... args) {
    try {
        return blackhole::fmt::format(pattern, arg, args...);
    } catch(const blackhole::fmt::FormatError& e) {
        return "<unable to format '" + pattern + "' - " + e.what() + ">";
    }
}

} // namespace runas

#endif
