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


#ifndef RUNAS_PAGE_HPP
#define RUNAS_PAGE_HPP

#include "runas/common.hpp"

namespace runas { namespace page {

struct endpoints_t {
    std::string profile;
    std::string mfa;
    std::string refresh;
};

// Renders the role selector served on the root path. Role names are HTML-escaped.
auto
render(const endpoints_t& endpoints, const std::vector<std::string>& roles) -> std::string;

auto
escape(const std::string& text) -> std::string;

}} // namespace runas::page

#endif
