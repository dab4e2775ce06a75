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


#ifndef RUNAS_DISCOVERY_HPP
#define RUNAS_DISCOVERY_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"

#include <boost/optional/optional.hpp>

namespace runas { namespace discovery {

// Always sorted in ascending order and free of duplicates.
typedef std::vector<std::string> role_set_t;

auto
dedup(std::vector<std::string> roles) -> role_set_t;

// Extracts the roles a policy document allows to assume. A missing document and a document
// which isn't a JSON object are errors, an empty document yields an empty set. Statements of an
// unexpected shape contribute nothing.
auto
extract_roles(const boost::optional<std::string>& document) -> role_set_t;

// Percent-decoding of the URL-encoded policy text the provider API returns. Policy sources apply it
// to raw text only, never to a document which has been decoded already.
auto
url_decode(const std::string& text) -> std::string;

// Collects the roles from every policy document which applies to the principal. A broken
// document is skipped with a warning, a failure to fetch the documents propagates.
auto
discover(api::policy_t& source, const std::string& profile, const principal_t& principal,
         logging::logger_t& log) -> role_set_t;

}} // namespace runas::discovery

#endif
