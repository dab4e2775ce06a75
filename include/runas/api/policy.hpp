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

#ifndef RUNAS_API_POLICY_HPP
#define RUNAS_API_POLICY_HPP

#include "runas/common.hpp"
#include "runas/credentials.hpp"

#include <boost/optional/optional.hpp>

namespace runas { namespace api {

// Fetches the policy documents which apply to a principal: inline and attached policies of the
// user itself and of every group it belongs to. Requests are made with the long-term credentials
// of the given profile.
class policy_t {
public:
    typedef std::vector<boost::optional<std::string>> document_list_t;

    virtual
   ~policy_t() {
        // Empty.
    }

    // Documents are returned as decoded JSON text: URL-encoded text from the provider is decoded
    // exactly once by the source. A document the provider did not return is boost::none.
    virtual
    document_list_t
    documents(const std::string& profile, const principal_t& principal) = 0;
};

}} // namespace runas::api

#endif
