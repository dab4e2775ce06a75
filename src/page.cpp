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


#include "runas/page.hpp"

#include <boost/algorithm/string/replace.hpp>

using namespace runas;

namespace {

const char kTemplate[] = R"html(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>runas - Metadata Credential Server</title>
<script>
function postProfile(role) {
  var xhr = new XMLHttpRequest();
  xhr.onreadystatechange = function() {
    if (this.readyState == 4) {
      if (this.status == 200) {
        var data = this.responseText;
        document.getElementById("message").innerHTML = "Credentials will expire on <i>" + data + "</i>"
      } else if (this.status == 401) {
        var mfa = prompt("Enter MFA Code", "");
        this.open("POST", "{{mfa_ep}}", true);
        this.send(mfa);
      }
    }
  }

  xhr.open("POST", "{{profile_ep}}", true);
  xhr.send(role);
}

function selectRole() {
  var xhr = new XMLHttpRequest();
  xhr.onreadystatechange = function() {
    if (this.readyState == 4 && this.status == 200) {
      var role = this.responseText;
      var opts = document.getElementById("roles").options

      for (var i = 0; i < opts.length; i++) {
        if (opts[i].text == role) {
          opts[i].selected = true;
          postProfile(role)
          return;
        }
      }

      opts[0].selected = true;
    }
  }

  xhr.open("GET", "{{profile_ep}}", true);
  xhr.send();
  return false;
}

window.addEventListener("load", function(evt) {
  selectRole()

  document.getElementById("roles").onchange = function(evt) {
    postProfile(evt.target.value);
    return false;
  };

  document.getElementById("refresh").onclick = function(evt) {
    var xhr = new XMLHttpRequest();
    xhr.onreadystatechange = function() {
      if (this.readyState == 4 && this.status == 200) {
        r = document.getElementById("roles")
        postProfile(r.options[r.selectedIndex].text);
      }
    }

    xhr.open("POST", "{{refresh_ep}}", true);
    xhr.send();
    return false;
  };
});
</script>
<style>
body {
  background-color: navy;
  font-family: Tahoma, Geneva, sans-serif;
  font-size: large;
  margin: 0;
}

#content {
  background-color: white;
  margin: auto;
  width: 30em;
  padding: 0.5em;
}

#message {
  margin-top: 1em;
}

#title {
  text-align: center;
}

#roles, option {
  font-size: large;
}

#refresh {
  background-color: crimson;
  border: 2px solid crimson;
  color: white;
  padding: 0.5em 1em;
  font-weight: bold;
  font-size: large;
  display: inline-block;
  border-radius: 0.33em;
  margin-left: 3em;
}

#refresh:hover {
  background-color: white;
  color: crimson;
}
</style>
</head>
<body>
<div id="content">
  <div id="title">
  <h2>Metadata Service Role Selector</h2>
  </div>

  <div id="form">
  <form>
  <label for="roles"><b>Roles</b></label>&nbsp;
  <select id="roles" name="roles">
    <option value="">-- Select Role --</option>
{{roles}}  </select>
  <button id="refresh" name="refresh" title="Force a refresh of the credentials, may require re-entering MFA code">
    Refresh Now
  </button>
  </form>
  </div>

  <div id="message">&nbsp;</div>
</div>
</body>
</html>
)html";

} // namespace

namespace runas { namespace page {

auto
escape(const std::string& text) -> std::string {
    std::string result;
    result.reserve(text.size());

    for(auto it = text.begin(); it != text.end(); ++it) {
        switch(*it) {
        case '&':  result.append("&amp;");  break;
        case '<':  result.append("&lt;");   break;
        case '>':  result.append("&gt;");   break;
        case '"':  result.append("&#34;");  break;
        case '\'': result.append("&#39;");  break;
        default:
            result.push_back(*it);
        }
    }

    return result;
}

auto
render(const endpoints_t& endpoints, const std::vector<std::string>& roles) -> std::string {
    std::string options;

    for(auto it = roles.begin(); it != roles.end(); ++it) {
        options.append("    <option>").append(escape(*it)).append("</option>\n");
    }

    std::string result(kTemplate);

    // Endpoints end up inside script string literals, roles inside the markup.
    boost::algorithm::replace_all(result, "{{profile_ep}}", escape(endpoints.profile));
    boost::algorithm::replace_all(result, "{{mfa_ep}}", escape(endpoints.mfa));
    boost::algorithm::replace_all(result, "{{refresh_ep}}", escape(endpoints.refresh));
    boost::algorithm::replace_all(result, "{{roles}}", options);

    return result;
}

}} // namespace runas::page
