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


#include "runas/identity/cli.hpp"

#include "runas/detail/process.hpp"
#include "runas/discovery.hpp"
#include "runas/logging.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <json/json.h>

using namespace runas;
using namespace runas::identity;

namespace process = runas::detail::process;

namespace {

auto
invoke(logging::logger_t& log, const cli_options_t& options, std::vector<std::string> args,
       const process::string_map_t& environment = process::string_map_t()) -> Json::Value
{
    args.push_back("--output");
    args.push_back("json");

    if(!options.region.empty()) {
        args.push_back("--region");
        args.push_back(options.region);
    }

    RUNAS_LOG_DEBUG(log, "running '{} {}'", options.command, boost::algorithm::join(args, " "));

    const auto result = process::run(options.command, args, environment);

    if(result.status != 0) {
        const auto failure = parse_cli_error(result.err);

        if(failure.first.empty()) {
            throw error_t(error::request_failed, "'{}' exited with status {} - {}", options.command,
                result.status, boost::algorithm::trim_copy(result.err));
        }

        if(failure.first == "AccessDenied") {
            throw error_t(error::access_denied, "{}", failure.second);
        }

        throw error_t(error::request_failed, "{}: {}", failure.first, failure.second);
    }

    Json::Reader reader(Json::Features::strictMode());
    Json::Value root;

    if(!reader.parse(result.out, root) || !root.isObject()) {
        throw error_t(error::invalid_response, "unable to parse '{}' output - {}", options.command,
            reader.getFormattedErrorMessages());
    }

    return root;
}

auto
string_of(const Json::Value& object, const char* key) -> std::string {
    const auto& value = object[key];

    if(!value.isString()) {
        throw error_t(error::invalid_response, "field '{}' is missing in the response", key);
    }

    return value.asString();
}

auto
credentials_of(const Json::Value& root) -> session_credentials_t {
    const auto& object = root["Credentials"];

    if(!object.isObject()) {
        throw error_t(error::invalid_response, "response carries no credentials");
    }

    session_credentials_t credentials;

    credentials.access_key_id     = string_of(object, "AccessKeyId");
    credentials.secret_access_key = string_of(object, "SecretAccessKey");
    credentials.session_token     = string_of(object, "SessionToken");

    try {
        credentials.expiration = chrono::from_rfc3339(string_of(object, "Expiration"));
    } catch(const std::system_error& e) {
        throw error_t(error::invalid_response, "{}", e.what());
    }

    return credentials;
}

// The command line client decodes policy documents on its own, so they arrive either as objects
// or, from older clients, as the raw URL-encoded text. Only the latter is decoded here, objects
// are serialized back as they are.
auto
document_of(const Json::Value& value) -> boost::optional<std::string> {
    if(value.isString()) {
        const auto text = value.asString();

        if(boost::starts_with(boost::algorithm::trim_left_copy(text), "{")) {
            return text;
        }

        try {
            return discovery::url_decode(text);
        } catch(const std::system_error&) {
            // Text which is neither a JSON object nor decodable is left for the parser to reject.
            return text;
        }
    }

    if(value.isObject()) {
        Json::FastWriter writer;
        writer.omitEndingLineFeed();

        return writer.write(value);
    }

    return boost::none;
}

auto
names_of(const Json::Value& array, const char* key) -> std::vector<std::string> {
    std::vector<std::string> names;

    if(!array.isArray()) {
        return names;
    }

    for(const auto& item: array) {
        if(item.isString()) {
            names.push_back(item.asString());
        } else if(item.isObject() && item[key].isString()) {
            names.push_back(item[key].asString());
        }
    }

    return names;
}

auto
profile_args(std::vector<std::string> args, const std::string& profile) -> std::vector<std::string> {
    if(!profile.empty()) {
        args.push_back("--profile");
        args.push_back(profile);
    }

    return args;
}

} // namespace

namespace runas { namespace identity {

auto
parse_cli_error(const std::string& output) -> std::pair<std::string, std::string> {
    static const std::string prefix = "An error occurred (";

    const auto start = output.find(prefix);

    if(start == std::string::npos) {
        return std::make_pair(std::string(), std::string());
    }

    const auto code_begin = start + prefix.size();
    const auto code_end = output.find(')', code_begin);

    if(code_end == std::string::npos) {
        return std::make_pair(std::string(), std::string());
    }

    std::string message;

    const auto separator = output.find(": ", code_end);

    if(separator != std::string::npos) {
        message = boost::algorithm::trim_copy(output.substr(separator + 2));
    }

    return std::make_pair(output.substr(code_begin, code_end - code_begin), message);
}

auto
user_name_of(const std::string& arn) -> std::string {
    const auto position = arn.rfind('/');

    if(position == std::string::npos) {
        return arn;
    }

    return arn.substr(position + 1);
}

}} // namespace runas::identity

cli_t::cli_t(std::shared_ptr<logging::logger_t> log, cli_options_t options):
    m_log(std::move(log)),
    m_options(std::move(options))
{ }

principal_t
cli_t::caller_identity(const std::string& profile) {
    const auto root = invoke(*m_log, m_options, profile_args({"sts", "get-caller-identity"}, profile));

    principal_t principal;

    principal.account   = string_of(root, "Account");
    principal.arn       = string_of(root, "Arn");
    principal.user_name = user_name_of(principal.arn);

    return principal;
}

session_credentials_t
cli_t::session_token(const std::string& profile,
                     std::chrono::seconds duration,
                     const std::string& mfa_serial,
                     const std::string& mfa_code)
{
    if(!mfa_serial.empty() && mfa_code.empty()) {
        throw error_t(error::mfa_required, "profile '{}' requires an MFA code", profile);
    }

    std::vector<std::string> args = {
        "sts", "get-session-token", "--duration-seconds", std::to_string(duration.count())
    };

    if(!mfa_serial.empty()) {
        args.insert(args.end(), { "--serial-number", mfa_serial, "--token-code", mfa_code });
    }

    return credentials_of(invoke(*m_log, m_options, profile_args(std::move(args), profile)));
}

role_credentials_t
cli_t::assume_role(const session_credentials_t& session,
                   const std::string& role_arn,
                   const std::string& session_name,
                   const std::string& external_id,
                   std::chrono::seconds duration)
{
    std::vector<std::string> args = {
        "sts", "assume-role",
        "--role-arn", role_arn,
        "--role-session-name", session_name,
        "--duration-seconds", std::to_string(duration.count())
    };

    if(!external_id.empty()) {
        args.insert(args.end(), { "--external-id", external_id });
    }

    // The session credentials take precedence over whatever profile the environment names.
    const process::string_map_t environment = {
        { "AWS_ACCESS_KEY_ID",     session.access_key_id     },
        { "AWS_SECRET_ACCESS_KEY", session.secret_access_key },
        { "AWS_SESSION_TOKEN",     session.session_token     },
        { "AWS_PROFILE",           std::string()             },
        { "AWS_DEFAULT_PROFILE",   std::string()             }
    };

    const auto credentials = credentials_of(invoke(*m_log, m_options, std::move(args), environment));

    role_credentials_t result;

    result.access_key_id     = credentials.access_key_id;
    result.secret_access_key = credentials.secret_access_key;
    result.session_token     = credentials.session_token;
    result.expiration        = credentials.expiration;

    return result;
}

cli_policy_t::cli_policy_t(std::shared_ptr<logging::logger_t> log, cli_options_t options):
    m_log(std::move(log)),
    m_options(std::move(options))
{ }

auto
cli_policy_t::documents(const std::string& profile, const principal_t& principal) -> document_list_t {
    document_list_t documents;

    inline_policies(profile, "user", principal.user_name, documents);
    attached_policies(profile, "user", principal.user_name, documents);

    const auto groups = invoke(*m_log, m_options, profile_args({
        "iam", "list-groups-for-user", "--user-name", principal.user_name
    }, profile));

    for(const auto& group: names_of(groups["Groups"], "GroupName")) {
        inline_policies(profile, "group", group, documents);
        attached_policies(profile, "group", group, documents);
    }

    RUNAS_LOG_DEBUG(m_log, "fetched {:d} policy document(s) of '{}'", documents.size(),
        principal.user_name);

    return documents;
}

void
cli_policy_t::inline_policies(const std::string& profile, const std::string& kind,
                              const std::string& name, document_list_t& documents)
{
    const auto listing = invoke(*m_log, m_options, profile_args({
        "iam", "list-" + kind + "-policies", "--" + kind + "-name", name
    }, profile));

    for(const auto& policy: names_of(listing["PolicyNames"], "PolicyName")) {
        const auto root = invoke(*m_log, m_options, profile_args({
            "iam", "get-" + kind + "-policy", "--" + kind + "-name", name, "--policy-name", policy
        }, profile));

        documents.push_back(document_of(root["PolicyDocument"]));
    }
}

void
cli_policy_t::attached_policies(const std::string& profile, const std::string& kind,
                                const std::string& name, document_list_t& documents)
{
    const auto listing = invoke(*m_log, m_options, profile_args({
        "iam", "list-attached-" + kind + "-policies", "--" + kind + "-name", name
    }, profile));

    for(const auto& arn: names_of(listing["AttachedPolicies"], "PolicyArn")) {
        const auto policy = invoke(*m_log, m_options, profile_args({
            "iam", "get-policy", "--policy-arn", arn
        }, profile));

        const auto& object = policy["Policy"];

        if(!object.isObject() || !object["DefaultVersionId"].isString()) {
            documents.push_back(boost::none);
            continue;
        }

        const auto root = invoke(*m_log, m_options, profile_args({
            "iam", "get-policy-version", "--policy-arn", arn,
            "--version-id", object["DefaultVersionId"].asString()
        }, profile));

        const auto& version = root["PolicyVersion"];

        if(!version.isObject()) {
            documents.push_back(boost::none);
            continue;
        }

        documents.push_back(document_of(version["Document"]));
    }
}
