#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <runas/broker.hpp>
#include <runas/cache.hpp>
#include <runas/defaults.hpp>
#include <runas/errors.hpp>
#include <runas/logging.hpp>
#include <runas/page.hpp>
#include <runas/server.hpp>

#include <stdexcept>

#include <json/json.h>

#include "mocks.hpp"

namespace runas {
namespace {

using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

auto
make_request(const std::string& method, const std::string& path) -> request_t {
    request_t request;

    request.method   = method;
    request.path     = path;
    request.protocol = "HTTP/1.1";

    return request;
}

auto
make_request(const std::string& method, const std::string& path, const std::string& body) -> request_t {
    auto request = make_request(method, path);

    request.reader = [body](std::size_t limit) -> std::string { return body.substr(0, limit); };

    return request;
}

class server_test_t:
    public ::testing::Test
{
protected:
    std::shared_ptr<NiceMock<mock::resolver_t>> resolver;
    std::shared_ptr<NiceMock<mock::identity_t>> identity;
    std::shared_ptr<NiceMock<mock::policy_t>> policy;
    std::shared_ptr<NiceMock<mock::platform_t>> platform;
    std::shared_ptr<broker_t> broker;
    std::unique_ptr<server_t> server;

    virtual
    void
    SetUp() {
        resolver = std::make_shared<NiceMock<mock::resolver_t>>();
        identity = std::make_shared<NiceMock<mock::identity_t>>();
        policy   = std::make_shared<NiceMock<mock::policy_t>>();
        platform = std::make_shared<NiceMock<mock::platform_t>>();

        broker = std::make_shared<broker_t>(
            logging::make_null_logger(),
            resolver,
            identity,
            std::make_shared<session_cache_t>(logging::make_null_logger(), "")
        );

        make_server(policy);

        ON_CALL(*resolver, resolve("admin"))
            .WillByDefault(Return(tests::make_role_config("admin", "default", "arn:role/admin")));
        ON_CALL(*resolver, resolve("missing"))
            .WillByDefault(Throw(error_t(error::profile_not_found, "profile 'missing' not found")));
        ON_CALL(*resolver, profiles(true))
            .WillByDefault(Return(std::vector<std::string>{"reader", "admin"}));

        ON_CALL(*identity, caller_identity(_))
            .WillByDefault(Return(tests::make_principal("alice")));
        ON_CALL(*identity, session_token(_, _, _, _))
            .WillByDefault(Return(tests::make_session("A", std::chrono::hours(12))));
    }

    void
    make_server(std::shared_ptr<api::policy_t> source) {
        server_t::settings_t settings;

        settings.address = defaults::metadata_address;
        settings.port    = defaults::metadata_port;
        settings.workers = 1;

        server.reset(new server_t(logging::make_null_logger(), broker, resolver, source, platform,
            settings));
    }
};

TEST_F(server_test_t, home_page) {
    const auto response = server->handle(make_request("GET", "/"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("text/html", response.content_type);
    EXPECT_THAT(response.body, HasSubstr("<option>admin</option>"));
    EXPECT_THAT(response.body, HasSubstr("<option>reader</option>"));
    EXPECT_THAT(response.body, HasSubstr("\"/mfa\""));
    EXPECT_THAT(response.body, HasSubstr("\"/profile\""));
    EXPECT_THAT(response.body, HasSubstr("\"/refresh\""));
}

TEST_F(server_test_t, select_profile) {
    auto response = server->handle(make_request("POST", "/profile", "admin"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("text/plain", response.content_type);
    EXPECT_EQ(chrono::to_local(*broker->expiration()), response.body);

    response = server->handle(make_request("GET", "/profile"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("admin", response.body);
}

TEST_F(server_test_t, select_unknown_profile) {
    const auto response = server->handle(make_request("POST", "/profile", "missing"));

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Error resolving profile config", response.body);
}

TEST_F(server_test_t, select_profile_requiring_mfa) {
    EXPECT_CALL(*identity, session_token(_, _, _, ""))
        .WillOnce(Throw(error_t(error::mfa_required, "MFA code required")));

    auto response = server->handle(make_request("POST", "/profile", "admin"));

    EXPECT_EQ(401, response.status);
    EXPECT_EQ("MFA code required", response.body);

    EXPECT_CALL(*identity, session_token(_, _, _, "123456"))
        .WillOnce(Return(tests::make_session("M", std::chrono::hours(12))));

    // Everything past the read limit is never seen by the broker.
    response = server->handle(make_request("POST", "/mfa", "123456" + std::string(100, 'x')));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("M", broker->credentials()->access_key_id);
}

TEST_F(server_test_t, invalid_mfa_code) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .Times(0);

    const auto response = server->handle(make_request("POST", "/mfa", "12"));

    EXPECT_EQ(401, response.status);
    EXPECT_EQ("Invalid MFA Code", response.body);
}

TEST_F(server_test_t, body_problems) {
    auto response = server->handle(make_request("POST", "/profile"));

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Missing request body", response.body);

    auto request = make_request("POST", "/mfa");

    request.reader = [](std::size_t) -> std::string {
        throw error_t(error::unreadable_body, "connection reset");
    };

    response = server->handle(request);

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Error reading request data", response.body);
}

TEST_F(server_test_t, unknown_path_and_wrong_method) {
    auto response = server->handle(make_request("GET", "/latest/user-data"));

    EXPECT_EQ(404, response.status);
    EXPECT_EQ("Not Found", response.body);

    response = server->handle(make_request("GET", "/mfa"));

    EXPECT_EQ(405, response.status);
    EXPECT_EQ("Method Not Allowed", response.body);

    response = server->handle(make_request("DELETE", "/profile"));

    EXPECT_EQ(405, response.status);

    response = server->handle(make_request("POST", defaults::credentials_path));

    EXPECT_EQ(405, response.status);
}

TEST_F(server_test_t, credentials_listing) {
    server->handle(make_request("POST", "/profile", "admin"));

    auto response = server->handle(make_request("GET", defaults::credentials_path));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("admin", response.body);

    const auto bare = defaults::credentials_path.substr(0, defaults::credentials_path.size() - 1);

    response = server->handle(make_request("GET", bare));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("admin", response.body);
}

TEST_F(server_test_t, credentials_document) {
    role_credentials_t issued;

    issued.access_key_id     = "ROLE";
    issued.secret_access_key = "role-secret";
    issued.session_token     = "role-token";

    EXPECT_CALL(*identity, assume_role(_, "arn:role/admin", "alice", _, _))
        .WillOnce(Return(issued));

    server->handle(make_request("POST", "/profile", "admin"));

    const auto response = server->handle(make_request("GET", defaults::credentials_path + "admin"));

    ASSERT_EQ(200, response.status);
    EXPECT_EQ("application/json", response.content_type);

    Json::Reader reader;
    Json::Value root;

    ASSERT_TRUE(reader.parse(response.body, root));
    EXPECT_EQ("Success", root["Code"].asString());
    EXPECT_EQ("AWS-HMAC", root["Type"].asString());
    EXPECT_EQ("ROLE", root["AccessKeyId"].asString());
    EXPECT_EQ("role-token", root["Token"].asString());
}

TEST_F(server_test_t, credentials_failure) {
    auto response = server->handle(make_request("GET", defaults::credentials_path + "admin"));

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Error getting role credentials", response.body);

    EXPECT_CALL(*identity, assume_role(_, _, _, _, _))
        .WillOnce(Throw(error_t(error::access_denied, "not allowed")));

    server->handle(make_request("POST", "/profile", "admin"));

    response = server->handle(make_request("GET", defaults::credentials_path + "admin"));

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Error getting role credentials", response.body);
}

TEST_F(server_test_t, list_roles_merges_discovered_roles) {
    api::policy_t::document_list_t documents;

    documents.push_back(std::string(R"({"Statement": [{"Effect": "Allow", "Action": "sts:AssumeRole",)"
        R"( "Resource": ["arn:role/discovered", "admin"]}]})"));

    EXPECT_CALL(*policy, documents("default", _))
        .Times(1)
        .WillOnce(Return(documents));

    server->handle(make_request("POST", "/profile", "admin"));

    auto response = server->handle(make_request("GET", "/list-roles"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("application/json", response.content_type);
    EXPECT_EQ(R"(["admin","arn:role/discovered","reader"])", response.body);

    // Discovered roles are remembered.
    response = server->handle(make_request("GET", "/list-roles"));

    EXPECT_EQ(R"(["admin","arn:role/discovered","reader"])", response.body);
}

TEST_F(server_test_t, list_roles_without_policy) {
    make_server(nullptr);

    server->handle(make_request("POST", "/profile", "admin"));

    const auto response = server->handle(make_request("GET", "/list-roles"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ(R"(["admin","reader"])", response.body);
}

TEST_F(server_test_t, list_roles_survives_discovery_failure) {
    EXPECT_CALL(*policy, documents(_, _))
        .WillRepeatedly(Throw(error_t(error::access_denied, "not allowed")));

    server->handle(make_request("POST", "/profile", "admin"));

    const auto response = server->handle(make_request("GET", "/list-roles"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ(R"(["admin","reader"])", response.body);
}

TEST_F(server_test_t, refresh) {
    EXPECT_CALL(*policy, documents(_, _))
        .Times(2)
        .WillRepeatedly(Return(api::policy_t::document_list_t()));

    server->handle(make_request("POST", "/profile", "admin"));
    server->handle(make_request("GET", "/list-roles"));

    auto response = server->handle(make_request("POST", "/refresh"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("success", response.body);
    EXPECT_EQ(broker_t::state_t::no_session, broker->state());

    server->handle(make_request("GET", "/list-roles"));

    response = server->handle(make_request("GET", "/refresh"));

    EXPECT_EQ(405, response.status);
}

TEST_F(server_test_t, refresh_without_profile) {
    const auto response = server->handle(make_request("POST", "/refresh"));

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("text/plain", response.content_type);
    EXPECT_EQ("success", response.body);
    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
}

TEST_F(server_test_t, unexpected_failure) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Throw(std::runtime_error("unexpected")));

    const auto response = server->handle(make_request("POST", "/profile", "admin"));

    EXPECT_EQ(500, response.status);
    EXPECT_EQ("Error getting session credentials", response.body);
}

TEST(handler_error, classification) {
    struct sample_t {
        std::error_code code;
        int status;
        std::string message;
    };

    const std::vector<sample_t> samples = {
        { make_error_code(error::missing_reader),     500, "Missing request body" },
        { make_error_code(error::unreadable_body),    500, "Error reading request data" },
        { make_error_code(error::unknown_endpoint),   404, "Not Found" },
        { make_error_code(error::method_not_allowed), 405, "Method Not Allowed" },
        { make_error_code(error::mfa_code_required),  401, "MFA code required" },
        { make_error_code(error::invalid_mfa_code),   401, "Invalid MFA Code" },
        { make_error_code(error::resolve_failed),     500, "Error resolving profile config" },
        { make_error_code(error::provider_failure),   500, "fallback" },
        { make_error_code(error::cache_unavailable),  500, "fallback" }
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        const auto failure = make_handler_error(std::system_error(it->code, "details"), "fallback");

        EXPECT_EQ(it->code, failure.kind);
        EXPECT_EQ(it->status, failure.status);
        EXPECT_EQ(it->message, failure.message);
    }
}

TEST(page, escape) {
    EXPECT_EQ("&lt;script&gt;alert(&#34;x&#39;)&lt;/script&gt; &amp;",
              page::escape("<script>alert(\"x')</script> &"));
    EXPECT_EQ("arn:aws:iam::123456789012:role/admin", page::escape("arn:aws:iam::123456789012:role/admin"));
}

TEST(page, render) {
    page::endpoints_t endpoints;

    endpoints.profile = "/profile";
    endpoints.mfa     = "/mfa";
    endpoints.refresh = "/refresh";

    const auto body = page::render(endpoints, {"a<b", "plain"});

    EXPECT_THAT(body, HasSubstr("<option>a&lt;b</option>"));
    EXPECT_THAT(body, HasSubstr("<option>plain</option>"));
    EXPECT_THAT(body, ::testing::Not(HasSubstr("{{")));
}

} // namespace
} // namespace runas
