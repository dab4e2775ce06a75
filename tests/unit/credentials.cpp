#include <gtest/gtest.h>

#include <runas/credentials.hpp>
#include <runas/errors.hpp>

#include <json/json.h>

namespace runas {
namespace {

auto
parse(const std::string& text) -> Json::Value {
    Json::Reader reader(Json::Features::strictMode());
    Json::Value root;

    EXPECT_TRUE(reader.parse(text, root)) << reader.getFormattedErrorMessages();

    return root;
}

TEST(chrono, rfc3339) {
    const auto time = clock_type::from_time_t(1136214245);

    EXPECT_EQ("2006-01-02T15:04:05Z", chrono::to_rfc3339(time));
    EXPECT_EQ(time, chrono::from_rfc3339("2006-01-02T15:04:05Z"));
}

TEST(chrono, rfc3339_with_offset_and_fraction) {
    const auto time = clock_type::from_time_t(1136214245);

    EXPECT_EQ(time, chrono::from_rfc3339("2006-01-02T08:04:05-07:00"));
    EXPECT_EQ(time, chrono::from_rfc3339("2006-01-02T16:04:05+0100"));
    EXPECT_EQ(time, chrono::from_rfc3339("2006-01-02T15:04:05.999Z"));
}

TEST(chrono, rfc3339_rejects_garbage) {
    EXPECT_THROW(chrono::from_rfc3339("yesterday"), std::system_error);
    EXPECT_THROW(chrono::from_rfc3339("2006-01-02T15:04:05Zjunk"), std::system_error);
}

TEST(credentials, expiry) {
    session_credentials_t credentials;
    credentials.expiration = clock_type::now() + std::chrono::minutes(1);

    EXPECT_FALSE(credentials.expired());
    EXPECT_TRUE(credentials.expired(credentials.expiration));
    EXPECT_TRUE(credentials.expired(credentials.expiration + std::chrono::seconds(1)));
}

TEST(credentials, cache_blob) {
    session_credentials_t credentials;

    credentials.access_key_id     = "ASIAEXAMPLE";
    credentials.secret_access_key = "secret";
    credentials.session_token     = "token";
    credentials.expiration        = clock_type::from_time_t(1136214245);

    const auto root = parse(to_json(credentials));

    EXPECT_EQ("ASIAEXAMPLE", root["AccessKeyId"].asString());
    EXPECT_EQ("secret", root["SecretAccessKey"].asString());
    EXPECT_EQ("token", root["SessionToken"].asString());
    EXPECT_EQ("2006-01-02T15:04:05Z", root["Expiration"].asString());

    const auto restored = session_from_json(to_json(credentials));

    EXPECT_EQ(credentials.access_key_id, restored.access_key_id);
    EXPECT_EQ(credentials.expiration, restored.expiration);
}

TEST(credentials, cache_blob_rejects_incomplete_entries) {
    const std::vector<std::string> samples = {
        "",
        "[]",
        R"({"AccessKeyId": "a", "SecretAccessKey": "b", "SessionToken": "c"})",
        R"({"AccessKeyId": "", "SecretAccessKey": "b", "SessionToken": "c", "Expiration": "2006-01-02T15:04:05Z"})",
        R"({"AccessKeyId": "a", "SecretAccessKey": "b", "SessionToken": "c", "Expiration": "soon"})"
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        try {
            session_from_json(*it);
            FAIL() << "an exception was expected for: " << *it;
        } catch(const std::system_error& e) {
            EXPECT_EQ(make_error_code(error::cache_corrupted), e.code()) << *it;
        }
    }
}

TEST(credentials, metadata_document) {
    role_credentials_t credentials;

    credentials.access_key_id     = "ASIAROLE";
    credentials.secret_access_key = "role-secret";
    credentials.session_token     = "role-token";
    credentials.expiration        = clock_type::from_time_t(1136215145);

    const auto root = parse(to_metadata_json(credentials, clock_type::from_time_t(1136214245)));

    EXPECT_EQ("Success", root["Code"].asString());
    EXPECT_EQ("AWS-HMAC", root["Type"].asString());
    EXPECT_EQ("2006-01-02T15:04:05Z", root["LastUpdated"].asString());
    EXPECT_EQ("ASIAROLE", root["AccessKeyId"].asString());
    EXPECT_EQ("role-secret", root["SecretAccessKey"].asString());
    EXPECT_EQ("role-token", root["Token"].asString());
    EXPECT_EQ("2006-01-02T15:19:05Z", root["Expiration"].asString());
    EXPECT_EQ(7u, root.size());
}

} // namespace
} // namespace runas
