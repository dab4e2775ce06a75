#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <runas/broker.hpp>
#include <runas/cache.hpp>
#include <runas/errors.hpp>
#include <runas/logging.hpp>

#include <boost/filesystem/operations.hpp>

#include "mocks.hpp"

namespace runas {
namespace {

using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace fs = boost::filesystem;

class broker_test_t:
    public ::testing::Test
{
protected:
    std::shared_ptr<NiceMock<mock::resolver_t>> resolver;
    std::shared_ptr<NiceMock<mock::identity_t>> identity;
    std::shared_ptr<session_cache_t> cache;
    std::unique_ptr<broker_t> broker;

    virtual
    void
    SetUp() {
        resolver = std::make_shared<NiceMock<mock::resolver_t>>();
        identity = std::make_shared<NiceMock<mock::identity_t>>();
        cache    = std::make_shared<session_cache_t>(logging::make_null_logger(), "");

        make_broker();

        ON_CALL(*resolver, resolve("admin"))
            .WillByDefault(Return(tests::make_role_config("admin", "default", "arn:role/admin")));
        ON_CALL(*resolver, resolve("audit"))
            .WillByDefault(Return(tests::make_role_config("audit", "default", "arn:role/audit")));
        ON_CALL(*resolver, resolve("other"))
            .WillByDefault(Return(tests::make_role_config("other", "other", "arn:role/other")));
        ON_CALL(*resolver, resolve("default"))
            .WillByDefault(Return(tests::make_role_config("default", "default", "")));

        ON_CALL(*identity, caller_identity(_))
            .WillByDefault(Return(tests::make_principal("alice")));
    }

    void
    make_broker() {
        broker.reset(new broker_t(logging::make_null_logger(), resolver, identity, cache));
    }
};

TEST_F(broker_test_t, initial_state) {
    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
    EXPECT_EQ("", broker->profile());
    EXPECT_FALSE(broker->config());
    EXPECT_FALSE(broker->credentials());
    EXPECT_FALSE(broker->expiration());
}

TEST_F(broker_test_t, select_establishes_session) {
    const auto session = tests::make_session("A", std::chrono::hours(12));

    EXPECT_CALL(*identity, session_token("default", std::chrono::seconds(std::chrono::hours(12)), "", ""))
        .WillOnce(Return(session));

    EXPECT_EQ(session.expiration, broker->select("admin"));
    EXPECT_EQ(broker_t::state_t::session_established, broker->state());
    EXPECT_EQ("admin", broker->profile());
    ASSERT_TRUE(broker->credentials());
    EXPECT_EQ("A", broker->credentials()->access_key_id);
    ASSERT_TRUE(broker->principal());
    EXPECT_EQ("alice", broker->principal()->user_name);
}

TEST_F(broker_test_t, same_source_profile_reuses_session) {
    EXPECT_CALL(*identity, session_token("default", _, _, _))
        .Times(1)
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));

    broker->select("admin");
    broker->select("audit");

    EXPECT_EQ("audit", broker->profile());
    EXPECT_EQ("A", broker->credentials()->access_key_id);
}

TEST_F(broker_test_t, different_source_profile_drops_session) {
    EXPECT_CALL(*identity, session_token("default", _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*identity, session_token("other", _, _, _))
        .WillOnce(Return(tests::make_session("B", std::chrono::hours(12))));

    broker->select("admin");
    broker->select("other");

    EXPECT_EQ("B", broker->credentials()->access_key_id);
}

TEST_F(broker_test_t, unresolvable_profile_keeps_state) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*resolver, resolve("missing"))
        .WillOnce(Throw(error_t(error::profile_not_found, "profile 'missing' not found")));

    broker->select("admin");

    try {
        broker->select("missing");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::resolve_failed), e.code());
    }

    EXPECT_EQ("admin", broker->profile());
    EXPECT_EQ(broker_t::state_t::session_established, broker->state());
}

TEST_F(broker_test_t, mfa_challenge) {
    auto config = tests::make_role_config("admin", "default", "arn:role/admin");
    config.mfa_serial = "arn:aws:iam::123456789012:mfa/alice";

    EXPECT_CALL(*resolver, resolve("admin"))
        .WillOnce(Return(config));
    EXPECT_CALL(*identity, session_token("default", _, config.mfa_serial, ""))
        .WillOnce(Throw(error_t(error::mfa_required, "MFA code required")));

    try {
        broker->select("admin");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::mfa_code_required), e.code());
    }

    EXPECT_EQ(broker_t::state_t::session_mfa_pending, broker->state());
    EXPECT_EQ("admin", broker->profile());

    const auto session = tests::make_session("M", std::chrono::hours(12));

    EXPECT_CALL(*identity, session_token("default", _, config.mfa_serial, "123456"))
        .WillOnce(Return(session));

    EXPECT_EQ(session.expiration, broker->submit_mfa("123456789"));
    EXPECT_EQ(broker_t::state_t::session_established, broker->state());
}

TEST_F(broker_test_t, mfa_failure_reported_as_access_denied) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Throw(error_t(error::access_denied, "MultiFactorAuthentication failed with invalid "
            "MFA one time pass code.")));

    try {
        broker->select("admin");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::mfa_code_required), e.code());
    }

    EXPECT_EQ(broker_t::state_t::session_mfa_pending, broker->state());
}

TEST_F(broker_test_t, provider_failure) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Throw(error_t(error::request_failed, "ExpiredToken: the token has expired")));

    try {
        broker->select("admin");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::provider_failure), e.code());
    }

    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
}

TEST_F(broker_test_t, malformed_mfa_codes) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .Times(0);

    const std::vector<std::string> samples = { "", "123", "12345", "12a456", "abcdef" };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        try {
            broker->submit_mfa(*it);
            FAIL() << "an exception was expected for: " << *it;
        } catch(const std::system_error& e) {
            EXPECT_EQ(make_error_code(error::invalid_mfa_code), e.code()) << *it;
        }
    }
}

TEST_F(broker_test_t, mfa_without_profile) {
    try {
        broker->submit_mfa("123456");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::no_active_profile), e.code());
    }
}

TEST_F(broker_test_t, role_credentials) {
    const auto session = tests::make_session("A", std::chrono::hours(12));

    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(session));

    broker->select("admin");

    role_credentials_t issued;

    issued.access_key_id     = "ROLE";
    issued.secret_access_key = "role-secret";
    issued.session_token     = "role-token";
    issued.expiration        = clock_type::now() + std::chrono::hours(1);

    EXPECT_CALL(*identity, assume_role(_, "arn:role/admin", "alice", "",
                                       std::chrono::seconds(std::chrono::hours(1))))
        .WillOnce(Return(issued));

    const auto before = clock_type::now();
    const auto credentials = broker->role_credentials();

    EXPECT_EQ("ROLE", credentials.access_key_id);
    EXPECT_EQ("role-token", credentials.session_token);
    EXPECT_GT(credentials.expiration, before + std::chrono::minutes(15));
    EXPECT_LE(credentials.expiration, clock_type::now() + std::chrono::minutes(15) + std::chrono::seconds(1));
    EXPECT_EQ(broker_t::state_t::role_credentials_ready, broker->state());
}

TEST_F(broker_test_t, role_credentials_without_profile) {
    try {
        broker->role_credentials();
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::no_active_profile), e.code());
    }
}

TEST_F(broker_test_t, role_credentials_without_role) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*identity, assume_role(_, _, _, _, _))
        .Times(0);

    broker->select("default");

    EXPECT_THROW(broker->role_credentials(), std::system_error);
}

TEST_F(broker_test_t, role_credentials_provider_failure) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*identity, assume_role(_, _, _, _, _))
        .WillOnce(Throw(error_t(error::access_denied, "not allowed")));

    broker->select("admin");

    try {
        broker->role_credentials();
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::provider_failure), e.code());
    }
}

TEST_F(broker_test_t, refresh_forces_new_session) {
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))))
        .WillOnce(Return(tests::make_session("B", std::chrono::hours(12))));

    broker->select("admin");
    broker->refresh();

    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
    EXPECT_FALSE(broker->credentials());

    broker->select("admin");

    EXPECT_EQ("B", broker->credentials()->access_key_id);
}

TEST_F(broker_test_t, refresh_without_profile) {
    EXPECT_NO_THROW(broker->refresh());
    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
}

TEST_F(broker_test_t, session_survives_restart_through_cache) {
    tests::temporary_directory_t directory;

    cache = std::make_shared<session_cache_t>(logging::make_null_logger(), directory.path().string());
    make_broker();

    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));

    broker->select("admin");

    make_broker();
    broker->select("admin");

    EXPECT_EQ("A", broker->credentials()->access_key_id);
}

TEST_F(broker_test_t, mfa_code_bypasses_cache) {
    tests::temporary_directory_t directory;

    cache = std::make_shared<session_cache_t>(logging::make_null_logger(), directory.path().string());
    cache->write("default", tests::make_session("CACHED", std::chrono::hours(12)));
    make_broker();

    broker->select("admin");

    EXPECT_EQ("CACHED", broker->credentials()->access_key_id);

    EXPECT_CALL(*identity, session_token(_, _, _, "654321"))
        .WillOnce(Return(tests::make_session("FRESH", std::chrono::hours(12))));

    broker->submit_mfa("654321");

    EXPECT_EQ("FRESH", broker->credentials()->access_key_id);
    EXPECT_EQ("FRESH", cache->read("default")->access_key_id);
}

TEST_F(broker_test_t, rejected_mfa_code_keeps_valid_session) {
    EXPECT_CALL(*identity, session_token(_, _, _, ""))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*identity, session_token(_, _, _, "000000"))
        .WillOnce(Throw(error_t(error::access_denied, "MultiFactorAuthentication failed with invalid "
            "MFA one time pass code.")));

    broker->select("admin");

    try {
        broker->submit_mfa("000000");
        FAIL() << "an exception was expected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(make_error_code(error::mfa_code_required), e.code());
    }

    ASSERT_TRUE(broker->credentials());
    EXPECT_EQ("A", broker->credentials()->access_key_id);
    EXPECT_EQ(broker_t::state_t::session_established, broker->state());
}

TEST_F(broker_test_t, role_credentials_use_profile_duration) {
    auto config = tests::make_role_config("short", "default", "arn:role/short");
    config.role_duration = std::chrono::seconds(900);

    EXPECT_CALL(*resolver, resolve("short"))
        .WillOnce(Return(config));
    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));
    EXPECT_CALL(*identity, assume_role(_, "arn:role/short", "alice", "", std::chrono::seconds(900)))
        .WillOnce(Return(role_credentials_t()));

    broker->select("short");
    broker->role_credentials();
}

TEST_F(broker_test_t, unusable_cache_directory) {
    tests::temporary_directory_t directory;

    fs::create_symlink(directory.path() / "loop2", directory.path() / "loop1");
    fs::create_symlink(directory.path() / "loop1", directory.path() / "loop2");

    cache = std::make_shared<session_cache_t>(logging::make_null_logger(),
        (directory.path() / "loop1" / "cache").string());
    make_broker();

    EXPECT_CALL(*identity, session_token(_, _, _, _))
        .WillOnce(Return(tests::make_session("A", std::chrono::hours(12))));

    broker->select("admin");

    EXPECT_EQ(broker_t::state_t::session_established, broker->state());
    EXPECT_EQ("A", broker->credentials()->access_key_id);
    ASSERT_TRUE(broker->principal());

    EXPECT_NO_THROW(broker->refresh());
    EXPECT_EQ(broker_t::state_t::no_session, broker->state());
}

TEST(broker, state_names) {
    EXPECT_EQ("no_session", to_string(broker_t::state_t::no_session));
    EXPECT_EQ("session_established", to_string(broker_t::state_t::session_established));
    EXPECT_EQ("session_mfa_pending", to_string(broker_t::state_t::session_mfa_pending));
    EXPECT_EQ("role_credentials_ready", to_string(broker_t::state_t::role_credentials_ready));
}

} // namespace
} // namespace runas
