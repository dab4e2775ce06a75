#ifndef RUNAS_TESTS_UNIT_MOCKS_HPP
#define RUNAS_TESTS_UNIT_MOCKS_HPP

#include <gmock/gmock.h>

#include <runas/api/identity.hpp>
#include <runas/api/platform.hpp>
#include <runas/api/policy.hpp>
#include <runas/api/resolver.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

namespace runas {
namespace mock {

class identity_t:
    public api::identity_t
{
public:
    MOCK_METHOD1(caller_identity, principal_t(const std::string&));

    MOCK_METHOD4(session_token, session_credentials_t(const std::string&,
                                                      std::chrono::seconds,
                                                      const std::string&,
                                                      const std::string&));

    MOCK_METHOD5(assume_role, role_credentials_t(const session_credentials_t&,
                                                 const std::string&,
                                                 const std::string&,
                                                 const std::string&,
                                                 std::chrono::seconds));
};

class resolver_t:
    public api::resolver_t
{
public:
    MOCK_METHOD1(resolve, role_config_t(const std::string&));
    MOCK_METHOD1(profiles, std::vector<std::string>(bool));
};

class policy_t:
    public api::policy_t
{
public:
    MOCK_METHOD2(documents, document_list_t(const std::string&, const principal_t&));
};

class platform_t:
    public api::platform_t
{
public:
    MOCK_METHOD0(elevate, void());
    MOCK_METHOD0(loopback, std::string());
    MOCK_METHOD2(configure_address, void(const std::string&, const std::string&));
    MOCK_METHOD2(remove_address, void(const std::string&, const std::string&));
    MOCK_METHOD0(drop_privileges, void());
    MOCK_CONST_METHOD0(privileged, bool());
};

} // namespace mock

namespace tests {

// Scratch directory which is removed with everything inside once the test is over.
class temporary_directory_t {
    boost::filesystem::path m_path;

public:
    temporary_directory_t():
        m_path(boost::filesystem::temp_directory_path() /
               boost::filesystem::unique_path("runas-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(m_path);
    }

   ~temporary_directory_t() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(m_path, ec);
    }

    auto
    path() const -> const boost::filesystem::path& {
        return m_path;
    }
};

inline
auto
make_role_config(const std::string& profile, const std::string& source, const std::string& role)
    -> role_config_t
{
    role_config_t config;

    config.profile          = profile;
    config.source_profile   = source;
    config.role_arn         = role;
    config.session_duration = std::chrono::hours(12);
    config.role_duration    = std::chrono::hours(1);

    return config;
}

inline
auto
make_session(const std::string& key, std::chrono::seconds lifetime) -> session_credentials_t {
    session_credentials_t credentials;

    credentials.access_key_id     = key;
    credentials.secret_access_key = "secret-" + key;
    credentials.session_token     = "token-" + key;
    credentials.expiration        = std::chrono::time_point_cast<std::chrono::seconds>(
        clock_type::now() + lifetime
    );

    return credentials;
}

inline
auto
make_principal(const std::string& name) -> principal_t {
    principal_t principal;

    principal.account   = "123456789012";
    principal.user_name = name;
    principal.arn       = "arn:aws:iam::123456789012:user/" + name;

    return principal;
}

} // namespace tests
} // namespace runas

#endif
