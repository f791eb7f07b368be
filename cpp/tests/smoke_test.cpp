#include <cstring>

#include <gtest/gtest.h>

#include "touchseal/core/errors.hpp"

TEST(Status, DefaultIsOk) {
    touchseal::core::Status s{};
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(touchseal::core::is_ok(s));
}

TEST(Status, MakeStatusKeepsKindAndCause) {
    const touchseal::core::Status s = touchseal::core::make_status(
        touchseal::core::StatusDomain::Oracle, touchseal::core::StatusCode::Timeout, 60000);
    EXPECT_FALSE(touchseal::core::is_ok(s));
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Oracle);
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Timeout);
    EXPECT_EQ(s.aux, 60000u);
}

TEST(Status, NamesForErrorKinds) {
    EXPECT_STREQ(touchseal::core::status_domain_name(touchseal::core::StatusDomain::Input), "InputError");
    EXPECT_STREQ(touchseal::core::status_domain_name(touchseal::core::StatusDomain::Credential), "CredentialError");
    EXPECT_STREQ(touchseal::core::status_domain_name(touchseal::core::StatusDomain::Oracle), "OracleError");
    EXPECT_STREQ(touchseal::core::status_domain_name(touchseal::core::StatusDomain::Crypto), "CryptoError");
    EXPECT_STREQ(touchseal::core::status_code_name(touchseal::core::StatusCode::UserDeclined), "UserDeclined");
    EXPECT_STREQ(touchseal::core::status_code_name(touchseal::core::StatusCode::NotHardwareBacked), "NotHardwareBacked");
}
