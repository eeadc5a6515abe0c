#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "src/api/errors.hpp"

using namespace documentstack::api;

TEST(StatusPredicates, NamedCategories) {
    EXPECT_TRUE(is_validation_error(400));
    EXPECT_TRUE(is_authentication_error(401));
    EXPECT_TRUE(is_forbidden_error(403));
    EXPECT_TRUE(is_not_found_error(404));
    EXPECT_TRUE(is_rate_limit_error(429));
    EXPECT_TRUE(is_server_error(500));
    EXPECT_TRUE(is_server_error(503));
    EXPECT_TRUE(is_server_error(599));
}

TEST(StatusPredicates, UnnamedCodesMatchNothing) {
    for (const long code : {402L, 409L, 418L, 422L, 499L}) {
        EXPECT_FALSE(is_validation_error(code)) << code;
        EXPECT_FALSE(is_authentication_error(code)) << code;
        EXPECT_FALSE(is_forbidden_error(code)) << code;
        EXPECT_FALSE(is_not_found_error(code)) << code;
        EXPECT_FALSE(is_rate_limit_error(code)) << code;
        EXPECT_FALSE(is_server_error(code)) << code;
    }
}

TEST(DocumentStackError, KindFollowsVariant) {
    EXPECT_EQ(DocumentStackError(ConfigurationError{}).kind(), ErrorKind::CONFIGURATION);
    EXPECT_EQ(DocumentStackError(ValidationError{}).kind(), ErrorKind::VALIDATION);
    EXPECT_EQ(DocumentStackError(NetworkError{}).kind(), ErrorKind::NETWORK);
    EXPECT_EQ(DocumentStackError(TimeoutError{}).kind(), ErrorKind::TIMEOUT);
    EXPECT_EQ(DocumentStackError(ApiError{}).kind(), ErrorKind::API);
    EXPECT_EQ(DocumentStackError(RateLimitError{}).kind(), ErrorKind::RATE_LIMIT);
}

TEST(DocumentStackError, Messages) {
    EXPECT_STREQ(DocumentStackError(ApiError{.status_code_ = 403, .error_code_ = "Forbidden", .message_ = "no access"}).what(), "Forbidden: no access");
    EXPECT_STREQ(DocumentStackError(TimeoutError{.timeout_s_ = 30}).what(), "request timed out after 30 seconds");
    EXPECT_STREQ(DocumentStackError(NetworkError{.message_ = "request failed", .cause_ = "refused"}).what(), "request failed: refused");
    EXPECT_STREQ(DocumentStackError(NetworkError{.message_ = "request failed"}).what(), "request failed");
    EXPECT_STREQ(DocumentStackError(ConfigurationError{.message_ = "API key is required"}).what(), "API key is required");
}

TEST(DocumentStackError, NonApiVariantsHaveNoStatus) {
    const DocumentStackError timeout(TimeoutError{.timeout_s_ = 3});
    EXPECT_EQ(timeout.api_error(), nullptr);
    EXPECT_FALSE(timeout.status_code().has_value());
    EXPECT_FALSE(timeout.retry_after().has_value());
    EXPECT_FALSE(timeout.is_server_error());
    EXPECT_FALSE(timeout.is_validation_error());
}

TEST(DocumentStackError, RateLimitCarriesApiError) {
    const DocumentStackError err(RateLimitError{.api_ = ApiError{.status_code_ = 429, .error_code_ = "RateLimited", .message_ = "wait"}, .retry_after_s_ = 12});
    ASSERT_NE(err.api_error(), nullptr);
    EXPECT_EQ(err.api_error()->error_code_, "RateLimited");
    EXPECT_EQ(err.status_code(), 429L);
    EXPECT_EQ(err.retry_after(), 12);
    EXPECT_TRUE(err.is_rate_limit_error());
}

TEST(ErrorFactories, ProduceApiShapedErrors) {
    const auto validation = make_validation_error("bad field", Value(Object{{"field", "name"}}));
    EXPECT_EQ(validation.kind(), ErrorKind::VALIDATION);
    EXPECT_EQ(validation.status_code(), 400L);
    EXPECT_EQ(validation.api_error()->error_code_, "Bad Request");
    ASSERT_TRUE(validation.api_error()->details_.has_value());

    const auto auth = make_authentication_error("bad key");
    EXPECT_TRUE(auth.is_authentication_error());
    EXPECT_STREQ(auth.what(), "Unauthorized: bad key");

    const auto forbidden = make_forbidden_error("nope");
    EXPECT_TRUE(forbidden.is_forbidden_error());
    EXPECT_EQ(forbidden.api_error()->error_code_, "Forbidden");

    const auto missing = make_not_found_error("no template");
    EXPECT_TRUE(missing.is_not_found_error());
    EXPECT_EQ(missing.kind(), ErrorKind::API);
    EXPECT_STREQ(missing.what(), "Not Found: no template");
}

TEST(ErrorKind, Names) {
    EXPECT_STREQ(to_string(ErrorKind::RATE_LIMIT), "rate_limit");
    EXPECT_STREQ(to_string(ErrorKind::NETWORK), "network");
}
