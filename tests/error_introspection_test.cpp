#include <gtest/gtest.h>
#include "chipledger/errors.hpp"

using namespace chipledger;

// =============================================================================
// Status Code Mapping Tests
// =============================================================================

TEST(ErrorIntrospectionTest, InvalidRecordError_ShouldMapToInvalidArgument) {
    InvalidRecordError error("negative buy-in");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(error.is_invalid_argument());
    EXPECT_FALSE(error.is_retryable());
}

TEST(ErrorIntrospectionTest, UnbalancedLedgerError_ShouldMapToFailedPrecondition) {
    UnbalancedLedgerError error("off by 5.00");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_TRUE(error.is_precondition_failed());
    EXPECT_FALSE(error.is_retryable());
}

TEST(ErrorIntrospectionTest, ConcurrentSettlementError_ShouldBeRetryableAborted) {
    ConcurrentSettlementError error("claim failed");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::ABORTED);
    EXPECT_TRUE(error.is_retryable());
}

TEST(ErrorIntrospectionTest, StorageError_ShouldBeRetryableUnavailable) {
    StorageError error("database down");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_TRUE(error.is_retryable());
}

TEST(ErrorIntrospectionTest, NotFoundError_ShouldReturnTrueForIsNotFound) {
    NotFoundError error("no settlement");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_TRUE(error.is_not_found());
}

TEST(ErrorIntrospectionTest, PermissionDeniedError_ShouldMapToPermissionDenied) {
    PermissionDeniedError error("not a participant");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_FALSE(error.is_not_found());
}

// =============================================================================
// gRPC Status Conversion Tests
// =============================================================================

TEST(ErrorIntrospectionTest, ToGrpcStatus_ShouldCarryCodeAndMessage) {
    UnbalancedLedgerError error("check buy-ins and cash-outs");
    auto status = error.to_grpc_status();
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(status.error_message(), "check buy-ins and cash-outs");
}

// =============================================================================
// Base Class Default Behavior Tests
// =============================================================================

TEST(ErrorIntrospectionTest, SettlementError_ShouldHaveDefaultFalseForAllIntrospectionMethods) {
    SettlementError error("generic error");
    EXPECT_EQ(error.status_code(), grpc::StatusCode::UNKNOWN);
    EXPECT_FALSE(error.is_invalid_argument());
    EXPECT_FALSE(error.is_precondition_failed());
    EXPECT_FALSE(error.is_not_found());
    EXPECT_FALSE(error.is_retryable());
}
