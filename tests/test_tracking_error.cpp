#include <gtest/gtest.h>
#include "../core/TrackingError.hpp"

using namespace geoshare;

TEST(TrackingErrorTest, OnlyPermissionLossEndsSession) {
    EXPECT_TRUE(isSessionFatal(TrackingError::PermissionDenied));
    EXPECT_FALSE(isSessionFatal(TrackingError::None));
    EXPECT_FALSE(isSessionFatal(TrackingError::ProviderUnavailable));
    EXPECT_FALSE(isSessionFatal(TrackingError::SampleTimeout));
    EXPECT_FALSE(isSessionFatal(TrackingError::PublishFailure));
    EXPECT_FALSE(isSessionFatal(TrackingError::AllStrategiesExhausted));
}

TEST(TrackingErrorTest, ResultReportsCategory) {
    auto result = TrackingResult::failure(TrackingError::SampleTimeout, "late");
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(trackingErrorToString(result.error), "sample_timeout");
    EXPECT_TRUE(TrackingResult::success().ok());
}
