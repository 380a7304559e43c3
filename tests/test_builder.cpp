#include "termtoast/notification.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace termtoast;

namespace {

NotificationError::Kind build_error_kind(const NotificationBuilder& builder) {
    try {
        builder.build();
    }
    catch (const NotificationError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "build() did not throw";
    return NotificationError::Kind::InvalidConfig;
}

} // anonymous namespace

TEST(BuilderTest, Defaults) {
    Notification n = NotificationBuilder("hello").build();
    EXPECT_EQ(n.content(), "hello");
    EXPECT_FALSE(n.title().has_value());
    EXPECT_EQ(n.level(), Level::Info);
    EXPECT_EQ(n.anchor(), Anchor::BottomRight);
    EXPECT_EQ(n.animation(), Animation::Slide);
    EXPECT_EQ(n.slide_direction(), SlideDirection::Default);
    EXPECT_EQ(n.border_type(), BorderType::Rounded);
    EXPECT_EQ(n.padding(), Padding::horizontal(1));
    EXPECT_EQ(n.margin(), 0);
    EXPECT_FALSE(n.fade_effect());
    EXPECT_EQ(n.max_width(), SizeConstraint::percentage(0.4f));
    EXPECT_EQ(n.max_height(), SizeConstraint::percentage(0.2f));
    EXPECT_EQ(n.slide_in_timing(), Timing::automatic());
    EXPECT_EQ(n.dwell_timing(), Timing::automatic());
    EXPECT_EQ(n.slide_out_timing(), Timing::automatic());
    EXPECT_EQ(n.auto_dismiss(), AutoDismiss::after(Duration(4000)));
}

TEST(BuilderTest, SettersAreApplied) {
    Notification n = NotificationBuilder("body")
        .title("Title")
        .level(Level::Trace)
        .anchor(Anchor::TopCenter)
        .slide_direction(SlideDirection::FromLeft)
        .entry_position(Position{1, 2})
        .exit_position(Position{3, 4})
        .fade(true)
        .border_type(BorderType::Thick)
        .margin(2)
        .timing(Timing::fixed(Duration(10)), Timing::fixed(Duration(20)), Timing::automatic())
        .auto_dismiss(AutoDismiss::never())
        .build();

    EXPECT_EQ(n.title(), "Title");
    EXPECT_EQ(n.level(), Level::Trace);
    EXPECT_EQ(n.anchor(), Anchor::TopCenter);
    EXPECT_EQ(n.slide_direction(), SlideDirection::FromLeft);
    EXPECT_EQ(n.custom_entry_position(), (Position{1, 2}));
    EXPECT_EQ(n.custom_exit_position(), (Position{3, 4}));
    EXPECT_TRUE(n.fade_effect());
    EXPECT_EQ(n.border_type(), BorderType::Thick);
    EXPECT_EQ(n.margin(), 2);
    EXPECT_EQ(n.slide_in_timing(), Timing::fixed(Duration(10)));
    EXPECT_EQ(n.dwell_timing(), Timing::fixed(Duration(20)));
    EXPECT_TRUE(n.auto_dismiss().is_never());
}

TEST(BuilderTest, NoLevelAndNoBorder) {
    Notification n = NotificationBuilder("x").no_level().no_border().build();
    EXPECT_FALSE(n.level().has_value());
    EXPECT_FALSE(n.border_type().has_value());
}

TEST(BuilderTest, TitleAloneIsEnough) {
    Notification n = NotificationBuilder("").title("Only a title").build();
    EXPECT_EQ(n.content(), "");
}

TEST(BuilderTest, EmptyContentAndTitleIsInvalid) {
    EXPECT_EQ(build_error_kind(NotificationBuilder("")), NotificationError::Kind::InvalidConfig);
    EXPECT_EQ(build_error_kind(NotificationBuilder("").title("")), NotificationError::Kind::InvalidConfig);
}

TEST(BuilderTest, PercentageOutOfRangeIsInvalid) {
    NotificationBuilder zero("x");
    zero.max_size(SizeConstraint::percentage(0.0f), SizeConstraint::percentage(0.5f));
    EXPECT_EQ(build_error_kind(zero), NotificationError::Kind::InvalidConfig);

    NotificationBuilder over("x");
    over.max_size(SizeConstraint::percentage(0.5f), SizeConstraint::percentage(1.5f));
    EXPECT_EQ(build_error_kind(over), NotificationError::Kind::InvalidConfig);

    NotificationBuilder full("x");
    full.max_size(SizeConstraint::percentage(1.0f), SizeConstraint::percentage(1.0f));
    EXPECT_NO_THROW(full.build());
}

TEST(BuilderTest, ZeroAbsoluteSizeIsInvalid) {
    NotificationBuilder builder("x");
    builder.max_size(SizeConstraint::absolute(0), SizeConstraint::absolute(10));
    EXPECT_EQ(build_error_kind(builder), NotificationError::Kind::InvalidConfig);
}

TEST(BuilderTest, FadeFlagNeedsSlide) {
    NotificationBuilder builder("x");
    builder.animation(Animation::ExpandCollapse).fade(true);
    EXPECT_EQ(build_error_kind(builder), NotificationError::Kind::InvalidConfig);
}

TEST(BuilderTest, CustomPositionsNeedSlide) {
    NotificationBuilder builder("x");
    builder.animation(Animation::Fade).entry_position(Position{0, 0});
    EXPECT_EQ(build_error_kind(builder), NotificationError::Kind::InvalidConfig);
}

TEST(BuilderTest, ContentTooLargeReportsSizes) {
    std::string content(Notification::MAX_CONTENT_BYTES + 1, 'a');
    try {
        NotificationBuilder(content).build();
        FAIL() << "expected ContentTooLarge";
    }
    catch (const NotificationError& e) {
        EXPECT_EQ(e.kind(), NotificationError::Kind::ContentTooLarge);
        EXPECT_EQ(e.actual(), Notification::MAX_CONTENT_BYTES + 1);
        EXPECT_EQ(e.limit(), Notification::MAX_CONTENT_BYTES);
    }
}

TEST(BuilderTest, ContentAtLimitIsAccepted) {
    std::string content(Notification::MAX_CONTENT_BYTES, 'a');
    EXPECT_NO_THROW(NotificationBuilder(content).build());
}

TEST(BuilderTest, ErrorMessageCarriesReason) {
    try {
        NotificationBuilder("").build();
        FAIL() << "expected InvalidConfig";
    }
    catch (const NotificationError& e) {
        EXPECT_FALSE(e.reason().empty());
        EXPECT_NE(std::string(e.what()).find(e.reason()), std::string::npos);
    }
}
