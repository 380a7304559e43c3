#include "termtoast/animation_handler.hpp"
#include <gtest/gtest.h>

using namespace termtoast;

namespace {

const Rect FRAME{0, 0, 100, 50};
const Rect SOURCE{10, 20, 33, 13};

} // anonymous namespace

TEST(ExpandCollapseTest, ExpandStartsAtCentredMinimum) {
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Expanding, 0.0f), (Rect{25, 25, 3, 3}));
}

TEST(ExpandCollapseTest, ExpandHalfway) {
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Expanding, 0.5f), (Rect{18, 23, 18, 8}));
}

TEST(ExpandCollapseTest, ExpandEndsAtFullRect) {
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Expanding, 1.0f), SOURCE);
}

TEST(ExpandCollapseTest, CollapseIsTheInverse) {
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Collapsing, 0.0f), SOURCE);
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Collapsing, 1.0f), (Rect{25, 25, 3, 3}));
}

TEST(ExpandCollapseTest, CentreStaysFixed) {
    for (int i = 0; i <= 10; ++i) {
        Rect rect = expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Expanding, i / 10.0f);
        float cx = rect.x + rect.width / 2.0f;
        float cy = rect.y + rect.height / 2.0f;
        EXPECT_NEAR(cx, 26.5f, 1.0f);
        EXPECT_NEAR(cy, 26.5f, 1.0f);
    }
}

TEST(ExpandCollapseTest, OtherPhasesReturnFullRect) {
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Dwelling, 0.5f), SOURCE);
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::FadingIn, 0.5f), SOURCE);
    EXPECT_EQ(expand_calculate_rect(SOURCE, FRAME, AnimationPhase::Pending, 0.0f), SOURCE);
}

TEST(ExpandCollapseTest, ResultIsClippedToFrame) {
    Rect small_frame{0, 0, 30, 30};
    Rect rect = expand_calculate_rect(SOURCE, small_frame, AnimationPhase::Expanding, 1.0f);
    EXPECT_EQ(rect, (Rect{10, 20, 20, 10}));
}

TEST(ExpandCollapseTest, HandlerUsesIdentityColours) {
    const IAnimationHandler& handler = get_animation_handler(Animation::ExpandCollapse);
    std::optional<Color> base = Color(Color::Type::Cyan);
    EXPECT_EQ(handler.interpolate_frame_foreground(base, AnimationPhase::Expanding, 0.5f), base);
    EXPECT_EQ(handler.interpolate_content_foreground(base, AnimationPhase::Collapsing, 0.5f), base);

    EXPECT_EQ(get_animation_handler(Animation::Fade).interpolate_frame_foreground(
                  std::nullopt, AnimationPhase::Dwelling, 1.0f),
              std::nullopt);
}
