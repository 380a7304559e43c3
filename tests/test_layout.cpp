#include "termtoast/layout.hpp"
#include <gtest/gtest.h>

using namespace termtoast;

namespace {

const Anchor ALL_ANCHORS[] = {
    Anchor::TopLeft, Anchor::TopCenter, Anchor::TopRight,
    Anchor::MiddleLeft, Anchor::MiddleCenter, Anchor::MiddleRight,
    Anchor::BottomLeft, Anchor::BottomCenter, Anchor::BottomRight
};

} // anonymous namespace

TEST(AnchorPositionTest, NineAnchorsInFullFrame) {
    Rect frame{0, 0, 100, 50};
    EXPECT_EQ(calculate_anchor_position(Anchor::TopLeft, frame), (Position{0, 0}));
    EXPECT_EQ(calculate_anchor_position(Anchor::TopCenter, frame), (Position{50, 0}));
    EXPECT_EQ(calculate_anchor_position(Anchor::TopRight, frame), (Position{99, 0}));
    EXPECT_EQ(calculate_anchor_position(Anchor::MiddleLeft, frame), (Position{0, 25}));
    EXPECT_EQ(calculate_anchor_position(Anchor::MiddleCenter, frame), (Position{50, 25}));
    EXPECT_EQ(calculate_anchor_position(Anchor::MiddleRight, frame), (Position{99, 25}));
    EXPECT_EQ(calculate_anchor_position(Anchor::BottomLeft, frame), (Position{0, 49}));
    EXPECT_EQ(calculate_anchor_position(Anchor::BottomCenter, frame), (Position{50, 49}));
    EXPECT_EQ(calculate_anchor_position(Anchor::BottomRight, frame), (Position{99, 49}));
}

TEST(AnchorPositionTest, OffsetFrame) {
    Rect frame{10, 5, 21, 11};
    EXPECT_EQ(calculate_anchor_position(Anchor::TopLeft, frame), (Position{10, 5}));
    EXPECT_EQ(calculate_anchor_position(Anchor::MiddleCenter, frame), (Position{20, 10}));
    EXPECT_EQ(calculate_anchor_position(Anchor::BottomRight, frame), (Position{30, 15}));
}

TEST(AnchorPositionTest, AlwaysInsideFrame) {
    Rect frames[] = {{0, 0, 100, 50}, {7, 3, 1, 1}, {20, 30, 5, 2}};
    for (const Rect& frame : frames) {
        for (Anchor anchor : ALL_ANCHORS) {
            Position pos = calculate_anchor_position(anchor, frame);
            EXPECT_GE(pos.x, frame.x) << to_string(anchor);
            EXPECT_LT(pos.x, frame.right()) << to_string(anchor);
            EXPECT_GE(pos.y, frame.y) << to_string(anchor);
            EXPECT_LT(pos.y, frame.bottom()) << to_string(anchor);
            EXPECT_EQ(pos, calculate_anchor_position(anchor, frame));
        }
    }
}

TEST(SlideDirectionTest, DefaultResolvesFromAnchor) {
    auto resolve = [](Anchor a) { return resolve_slide_direction(SlideDirection::Default, a); };
    EXPECT_EQ(resolve(Anchor::TopLeft), SlideDirection::FromTopLeft);
    EXPECT_EQ(resolve(Anchor::TopCenter), SlideDirection::FromTop);
    EXPECT_EQ(resolve(Anchor::TopRight), SlideDirection::FromTopRight);
    EXPECT_EQ(resolve(Anchor::MiddleLeft), SlideDirection::FromLeft);
    EXPECT_EQ(resolve(Anchor::MiddleCenter), SlideDirection::FromLeft);
    EXPECT_EQ(resolve(Anchor::MiddleRight), SlideDirection::FromRight);
    EXPECT_EQ(resolve(Anchor::BottomLeft), SlideDirection::FromBottomLeft);
    EXPECT_EQ(resolve(Anchor::BottomCenter), SlideDirection::FromBottom);
    EXPECT_EQ(resolve(Anchor::BottomRight), SlideDirection::FromBottomRight);
}

TEST(SlideDirectionTest, ExplicitDirectionIsKept) {
    for (Anchor anchor : ALL_ANCHORS) {
        EXPECT_EQ(resolve_slide_direction(SlideDirection::FromTop, anchor), SlideDirection::FromTop);
        EXPECT_EQ(resolve_slide_direction(SlideDirection::FromBottomLeft, anchor),
                  SlideDirection::FromBottomLeft);
    }
}

TEST(OffscreenPositionTest, StraightDirections) {
    Rect full{40, 20, 20, 10};
    Rect frame{0, 0, 100, 50};
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromLeft, full, frame), (PointF{-21.0f, 20.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromRight, full, frame), (PointF{101.0f, 20.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromTop, full, frame), (PointF{40.0f, -11.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromBottom, full, frame), (PointF{40.0f, 51.0f}));
}

TEST(OffscreenPositionTest, DiagonalsMoveOnBothAxes) {
    Rect full{40, 20, 20, 10};
    Rect frame{0, 0, 100, 50};
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromTopLeft, full, frame), (PointF{-21.0f, -11.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromTopRight, full, frame), (PointF{101.0f, -11.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromBottomLeft, full, frame), (PointF{-21.0f, 51.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromBottomRight, full, frame), (PointF{101.0f, 51.0f}));
}

TEST(OffscreenPositionTest, DefaultStaysInPlace) {
    Rect full{40, 20, 20, 10};
    EXPECT_EQ(slide_offscreen_position(SlideDirection::Default, full, Rect{0, 0, 100, 50}),
              (PointF{40.0f, 20.0f}));
}

TEST(OffscreenPositionTest, OffsetFrameEdges) {
    Rect full{20, 15, 8, 4};
    Rect frame{10, 10, 30, 20};
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromLeft, full, frame), (PointF{1.0f, 15.0f}));
    EXPECT_EQ(slide_offscreen_position(SlideDirection::FromBottom, full, frame), (PointF{20.0f, 31.0f}));
}

TEST(CalculateRectTest, BottomRightWithMargin) {
    Rect frame{0, 0, 100, 50};
    Position anchor_pos = calculate_anchor_position(Anchor::BottomRight, frame);
    EXPECT_EQ(calculate_rect(Anchor::BottomRight, anchor_pos, 20, 10, frame, 2), (Rect{78, 38, 20, 10}));
}

TEST(CalculateRectTest, TopLeftWithMargin) {
    Rect frame{0, 0, 100, 50};
    EXPECT_EQ(calculate_rect(Anchor::TopLeft, Position{0, 0}, 20, 10, frame, 1), (Rect{1, 1, 20, 10}));
}

TEST(CalculateRectTest, MarginIgnoredOnCentredAxis) {
    Rect frame{0, 0, 100, 50};
    EXPECT_EQ(calculate_rect(Anchor::TopCenter, Position{50, 0}, 20, 10, frame, 3), (Rect{40, 3, 20, 10}));
    EXPECT_EQ(calculate_rect(Anchor::MiddleCenter, Position{50, 25}, 20, 10, frame, 5), (Rect{40, 20, 20, 10}));
    EXPECT_EQ(calculate_rect(Anchor::MiddleRight, Position{99, 25}, 20, 10, frame, 4), (Rect{76, 20, 20, 10}));
}

TEST(CalculateRectTest, ClampedInsideFrame) {
    Rect frame{0, 0, 30, 20};
    EXPECT_EQ(calculate_rect(Anchor::TopLeft, Position{25, 10}, 20, 5, frame, 0), (Rect{10, 10, 20, 5}));
}

TEST(CalculateRectTest, OversizeIsShrunkToFrame) {
    Rect frame{5, 5, 40, 10};
    Rect rect = calculate_rect(Anchor::BottomRight, Position{44, 14}, 200, 50, frame, 0);
    EXPECT_EQ(rect, (Rect{5, 5, 40, 10}));
}
