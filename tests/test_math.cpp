#include "termtoast/math.hpp"
#include <gtest/gtest.h>

using namespace termtoast;

TEST(EasingTest, EndpointsAreFixed) {
    EXPECT_FLOAT_EQ(ease_in_quad(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(ease_in_quad(1.0f), 1.0f);
    EXPECT_FLOAT_EQ(ease_out_quad(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(ease_out_quad(1.0f), 1.0f);
}

TEST(EasingTest, MonotonicAndSymmetric) {
    float prev_in = 0.0f;
    float prev_out = 0.0f;
    for (int i = 0; i <= 20; ++i) {
        float t = static_cast<float>(i) / 20.0f;
        EXPECT_GE(ease_in_quad(t), prev_in);
        EXPECT_GE(ease_out_quad(t), prev_out);
        EXPECT_NEAR(ease_out_quad(t), 1.0f - ease_in_quad(1.0f - t), 1e-6f);
        prev_in = ease_in_quad(t);
        prev_out = ease_out_quad(t);
    }
}

TEST(LerpTest, DoesNotClamp) {
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 0.5f), 5.0f);
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 2.0f), 20.0f);
    EXPECT_FLOAT_EQ(lerp(10.0f, 0.0f, -1.0f), 20.0f);
}

TEST(InterpolateColorTest, BlackToWhiteEndpoints) {
    Color black(Color::Type::Black);
    Color white(Color::Type::White);
    EXPECT_EQ(interpolate_color(black, white, 0.0f, true), Color::rgb(0, 0, 0));
    EXPECT_EQ(interpolate_color(black, white, 1.0f, true), Color::rgb(255, 255, 255));
}

TEST(InterpolateColorTest, FadeInIsQuickerThanFadeOut) {
    Color black(Color::Type::Black);
    Color white(Color::Type::White);
    EXPECT_EQ(interpolate_color(black, white, 0.5f, true), Color::rgb(191, 191, 191));
    EXPECT_EQ(interpolate_color(black, white, 0.5f, false), Color::rgb(64, 64, 64));
}

TEST(InterpolateColorTest, RgbEndpointsAreExact) {
    Color from = Color::rgb(100, 50, 200);
    Color to = Color::rgb(200, 150, 100);
    EXPECT_EQ(interpolate_color(from, to, 0.0f, true), from);
    EXPECT_EQ(interpolate_color(from, to, 1.0f, true), to);
    EXPECT_EQ(interpolate_color(from, to, 0.0f, false), from);
    EXPECT_EQ(interpolate_color(from, to, 1.0f, false), to);
}

TEST(InterpolateColorTest, ChannelsStayBetweenEndpoints) {
    Color from = Color::rgb(100, 100, 100);
    Color to = Color::rgb(200, 200, 200);
    for (int i = 0; i <= 10; ++i) {
        auto result = interpolate_color(from, to, static_cast<float>(i) / 10.0f, i % 2 == 0);
        ASSERT_TRUE(result.has_value());
        ASSERT_EQ(result->type, Color::Type::Rgb);
        EXPECT_GE(result->r, 100);
        EXPECT_LE(result->r, 200);
    }
}

TEST(InterpolateColorTest, ProgressOutsideRangeIsClamped) {
    Color from = Color::rgb(0, 0, 0);
    Color to = Color::rgb(10, 20, 30);
    EXPECT_EQ(interpolate_color(from, to, 1.5f, true), to);
    EXPECT_EQ(interpolate_color(from, to, -0.5f, true), from);
}

TEST(InterpolateColorTest, IndexedColorsSnapAtHalfway) {
    Color from = Color::indexed(1);
    Color to = Color::indexed(2);
    // ease_out(0.2) = 0.36, ease_out(0.8) = 0.96
    EXPECT_EQ(interpolate_color(from, to, 0.2f, true), from);
    EXPECT_EQ(interpolate_color(from, to, 0.8f, true), to);
    EXPECT_EQ(interpolate_color(from, to, 0.0f, true), from);
    EXPECT_EQ(interpolate_color(from, to, 1.0f, true), to);
}

TEST(InterpolateColorTest, MixedRepresentationsSnap) {
    Color reset(Color::Type::Reset);
    Color white(Color::Type::White);
    EXPECT_EQ(interpolate_color(reset, white, 0.0f, true), reset);
    EXPECT_EQ(interpolate_color(reset, white, 1.0f, true), white);
    EXPECT_EQ(interpolate_color(std::nullopt, white, 1.0f, false), white);
    EXPECT_FALSE(interpolate_color(std::nullopt, std::nullopt, 0.5f, true).has_value());
}

TEST(ColorToRgbTest, NamedAndPaletteColors) {
    EXPECT_EQ(color_to_rgb(Color::Type::DarkGray), (Rgb{128, 128, 128}));
    EXPECT_EQ(color_to_rgb(Color::Type::LightCyan), (Rgb{0, 255, 255}));
    EXPECT_EQ(color_to_rgb(Color::rgb(1, 2, 3)), (Rgb{1, 2, 3}));
    EXPECT_FALSE(color_to_rgb(Color::indexed(42)).has_value());
    EXPECT_FALSE(color_to_rgb(Color::Type::Reset).has_value());
}
