#include <gtest/gtest.h>
#include <glm/glm.hpp>

import Graphics;

using namespace Graphics;

TEST(RectFragment, OutlineWinsInsideRadiusBand)
{
    auto color = EvaluateRectFragment(glm::vec2(0.5f, 0.02f), 0x00000000u, 0xFF0000FFu, glm::vec2(0.0f, 0.05f));
    ASSERT_TRUE(color.has_value());
    EXPECT_FLOAT_EQ(color->r, 1.0f);
    EXPECT_FLOAT_EQ(color->g, 0.0f);
    EXPECT_FLOAT_EQ(color->b, 0.0f);
    EXPECT_FLOAT_EQ(color->a, 1.0f);
}

TEST(RectFragment, BandFoldsToEveryEdge)
{
    const glm::vec2 radius(0.1f, 0.1f);
    for (const glm::vec2 uv : {glm::vec2(0.05f, 0.5f), glm::vec2(0.95f, 0.5f),
                               glm::vec2(0.5f, 0.05f), glm::vec2(0.5f, 0.95f)})
    {
        auto color = EvaluateRectFragment(uv, Color::Green, Color::Red, radius);
        ASSERT_TRUE(color.has_value());
        EXPECT_FLOAT_EQ(color->r, 1.0f) << uv.x << "," << uv.y;
        EXPECT_FLOAT_EQ(color->g, 0.0f);
    }
}

TEST(RectFragment, TransparentInteriorIsDiscarded)
{
    auto color = EvaluateRectFragment(glm::vec2(0.5f, 0.5f), Color::Transparent, Color::Red, glm::vec2(0.05f));
    EXPECT_FALSE(color.has_value());
}

TEST(RectFragment, FillOutsideBand)
{
    auto color = EvaluateRectFragment(glm::vec2(0.5f, 0.5f), Color::Blue, Color::Red, glm::vec2(0.05f));
    ASSERT_TRUE(color.has_value());
    EXPECT_FLOAT_EQ(color->b, 1.0f);
    EXPECT_FLOAT_EQ(color->r, 0.0f);
}

TEST(RectFragment, NoOutlineMeansFillEverywhere)
{
    auto edge = EvaluateRectFragment(glm::vec2(0.01f, 0.01f), Color::Blue, 0u, glm::vec2(0.05f));
    ASSERT_TRUE(edge.has_value());
    EXPECT_FLOAT_EQ(edge->b, 1.0f);

    auto hole = EvaluateRectFragment(glm::vec2(0.01f, 0.01f), Color::Transparent, 0u, glm::vec2(0.05f));
    EXPECT_FALSE(hole.has_value());
}

TEST(RectFragment, ZeroRadiusHasNoBand)
{
    auto color = EvaluateRectFragment(glm::vec2(0.0f, 0.5f), Color::Blue, Color::Red, glm::vec2(0.0f));
    ASSERT_TRUE(color.has_value());
    EXPECT_FLOAT_EQ(color->b, 1.0f);
}
