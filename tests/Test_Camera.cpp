#include <gtest/gtest.h>
#include <cmath>
#include <glm/glm.hpp>

import Graphics;

using namespace Graphics;

TEST(Camera2D, OrthographicMapsViewportEdgesToClipEdges)
{
    Camera2D camera;
    camera.Update(glm::vec2(0.0f), 1.0f, glm::vec2(800.0f, 600.0f));

    const glm::vec4 right = camera.GetUniform().ViewProj * glm::vec4(400.0f, 0.0f, 0.0f, 1.0f);
    EXPECT_NEAR(right.x / right.w, 1.0f, 1e-5f);

    // Vulkan clip space: world +Y is up on screen, clip +Y is down.
    const glm::vec4 top = camera.GetUniform().ViewProj * glm::vec4(0.0f, 300.0f, 0.0f, 1.0f);
    EXPECT_NEAR(top.y / top.w, -1.0f, 1e-5f);
}

TEST(Camera2D, PositionIsViewCenter)
{
    Camera2D camera;
    camera.Update(glm::vec2(100.0f, -50.0f), 1.0f, glm::vec2(800.0f, 600.0f));

    const glm::vec4 center = camera.GetUniform().ViewProj * glm::vec4(100.0f, -50.0f, 0.0f, 1.0f);
    EXPECT_NEAR(center.x, 0.0f, 1e-5f);
    EXPECT_NEAR(center.y, 0.0f, 1e-5f);
}

TEST(Camera2D, ViewInverseIsOrthonormalUnderRotation)
{
    Camera2D camera;
    camera.Update(glm::vec2(10.0f, 20.0f), 2.0f, glm::vec2(640.0f, 480.0f));
    camera.SetRotation(0.7f);

    const glm::mat4& viewInv = camera.GetUniform().ViewInv;
    const glm::vec3 x(viewInv[0]);
    const glm::vec3 y(viewInv[1]);
    EXPECT_NEAR(glm::length(x), 1.0f, 1e-5f);
    EXPECT_NEAR(glm::length(y), 1.0f, 1e-5f);
    EXPECT_NEAR(glm::dot(x, y), 0.0f, 1e-5f);
    EXPECT_NEAR(viewInv[3].x, 10.0f, 1e-4f);
    EXPECT_NEAR(viewInv[3].y, 20.0f, 1e-4f);

    const glm::mat4 identity = camera.GetUniform().View * viewInv;
    EXPECT_NEAR(identity[0][0], 1.0f, 1e-5f);
    EXPECT_NEAR(identity[1][0], 0.0f, 1e-5f);
}

TEST(Camera2D, DegenerateZoomAndViewportStayFinite)
{
    Camera2D camera;
    camera.Update(glm::vec2(0.0f), 0.0f, glm::vec2(0.0f, 0.0f));

    const glm::mat4& proj = camera.GetUniform().Proj;
    EXPECT_TRUE(std::isfinite(proj[0][0]));
    EXPECT_TRUE(std::isfinite(proj[1][1]));
    EXPECT_NE(proj[0][0], 0.0f);
}

TEST(Camera2D, VersionBumpsOnEveryChange)
{
    Camera2D camera;
    const auto v0 = camera.GetVersion();
    camera.SetViewport(glm::vec2(100.0f));
    camera.SetRotation(1.0f);
    camera.SetDepthRange(10.0f);
    EXPECT_EQ(camera.GetVersion(), v0 + 3);
}

TEST(ViewFrustum, CullsSpheresOutsideViewport)
{
    Camera2D camera;
    camera.Update(glm::vec2(0.0f), 1.0f, glm::vec2(800.0f, 600.0f));
    const ViewFrustum& frustum = camera.GetFrustum();

    EXPECT_TRUE(frustum.IsSphereVisible(glm::vec3(0.0f), 1.0f));
    EXPECT_FALSE(frustum.IsSphereVisible(glm::vec3(5000.0f, 0.0f, 0.0f), 10.0f));
    EXPECT_FALSE(frustum.IsSphereVisible(glm::vec3(0.0f, -5000.0f, 0.0f), 10.0f));

    // Centre just outside the right edge, radius reaching back in.
    EXPECT_TRUE(frustum.IsSphereVisible(glm::vec3(405.0f, 0.0f, 0.0f), 10.0f));
    EXPECT_FALSE(frustum.IsSphereVisible(glm::vec3(420.0f, 0.0f, 0.0f), 10.0f));
}

TEST(ViewFrustum, ZoomShrinksVisibleArea)
{
    Camera2D camera;
    camera.Update(glm::vec2(0.0f), 2.0f, glm::vec2(800.0f, 600.0f));

    EXPECT_TRUE(camera.GetFrustum().IsSphereVisible(glm::vec3(150.0f, 0.0f, 0.0f), 1.0f));
    EXPECT_FALSE(camera.GetFrustum().IsSphereVisible(glm::vec3(300.0f, 0.0f, 0.0f), 1.0f));
}

TEST(ViewFrustum, DepthRangeLimitsLayers)
{
    Camera2D camera;
    camera.Update(glm::vec2(0.0f), 1.0f, glm::vec2(800.0f, 600.0f));
    camera.SetDepthRange(100.0f);

    EXPECT_TRUE(camera.GetFrustum().IsSphereVisible(glm::vec3(0.0f, 0.0f, 50.0f), 1.0f));
    EXPECT_FALSE(camera.GetFrustum().IsSphereVisible(glm::vec3(0.0f, 0.0f, 500.0f), 1.0f));
}
