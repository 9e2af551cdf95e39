#include <gtest/gtest.h>

#include <shaderlink/contract/normal_matrix.hpp>

namespace sl::contract {

namespace {

auto expect_near(float3 const& a, float3 const& b) -> void {
    EXPECT_NEAR(a.x, b.x, 1e-5f);
    EXPECT_NEAR(a.y, b.y, 1e-5f);
    EXPECT_NEAR(a.z, b.z, 1e-5f);
}

}

TEST(NormalMatrix, IdentityModelGivesIdentityRows) {
    auto pack = NormalMatrixPack::from_model(float4x4{1.0f});
    EXPECT_EQ(pack.row0, float4(1.0f, 0.0f, 0.0f, 0.0f));
    EXPECT_EQ(pack.row1, float4(0.0f, 1.0f, 0.0f, 0.0f));
    EXPECT_EQ(pack.row2, float4(0.0f, 0.0f, 1.0f, 0.0f));
}

TEST(NormalMatrix, FourthComponentIsZero) {
    auto model = math::translate(float4x4{1.0f}, float3{5.0f, -2.0f, 7.0f});
    model = math::rotate(model, 1.1f, math::normalize(float3{1.0f, 2.0f, 0.5f}));
    model = math::scale(model, float3{2.0f, 0.5f, 3.0f});
    auto pack = NormalMatrixPack::from_model(model);
    EXPECT_EQ(pack.row0.w, 0.0f);
    EXPECT_EQ(pack.row1.w, 0.0f);
    EXPECT_EQ(pack.row2.w, 0.0f);
}

TEST(NormalMatrix, TranslationDoesNotAffectNormals) {
    auto pack = NormalMatrixPack::from_model(math::translate(float4x4{1.0f}, float3{10.0f, 20.0f, 30.0f}));
    expect_near(pack.transform(float3{0.0f, 1.0f, 0.0f}), float3{0.0f, 1.0f, 0.0f});
}

TEST(NormalMatrix, NonUniformScaleUsesInverseScale) {
    auto model = math::scale(float4x4{1.0f}, float3{2.0f, 4.0f, 0.5f});
    auto pack = NormalMatrixPack::from_model(model);
    EXPECT_NEAR(pack.row0.x, 0.5f, 1e-6f);
    EXPECT_NEAR(pack.row1.y, 0.25f, 1e-6f);
    EXPECT_NEAR(pack.row2.z, 2.0f, 1e-6f);

    // A slanted surface stays perpendicular to its tangent after the transform.
    float3 tangent{1.0f, -1.0f, 0.0f};
    float3 normal{1.0f, 1.0f, 0.0f};
    auto world_tangent = float3{model * float4{tangent, 0.0f}};
    auto world_normal = pack.transform(normal);
    EXPECT_NEAR(math::dot(world_tangent, world_normal), 0.0f, 1e-5f);
}

TEST(NormalMatrix, RowsHoldColumnsOfInverseTranspose) {
    auto model = math::rotate(float4x4{1.0f}, 0.7f, math::normalize(float3{0.3f, 1.0f, -0.2f}));
    model = math::scale(model, float3{2.0f, 1.0f, 1.0f});
    auto expected = normal_matrix_of(model);
    ASSERT_GT(math::abs(expected[0][1] - expected[1][0]), 1e-3f);

    auto pack = NormalMatrixPack::from_model(model);
    expect_near(float3{pack.row0}, expected[0]);
    expect_near(float3{pack.row1}, expected[1]);
    expect_near(float3{pack.row2}, expected[2]);

    float3 n{0.2f, -0.6f, 0.9f};
    expect_near(pack.transform(n), expected * n);
    auto unpacked = pack.unpack();
    for (int col = 0; col < 3; col++) {
        expect_near(unpacked[col], expected[col]);
    }
}

TEST(NormalMatrix, ShaderSideReconstructionFromColumns) {
    auto model = math::rotate(float4x4{1.0f}, -1.2f, math::normalize(float3{1.0f, 0.0f, 1.0f}));
    model = math::scale(model, float3{0.5f, 3.0f, 1.0f});
    auto pack = NormalMatrixPack::from_model(model);

    // float3x3(row0.xyz, row1.xyz, row2.xyz) in Metal, columns in glm.
    float3x3 shader_matrix{float3{pack.row0}, float3{pack.row1}, float3{pack.row2}};
    float3 tangent{0.0f, 1.0f, -1.0f};
    float3 normal{0.0f, 1.0f, 1.0f};
    auto world_tangent = float3{model * float4{tangent, 0.0f}};
    EXPECT_NEAR(math::dot(world_tangent, shader_matrix * normal), 0.0f, 1e-5f);
}

TEST(NormalMatrix, UnpackIgnoresFourthComponent) {
    auto model = math::rotate(float4x4{1.0f}, 0.4f, float3{0.0f, 0.0f, 1.0f});
    auto pack = NormalMatrixPack::from_model(model);
    pack.row0.w = 42.0f;
    pack.row1.w = -7.0f;
    pack.row2.w = 1.0f;
    auto unpacked = pack.unpack();
    auto expected = normal_matrix_of(model);
    for (int col = 0; col < 3; col++) {
        expect_near(unpacked[col], expected[col]);
    }
}

}
