#include <gtest/gtest.h>

#include <shaderlink/contract/frame_assembler.hpp>
#include <shaderlink/runtime/logger_manager.hpp>

namespace sl::contract {

namespace {

auto single_instance_frame() -> FrameInput {
    FrameInput input{};
    input.camera.image_size = uint2{800, 600};
    input.environment.ambient_intensity = 0.1f;
    input.directional_lights.push_back(DirectionalLightDesc{
        .direction = float3{0.0f, -1.0f, 0.0f},
        .intensity = 1.0f,
        .color = float3{1.0f, 1.0f, 1.0f},
    });
    input.instances.push_back(InstanceDesc{
        .base_index = 0,
        .base_vertex = 0,
        .index_count = 10,
    });
    return input;
}

auto textured_instance(TextureHandle base_color, std::optional<TextureHandle> normal = std::nullopt) -> InstanceDesc {
    InstanceDesc instance{.index_count = 3};
    instance.material.base_color_texture = base_color;
    instance.material.normal_texture = normal;
    return instance;
}

}

struct FrameAssemblerTest : testing::Test {
    static auto SetUpTestSuite() -> void {
        rt::logger_manager().set_level(rt::LogLevel::off);
    }
};

TEST_F(FrameAssemblerTest, SingleInstanceSingleLight) {
    FrameAssembler assembler{};
    auto result = assembler.assemble(single_instance_frame());
    ASSERT_TRUE(result);
    auto const& frame = result.value();

    EXPECT_EQ(frame.frame.dir_light_count, 1u);
    EXPECT_EQ(frame.frame.point_light_count, 0u);
    EXPECT_EQ(frame.frame.area_light_count, 0u);
    EXPECT_FLOAT_EQ(frame.frame.ambient_intensity, 0.1f);
    EXPECT_EQ(frame.frame.image_size, uint2(800, 600));

    ASSERT_EQ(frame.directional_lights.size(), 1u);
    EXPECT_EQ(frame.directional_lights[0].direction.value(), float3(0.0f, -1.0f, 0.0f));
    EXPECT_FLOAT_EQ(frame.directional_lights[0].intensity, 1.0f);
    EXPECT_EQ(frame.directional_lights[0].color.value(), float3(1.0f));
    EXPECT_TRUE(frame.point_lights.empty());
    EXPECT_TRUE(frame.area_lights.empty());

    ASSERT_EQ(frame.instances.size(), 1u);
    auto const& instance = frame.instances[0];
    EXPECT_EQ(instance.base_index, 0u);
    EXPECT_EQ(instance.base_vertex, 0u);
    EXPECT_EQ(instance.index_count, 10u);
    EXPECT_EQ(instance.base_color_texture, invalid_texture_index);
    EXPECT_EQ(instance.normal_texture, invalid_texture_index);
    EXPECT_EQ(instance.metallic_roughness_texture, invalid_texture_index);
    EXPECT_EQ(instance.emissive_texture, invalid_texture_index);
    EXPECT_EQ(instance.occlusion_texture, invalid_texture_index);
    EXPECT_EQ(frame.frame.texture_count, 0u);
}

TEST_F(FrameAssemblerTest, CountsMatchRecordsWritten) {
    auto input = single_instance_frame();
    input.point_lights.resize(3);
    input.area_lights.resize(2);
    FrameAssembler assembler{};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().frame.point_light_count, result.value().point_lights.size());
    EXPECT_EQ(result.value().frame.area_light_count, result.value().area_lights.size());
    EXPECT_EQ(result.value().frame.point_light_count, 3u);
    EXPECT_EQ(result.value().frame.area_light_count, 2u);
}

TEST_F(FrameAssemblerTest, DirectionsAreNormalized) {
    auto input = single_instance_frame();
    input.directional_lights[0].direction = float3{0.0f, -3.0f, 4.0f};
    FrameAssembler assembler{};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto direction = result.value().directional_lights[0].direction.value();
    EXPECT_NEAR(direction.y, -0.6f, 1e-6f);
    EXPECT_NEAR(direction.z, 0.8f, 1e-6f);
}

TEST_F(FrameAssemblerTest, ClampKeepsFirstRecords) {
    auto input = single_instance_frame();
    for (int i = 0; i < 6; i++) {
        input.area_lights.push_back(AreaLightDesc{.intensity = static_cast<float>(i)});
    }
    FrameAssembler assembler{AssemblerLimits{.max_area_lights = 4}};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().area_lights.size(), 4u);
    EXPECT_EQ(result.value().frame.area_light_count, 4u);
    EXPECT_FLOAT_EQ(result.value().area_lights[3].intensity, 3.0f);
}

TEST_F(FrameAssemblerTest, RejectReportsCapacity) {
    auto input = single_instance_frame();
    input.point_lights.resize(9);
    FrameAssembler assembler{AssemblerLimits{.max_point_lights = 8, .capacity_policy = rt::CapacityPolicy::reject}};
    auto result = assembler.assemble(input);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, rt::CapacityKind::point_lights);
    EXPECT_EQ(result.error().requested, 9u);
    EXPECT_EQ(result.error().capacity, 8u);
    EXPECT_EQ(result.error().message(), "9 point_lights requested but capacity is 8");
}

TEST_F(FrameAssemblerTest, TexturesShareSlots) {
    auto input = single_instance_frame();
    input.instances.push_back(textured_instance(100, 200));
    input.instances.push_back(textured_instance(100));
    input.instances.push_back(textured_instance(300, 100));
    FrameAssembler assembler{};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto const& frame = result.value();

    EXPECT_EQ(frame.textures, (std::vector<TextureHandle>{100, 200, 300}));
    EXPECT_EQ(frame.frame.texture_count, 3u);
    EXPECT_EQ(frame.instances[1].base_color_texture, 0u);
    EXPECT_EQ(frame.instances[1].normal_texture, 1u);
    EXPECT_EQ(frame.instances[2].base_color_texture, 0u);
    EXPECT_EQ(frame.instances[2].normal_texture, invalid_texture_index);
    EXPECT_EQ(frame.instances[3].base_color_texture, 2u);
    EXPECT_EQ(frame.instances[3].normal_texture, 0u);
}

TEST_F(FrameAssemblerTest, FullTextureTableLeavesChannelUnbound) {
    auto input = single_instance_frame();
    input.instances.push_back(textured_instance(1, 2));
    input.instances.push_back(textured_instance(3));
    FrameAssembler assembler{AssemblerLimits{.max_textures = 2}};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto const& frame = result.value();

    EXPECT_EQ(frame.frame.texture_count, 2u);
    EXPECT_EQ(frame.instances[2].base_color_texture, invalid_texture_index);
    for (auto const& instance : frame.instances) {
        for (auto index : {
            instance.base_color_texture, instance.normal_texture, instance.metallic_roughness_texture,
            instance.emissive_texture, instance.occlusion_texture,
        }) {
            EXPECT_TRUE(index == invalid_texture_index || index < frame.frame.texture_count);
        }
    }
}

TEST_F(FrameAssemblerTest, TextureTableStartsOverEachFrame) {
    auto input = single_instance_frame();
    input.instances.push_back(textured_instance(7));
    FrameAssembler assembler{};
    ASSERT_TRUE(assembler.assemble(input));

    input.instances.back() = textured_instance(8);
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().textures, std::vector<TextureHandle>{8});
    EXPECT_EQ(result.value().instances.back().base_color_texture, 0u);
}

TEST_F(FrameAssemblerTest, FirstFrameResetsHistory) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    input.camera.view = math::translate(float4x4{1.0f}, float3{0.0f, 0.0f, -5.0f});
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto const& frame = result.value().frame;
    EXPECT_EQ(frame.reset_history, 1u);
    EXPECT_EQ(frame.frame_index, 0u);
    EXPECT_EQ(frame.prev_view_proj, input.camera.projection * input.camera.view);
    EXPECT_FLOAT_EQ(frame.camera_motion, 0.0f);
}

TEST_F(FrameAssemblerTest, AccumulatesWhileCameraIsStill) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    for (uint32_t i = 0; i < 3; i++) {
        auto result = assembler.assemble(input);
        ASSERT_TRUE(result);
        EXPECT_EQ(result.value().frame.frame_index, i);
        EXPECT_EQ(result.value().frame.reset_history, i == 0 ? 1u : 0u);
    }
}

TEST_F(FrameAssemblerTest, PreviousViewComesFromLastFrame) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    input.camera.position = float3{0.0f, 0.0f, 5.0f};
    input.camera.view = math::lookAt(input.camera.position, float3{0.0f}, float3{0.0f, 1.0f, 0.0f});
    auto first_view_proj = input.camera.projection * input.camera.view;
    ASSERT_TRUE(assembler.assemble(input));

    input.camera.position = float3{1.0f, 0.0f, 5.0f};
    input.camera.view = math::lookAt(input.camera.position, float3{0.0f}, float3{0.0f, 1.0f, 0.0f});
    input.delta_time = 1.0f;
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto const& frame = result.value().frame;
    EXPECT_EQ(frame.prev_view_proj, first_view_proj);
    EXPECT_EQ(frame.prev_camera_position.value(), float3(0.0f, 0.0f, 5.0f));
    EXPECT_EQ(frame.camera_position.value(), float3(1.0f, 0.0f, 5.0f));
    // One unit in one second.
    EXPECT_NEAR(frame.camera_motion, 0.4f, 1e-5f);
    EXPECT_EQ(frame.reset_history, 0u);
}

TEST_F(FrameAssemblerTest, FastCameraMotionSaturates) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    ASSERT_TRUE(assembler.assemble(input));
    input.camera.position = float3{0.0f, 0.0f, 1.0f};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_FLOAT_EQ(result.value().frame.camera_motion, 1.0f);
}

TEST_F(FrameAssemblerTest, ResizeResetsHistory) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    ASSERT_TRUE(assembler.assemble(input));
    ASSERT_TRUE(assembler.assemble(input));

    input.camera.image_size = uint2{1024, 768};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().frame.reset_history, 1u);
    EXPECT_EQ(result.value().frame.frame_index, 0u);
}

TEST_F(FrameAssemblerTest, SceneChangeResetsHistory) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    ASSERT_TRUE(assembler.assemble(input));
    input.scene_revision = 1;
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().frame.reset_history, 1u);
}

TEST_F(FrameAssemblerTest, ExplicitReset) {
    FrameAssembler assembler{};
    auto input = single_instance_frame();
    ASSERT_TRUE(assembler.assemble(input));
    ASSERT_TRUE(assembler.assemble(input));
    assembler.reset_history();
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().frame.reset_history, 1u);
    EXPECT_EQ(result.value().frame.frame_index, 0u);
}

TEST_F(FrameAssemblerTest, EnvironmentCoefficientsAreWritten) {
    auto input = single_instance_frame();
    input.environment.environment_intensity = 0.5f;
    input.environment.sh_coefficients[0] = float3{0.8f, 0.7f, 0.6f};
    input.environment.sh_coefficients[8] = float3{-0.1f, 0.0f, 0.1f};
    FrameAssembler assembler{};
    auto result = assembler.assemble(input);
    ASSERT_TRUE(result);
    auto const& frame = result.value().frame;
    EXPECT_FLOAT_EQ(frame.environment_intensity, 0.5f);
    EXPECT_EQ(frame.sh_coefficients[0], float4(0.8f, 0.7f, 0.6f, 0.0f));
    EXPECT_EQ(frame.sh_coefficients[8], float4(-0.1f, 0.0f, 0.1f, 0.0f));
}

}
