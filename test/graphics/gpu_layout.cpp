#include <gtest/gtest.h>

#include <shaderlink/graphics/gpu_layout.hpp>
#include <shaderlink/graphics/record_view.hpp>

namespace sl::gfx {

namespace {

SHADERLINK_GPU_STRUCT_BEGIN(Inner)
    SHADERLINK_GPU_FIELD(float3, direction)
    SHADERLINK_GPU_FIELD(float, scale)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(Inner);

SHADERLINK_GPU_STRUCT_BEGIN(Outer)
    SHADERLINK_GPU_FIELD(uint, count)
    SHADERLINK_GPU_FIELD(float2, extent)
    SHADERLINK_GPU_FIELD(float3, position)
    SHADERLINK_GPU_FIELD(Inner, inner)
    SHADERLINK_GPU_FIELD(float, weight)
    SHADERLINK_GPU_FIELD_ARRAY(float4, taps, 3)
    SHADERLINK_GPU_FIELD(float4x4, transform)
    SHADERLINK_GPU_FIELD(int, flags)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(Outer);

}

TEST(GpuLayout, OffsetsFollowTheLayoutRule) {
    constexpr auto fields = gpu_field_infos<Outer>();
    static_assert(fields.size() == 8);
    EXPECT_EQ(fields[0].offset, 0);
    EXPECT_EQ(fields[1].offset, 8);
    EXPECT_EQ(fields[2].offset, 16);
    EXPECT_EQ(fields[3].offset, 32);
    EXPECT_EQ(fields[4].offset, 64);
    EXPECT_EQ(fields[5].offset, 80);
    EXPECT_EQ(fields[5].stride, 16);
    EXPECT_EQ(fields[5].array_size, 3);
    EXPECT_EQ(fields[6].offset, 128);
    EXPECT_EQ(fields[7].offset, 192);
    EXPECT_EQ(gpu_struct_size<Outer>(), 208);
    EXPECT_EQ(sizeof(Outer), 208);
}

TEST(GpuLayout, ThreeComponentFieldsKeepTheirTrailingWord) {
    constexpr auto fields = gpu_field_infos<Inner>();
    EXPECT_EQ(fields[0].size, 16);
    EXPECT_EQ(fields[0].data_size, 12);
    EXPECT_EQ(fields[1].offset, 16);
    EXPECT_EQ(sizeof(Inner), 32);
    EXPECT_EQ(alignof(Inner), 16);
}

TEST(GpuLayout, RuntimeDescriptionMatchesCompileTimeOne) {
    auto const& layout = Outer::gpu_layout();
    EXPECT_EQ(layout.name, "Outer");
    EXPECT_EQ(layout.size, sizeof(Outer));
    ASSERT_EQ(layout.fields.size(), 8);

    auto inner = layout.find("inner");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->base_type, GpuBaseType::record);
    EXPECT_EQ(inner->type_name, "Inner");
    EXPECT_EQ(inner->offset, offsetof(Outer, inner));
    EXPECT_EQ(layout.find("missing"), nullptr);

    auto transform = layout.find("transform");
    ASSERT_NE(transform, nullptr);
    EXPECT_EQ(transform->columns, 4);
    EXPECT_EQ(transform->rows, 4);
}

TEST(GpuLayout, IdenticalLayoutsHaveNoMismatch) {
    EXPECT_TRUE(verify_layout(Outer::gpu_layout(), Outer::gpu_layout()).empty());
    EXPECT_NO_THROW(ensure_layout_compatible(Outer::gpu_layout(), Outer::gpu_layout()));
}

TEST(GpuLayout, MissingPaddingIsReported) {
    auto consumer = Inner::gpu_layout();
    // A consumer that packs `scale` into the tail of `direction`.
    consumer.fields[1].offset = 12;
    consumer.size = 16;

    auto mismatches = verify_layout(Inner::gpu_layout(), consumer);
    ASSERT_EQ(mismatches.size(), 2);
    EXPECT_TRUE(mismatches[0].field.empty());
    EXPECT_EQ(mismatches[1].field, "scale");
    EXPECT_THROW(ensure_layout_compatible(Inner::gpu_layout(), consumer), LayoutError);
}

TEST(GpuLayout, ReorderedFieldsAreReported) {
    auto consumer = Inner::gpu_layout();
    std::swap(consumer.fields[0].name, consumer.fields[1].name);
    auto mismatches = verify_layout(Inner::gpu_layout(), consumer);
    EXPECT_EQ(mismatches.size(), 2);
}

TEST(GpuLayout, ExtraConsumerFieldIsReported) {
    auto consumer = Inner::gpu_layout();
    consumer.fields.push_back(GpuField{.name = "extra", .type_name = "float", .offset = 20, .size = 4, .alignment = 4});
    auto mismatches = verify_layout(Inner::gpu_layout(), consumer);
    ASSERT_EQ(mismatches.size(), 1);
    EXPECT_EQ(mismatches[0].field, "extra");
}

TEST(GpuLayout, DescriptionSurvivesJson) {
    std::vector<GpuStructLayout> layouts{Inner::gpu_layout(), Outer::gpu_layout()};
    auto json = layouts_to_value(layouts).to_json();
    auto restored = layouts_from_value(serde::Value::from_json(json));

    ASSERT_EQ(restored.size(), 2);
    EXPECT_TRUE(verify_layout(Inner::gpu_layout(), restored[0]).empty());
    EXPECT_TRUE(verify_layout(Outer::gpu_layout(), restored[1]).empty());
    EXPECT_EQ(restored[1].find("taps")->stride, 16);
}

TEST(GpuRecordView, ReadsThroughLayoutOnly) {
    Outer outer{};
    outer.count = 7;
    outer.extent = float2{2.0f, 3.0f};
    outer.position = float3{1.0f, 2.0f, 3.0f};
    outer.inner.direction = float3{0.0f, -1.0f, 0.0f};
    outer.inner.scale = 0.5f;
    outer.weight = 0.25f;
    outer.taps[2] = float4{4.0f, 5.0f, 6.0f, 7.0f};
    outer.transform = math::translate(float4x4{1.0f}, float3{1.0f, 2.0f, 3.0f});
    outer.flags = -3;

    GpuRecordView view{Outer::gpu_layout(), as_bytes(outer)};
    EXPECT_EQ(view.read<uint>("count"), 7u);
    EXPECT_EQ(view.read<float2>("extent"), float2(2.0f, 3.0f));
    EXPECT_EQ(view.read<float3>("position"), float3(1.0f, 2.0f, 3.0f));
    EXPECT_FLOAT_EQ(view.read<float>("weight"), 0.25f);
    EXPECT_EQ(view.read<float4>("taps", 2), float4(4.0f, 5.0f, 6.0f, 7.0f));
    EXPECT_EQ(view.read<float4x4>("transform"), outer.transform);
    EXPECT_EQ(view.read<int>("flags"), -3);

    auto inner = view.read<Inner>("inner");
    EXPECT_EQ(inner.direction.value(), float3(0.0f, -1.0f, 0.0f));
    EXPECT_FLOAT_EQ(inner.scale, 0.5f);
}

TEST(GpuRecordView, RejectsWrongTypeAndRange) {
    Outer outer{};
    GpuRecordView view{Outer::gpu_layout(), as_bytes(outer)};
    EXPECT_THROW(view.read<float>("count"), LayoutError);
    EXPECT_THROW(view.read<float4>("position"), LayoutError);
    EXPECT_THROW(view.read<float4>("taps", 3), LayoutError);
    EXPECT_THROW(view.read<float>("nothing"), LayoutError);

    std::array<std::byte, 16> too_small{};
    EXPECT_THROW((GpuRecordView{Outer::gpu_layout(), Span<std::byte const>{too_small}}), LayoutError);
}

TEST(GpuBufferView, IndexesWholeRecords) {
    std::vector<Inner> records(3);
    records[1].scale = 2.0f;
    GpuBufferView buffer{Inner::gpu_layout(), as_bytes(records)};
    EXPECT_EQ(buffer.size(), 3);
    EXPECT_FLOAT_EQ(buffer[1].read<float>("scale"), 2.0f);
    EXPECT_THROW(buffer[3], LayoutError);
}

}
