#include <shaderlink/graphics/gpu_layout.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <shaderlink/runtime/logger.hpp>

namespace sl::gfx {

auto GpuField::to_value(serde::Value& v, GpuField const& o) -> void {
    v = serde::Value::Table{};
    serde::to_value(v["name"], o.name);
    serde::to_value(v["type"], o.type_name);
    serde::to_value(v["base_type"], o.base_type);
    serde::to_value(v["columns"], o.columns);
    serde::to_value(v["rows"], o.rows);
    serde::to_value(v["offset"], o.offset);
    serde::to_value(v["size"], o.size);
    serde::to_value(v["data_size"], o.data_size);
    serde::to_value(v["alignment"], o.alignment);
    if (o.is_array()) {
        serde::to_value(v["array_size"], o.array_size);
        serde::to_value(v["stride"], o.stride);
    }
}
auto GpuField::from_value(serde::Value const& v, GpuField& o) -> void {
    o.name = v["name"].get<std::string>();
    o.type_name = v["type"].get<std::string>();
    o.base_type = v["base_type"].get<GpuBaseType>();
    o.columns = v["columns"].get<uint32_t>();
    o.rows = v["rows"].get<uint32_t>();
    o.offset = v["offset"].get<size_t>();
    o.size = v["size"].get<size_t>();
    o.data_size = v.value("data_size", o.size);
    o.alignment = v["alignment"].get<size_t>();
    o.array_size = v.value("array_size", size_t{0});
    o.stride = v.value("stride", aligned_size(o.size, o.alignment));
}

auto GpuStructLayout::find(std::string_view field_name) const -> GpuField const* {
    for (auto const& field : fields) {
        if (field.name == field_name) { return &field; }
    }
    return nullptr;
}

auto GpuStructLayout::to_value(serde::Value& v, GpuStructLayout const& o) -> void {
    v = serde::Value::Table{};
    serde::to_value(v["name"], o.name);
    serde::to_value(v["size"], o.size);
    serde::to_value(v["alignment"], o.alignment);
    serde::to_value(v["fields"], o.fields);
}
auto GpuStructLayout::from_value(serde::Value const& v, GpuStructLayout& o) -> void {
    o.name = v["name"].get<std::string>();
    o.size = v["size"].get<size_t>();
    o.alignment = v["alignment"].get<size_t>();
    serde::from_value(v["fields"], o.fields);
}

auto verify_layout(GpuStructLayout const& producer, GpuStructLayout const& consumer) -> std::vector<LayoutMismatch> {
    std::vector<LayoutMismatch> mismatches{};
    auto report = [&mismatches, &producer](std::string_view field, std::string description) {
        mismatches.push_back(LayoutMismatch{
            .record = producer.name,
            .field = std::string{field},
            .description = std::move(description),
        });
    };

    if (producer.name != consumer.name) {
        report("", fmt::format("record is named '{}' by the consumer", consumer.name));
    }
    if (producer.size != consumer.size) {
        report("", fmt::format("size is {} bytes on producer side but {} bytes on consumer side", producer.size, consumer.size));
    }
    if (producer.alignment != consumer.alignment) {
        report("", fmt::format("alignment is {} on producer side but {} on consumer side", producer.alignment, consumer.alignment));
    }

    auto count = std::min(producer.fields.size(), consumer.fields.size());
    for (size_t i = 0; i < count; i++) {
        auto const& p = producer.fields[i];
        auto const& c = consumer.fields[i];
        if (p.name != c.name) {
            report(p.name, fmt::format("field #{} is named '{}' by the consumer", i, c.name));
        }
        if (p.base_type != c.base_type || p.columns != c.columns || p.rows != c.rows || p.type_name != c.type_name) {
            report(p.name, fmt::format("type is '{}' on producer side but '{}' on consumer side", p.type_name, c.type_name));
        }
        if (p.offset != c.offset) {
            report(p.name, fmt::format("offset is {} on producer side but {} on consumer side", p.offset, c.offset));
        }
        if (p.size != c.size || p.alignment != c.alignment) {
            report(p.name, fmt::format(
                "size/alignment is {}/{} on producer side but {}/{} on consumer side",
                p.size, p.alignment, c.size, c.alignment
            ));
        }
        if (p.array_size != c.array_size || (p.is_array() && p.stride != c.stride)) {
            report(p.name, fmt::format(
                "array is {}x{} bytes on producer side but {}x{} bytes on consumer side",
                p.array_size, p.stride, c.array_size, c.stride
            ));
        }
    }
    for (size_t i = count; i < producer.fields.size(); i++) {
        report(producer.fields[i].name, "field is missing on consumer side");
    }
    for (size_t i = count; i < consumer.fields.size(); i++) {
        report(consumer.fields[i].name, "field is missing on producer side");
    }

    return mismatches;
}

auto ensure_layout_compatible(GpuStructLayout const& producer, GpuStructLayout const& consumer) -> void {
    auto mismatches = verify_layout(producer, consumer);
    if (mismatches.empty()) { return; }

    for (auto const& mismatch : mismatches) {
        if (mismatch.field.empty()) {
            log::critical("contract", "layout mismatch in '{}': {}", mismatch.record, mismatch.description);
        } else {
            log::critical("contract", "layout mismatch in '{}.{}': {}", mismatch.record, mismatch.field, mismatch.description);
        }
    }
    throw LayoutError{fmt::format(
        "layout of '{}' differs between producer and consumer ({} mismatches)", producer.name, mismatches.size()
    )};
}

auto layouts_to_value(std::vector<GpuStructLayout> const& layouts) -> serde::Value {
    serde::Value v{};
    serde::to_value(v["records"], layouts);
    return v;
}

auto layouts_from_value(serde::Value const& v) -> std::vector<GpuStructLayout> {
    std::vector<GpuStructLayout> layouts{};
    serde::from_value(v["records"], layouts);
    return layouts;
}

}
