#include <shaderlink/graphics/record_view.hpp>

namespace sl::gfx {

GpuRecordView::GpuRecordView(GpuStructLayout const& layout, Span<std::byte const> bytes)
    : layout_(&layout), bytes_(bytes) {
    if (bytes.size() < layout.size) {
        throw LayoutError{fmt::format(
            "record '{}' needs {} bytes but only {} bytes are bound", layout.name, layout.size, bytes.size()
        )};
    }
}

auto GpuRecordView::checked_field(std::string_view name, size_t element) const -> GpuField const& {
    auto field = layout_->find(name);
    if (!field) {
        throw LayoutError{fmt::format("record '{}' has no field '{}'", layout_->name, name)};
    }
    auto count = field->is_array() ? field->array_size : 1;
    if (element >= count) {
        throw LayoutError{fmt::format(
            "element {} of field '{}.{}' is out of range ({} elements)", element, layout_->name, name, count
        )};
    }
    return *field;
}

auto GpuRecordView::field_bytes(std::string_view name, size_t element) const -> Span<std::byte const> {
    auto const& field = checked_field(name, element);
    return bytes_.subspan(field.offset + element * field.stride, field.size);
}

GpuBufferView::GpuBufferView(GpuStructLayout const& layout, Span<std::byte const> bytes)
    : layout_(&layout), bytes_(bytes) {
    if (layout.size == 0 || bytes.size() % layout.size != 0) {
        throw LayoutError{fmt::format(
            "buffer of {} bytes is not a whole number of '{}' records ({} bytes each)",
            bytes.size(), layout.name, layout.size
        )};
    }
}

auto GpuBufferView::size() const -> size_t {
    return bytes_.size() / layout_->size;
}

auto GpuBufferView::operator[](size_t index) const -> GpuRecordView {
    if (index >= size()) {
        throw LayoutError{fmt::format("record {} of '{}' buffer is out of range ({} records)", index, layout_->name, size())};
    }
    return GpuRecordView{*layout_, bytes_.subspan(index * layout_->size, layout_->size)};
}

}
