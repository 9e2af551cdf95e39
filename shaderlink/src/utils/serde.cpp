#include <shaderlink/utils/serde.hpp>

#include <sstream>

#include <nlohmann/json.hpp>
#include <toml++/toml.h>

#include <shaderlink/prelude/misc.hpp>

namespace sl::serde {

auto Value::operator[](size_t index) const -> Value const& {
    return get_ref<Array>().at(index);
}
auto Value::operator[](std::string_view key) const -> Value const& {
    auto& table = get_ref<Table>();
    if (auto it = table.find(key); it != table.end()) {
        return it->second;
    }
    throw Exception{"key '" + std::string{key} + "' not found in serde::Value"};
}

auto Value::operator[](size_t index) -> Value& {
    return std::get<Array>(value_).at(index);
}
auto Value::operator[](std::string_view key) -> Value& {
    if (value_.index() == 0) { value_ = Table{}; }
    auto& table = std::get<Table>(value_);
    if (auto it = table.find(key); it != table.end()) {
        return it->second;
    }
    return table.emplace(std::string{key}, Value{}).first->second;
}

auto Value::try_at(std::string_view key) const -> Value const* {
    if (auto table = std::get_if<Table>(&value_); table) {
        if (auto it = table->find(key); it != table->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto Value::size() const -> size_t {
    if (auto arr = std::get_if<Array>(&value_); arr) {
        return arr->size();
    } else if (auto table = std::get_if<Table>(&value_); table) {
        return table->size();
    } else {
        return value_.index() == 0 ? 0 : 1;
    }
}

auto Value::contains(std::string_view key) const -> bool {
    return try_at(key) != nullptr;
}

namespace {

auto value_to_json(Value const& v) -> nlohmann::json {
    nlohmann::json j{};
    std::visit(
        FunctorsHelper{
            [](std::monostate) {},
            [&j](Value::Bool v) { j = v; },
            [&j](Value::Float v) { j = v; },
            [&j](Value::Integer v) { j = v; },
            [&j](Value::String const& v) { j = v; },
            [&j](Value::Array const& v) {
                j = nlohmann::json::array();
                for (auto& elem : v) {
                    j.push_back(value_to_json(elem));
                }
            },
            [&j](Value::Table const& v) {
                j = nlohmann::json::object();
                for (auto& [key, elem] : v) {
                    j[key] = value_to_json(elem);
                }
            },
        },
        v.variant()
    );
    return j;
}

auto value_from_json(nlohmann::json const& j) -> Value {
    Value v{};
    switch (j.type()) {
        case nlohmann::json::value_t::boolean:
            v = j.get<Value::Bool>();
            break;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            v = j.get<Value::Integer>();
            break;
        case nlohmann::json::value_t::number_float:
            v = j.get<Value::Float>();
            break;
        case nlohmann::json::value_t::string:
            v = j.get<Value::String>();
            break;
        case nlohmann::json::value_t::array:
            v = Value::Array{};
            for (auto& elem : j) {
                v.push_back(value_from_json(elem));
            }
            break;
        case nlohmann::json::value_t::object:
            v = Value::Table{};
            for (auto& [key, elem] : j.items()) {
                v[key] = value_from_json(elem);
            }
            break;
        default: break;
    }
    return v;
}

template <typename Sink>
auto insert_toml(Value const& v, Sink&& sink) -> void;

auto toml_array_of(Value::Array const& v) -> toml::array {
    toml::array arr{};
    for (auto& elem : v) {
        insert_toml(elem, [&arr](auto&& node) { arr.push_back(std::forward<decltype(node)>(node)); });
    }
    return arr;
}

auto toml_table_of(Value::Table const& v) -> toml::table {
    toml::table table{};
    for (auto& [key, elem] : v) {
        insert_toml(elem, [&table, &key](auto&& node) { table.insert(key, std::forward<decltype(node)>(node)); });
    }
    return table;
}

template <typename Sink>
auto insert_toml(Value const& v, Sink&& sink) -> void {
    std::visit(
        FunctorsHelper{
            [](std::monostate) {},
            [&sink](Value::Bool v) { sink(v); },
            [&sink](Value::Float v) { sink(v); },
            [&sink](Value::Integer v) { sink(v); },
            [&sink](Value::String const& v) { sink(v); },
            [&sink](Value::Array const& v) { sink(toml_array_of(v)); },
            [&sink](Value::Table const& v) { sink(toml_table_of(v)); },
        },
        v.variant()
    );
}

auto value_from_toml(toml::node const& t) -> Value {
    Value v{};
    switch (t.type()) {
        case toml::node_type::boolean:
            v = t.as_boolean()->get();
            break;
        case toml::node_type::integer:
            v = static_cast<Value::Integer>(t.as_integer()->get());
            break;
        case toml::node_type::floating_point:
            v = t.as_floating_point()->get();
            break;
        case toml::node_type::string:
            v = t.as_string()->get();
            break;
        case toml::node_type::array:
            v = Value::Array{};
            for (auto& elem : *t.as_array()) {
                v.push_back(value_from_toml(elem));
            }
            break;
        case toml::node_type::table:
            v = Value::Table{};
            for (auto& [key, elem] : *t.as_table()) {
                v[key.str()] = value_from_toml(elem);
            }
            break;
        default: break;
    }
    return v;
}

} // namespace

auto Value::to_json(int indent) const -> std::string {
    return value_to_json(*this).dump(indent);
}
auto Value::to_toml() const -> std::string {
    if (!is_table()) {
        throw Exception{"only a table can be written as a toml document"};
    }
    std::ostringstream sout{};
    sout << toml_table_of(get_ref<Table>());
    return sout.str();
}

auto Value::from_json(std::string_view json_str) -> Value {
    try {
        return value_from_json(nlohmann::json::parse(json_str));
    } catch (nlohmann::json::exception const& e) {
        throw Exception{std::string{"failed to parse json: "} + e.what()};
    }
}
auto Value::from_toml(std::string_view toml_str) -> Value {
    try {
        auto t = toml::parse(toml_str);
        return value_from_toml(t);
    } catch (toml::parse_error const& e) {
        throw Exception{std::string{"failed to parse toml: "} + std::string{e.description()}};
    }
}

}
