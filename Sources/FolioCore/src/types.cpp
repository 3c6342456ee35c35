#include "folio/types.hpp"
#include <array>
#include <utility>

namespace folio {

namespace {

constexpr std::array<std::pair<data_type, std::string_view>, 17> type_names{{
    {data_type::boolean, "Bool"},
    {data_type::byte, "Byte"},
    {data_type::integer, "Int"},
    {data_type::floating, "Float"},
    {data_type::long_integer, "Long"},
    {data_type::double_floating, "Double"},
    {data_type::string, "String"},
    {data_type::object, "Object"},
    {data_type::json, "Json"},
    {data_type::bool_list, "BoolList"},
    {data_type::byte_list, "ByteList"},
    {data_type::int_list, "IntList"},
    {data_type::float_list, "FloatList"},
    {data_type::long_list, "LongList"},
    {data_type::double_list, "DoubleList"},
    {data_type::string_list, "StringList"},
    {data_type::object_list, "ObjectList"},
}};

} // namespace

std::string_view data_type_name(data_type type) noexcept {
    for (const auto& [t, name] : type_names) {
        if (t == type) return name;
    }
    return "Unknown";
}

std::optional<data_type> data_type_from_name(std::string_view name) noexcept {
    for (const auto& [t, n] : type_names) {
        if (n == name) return t;
    }
    return std::nullopt;
}

} // namespace folio
