#ifndef VELLUM_SHADER_ATTRIBUTES_HPP
#define VELLUM_SHADER_ATTRIBUTES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "geometry/Geometry.hpp"

namespace vellum {

// One per-node shader input. The alternative index is the shape; values are
// never converted between shapes.
using ShaderAttributeValue = std::variant<float, Vec2, Vec3, Vec4>;

enum class ShaderAttributeType : std::uint8_t { Float = 0, Vec2 = 1, Vec3 = 2, Vec4 = 3 };

inline ShaderAttributeType type_of(const ShaderAttributeValue& value) {
    return static_cast<ShaderAttributeType>(value.index());
}

struct ShaderAttributes {
    std::map<std::string, ShaderAttributeValue> values;

    void set(const std::string& name, ShaderAttributeValue value) {
        values.insert_or_assign(name, value);
    }

    bool remove(const std::string& name) { return values.erase(name) > 0; }

    std::optional<ShaderAttributeValue> get(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    // Empty when the attribute is missing or holds another shape.
    template <typename T>
    std::optional<T> get_as(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        if (const T* value = std::get_if<T>(&it->second)) return *value;
        return std::nullopt;
    }
};

}  // namespace vellum

#endif  // VELLUM_SHADER_ATTRIBUTES_HPP
