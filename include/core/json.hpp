#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace codeauditor {

/**
 * @brief Read-only view over a parsed glz::json_t document
 *
 * Used at the HTTP boundary to read request bodies. Responses are written
 * with std::format + utils::escape_json, so no mutation API is exposed here.
 */
class JsonValue {
public:
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    explicit JsonValue(glz::json_t v) : data_(std::move(v)) {}

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t index) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (index >= arr.size()) return {};
        return JsonValue(arr[index]);
    }

    /// Element count for arrays and objects, 0 otherwise.
    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    [[nodiscard]] std::string get_string() const {
        return data_.get<std::string>();
    }

    [[nodiscard]] double get_number() const {
        return data_.get<double>();
    }

    [[nodiscard]] bool get_bool() const {
        return data_.get<bool>();
    }

    /// String member lookup; nullopt when absent or not a string.
    [[nodiscard]] std::optional<std::string> string_field(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (!v.is_string()) return std::nullopt;
        return v.get_string();
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace codeauditor
