#ifndef DOMAIN_JSON_FIELDS_HPP
#define DOMAIN_JSON_FIELDS_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protect_error.hpp"

/*
 * Strict field readers for the resource decoders. nlohmann's implicit conversions would accept
 * `true` for an int or 3.5 for an int; the api shape does not, so every mismatch is a DecodingError
 * naming the field.
 */
namespace domain::json_fields {

    inline const nlohmann::json &Required(const nlohmann::json &js, const std::string &key) {
        if (!js.is_object()) {
            throw DecodingError(
                "expected an object holding '" + key + "', got " + std::string(js.type_name())
            );
        }
        auto field = js.find(key);
        if (field == js.end()) {
            throw DecodingError("missing field '" + key + "'");
        }
        return *field;
    }

    inline DecodingError WrongType(
        const std::string &key, const char *expected, const nlohmann::json &value
    ) {
        return DecodingError(
            "field '" + key + "' expected " + expected + ", got " + std::string(value.type_name())
        );
    }

    inline std::string RequireString(const nlohmann::json &js, const std::string &key) {
        const auto &value = Required(js, key);
        if (!value.is_string()) throw WrongType(key, "string", value);
        return value.get<std::string>();
    }

    inline bool RequireBool(const nlohmann::json &js, const std::string &key) {
        const auto &value = Required(js, key);
        if (!value.is_boolean()) throw WrongType(key, "boolean", value);
        return value.get<bool>();
    }

    inline int RequireInt(const nlohmann::json &js, const std::string &key) {
        const auto &value = Required(js, key);
        if (!value.is_number_integer()) throw WrongType(key, "integer", value);
        if (value.is_number_unsigned()) {
            const auto wide = value.get<std::uint64_t>();
            if (wide > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw DecodingError("field '" + key + "' out of range: " + value.dump());
            }
            return static_cast<int>(wide);
        }
        const auto wide = value.get<std::int64_t>();
        if (wide > std::numeric_limits<int>::max() || wide < std::numeric_limits<int>::min()) {
            throw DecodingError("field '" + key + "' out of range: " + value.dump());
        }
        return static_cast<int>(wide);
    }

    inline const nlohmann::json &RequireArray(const nlohmann::json &js, const std::string &key) {
        const auto &value = Required(js, key);
        if (!value.is_array()) throw WrongType(key, "array", value);
        return value;
    }

    inline std::vector<std::string> RequireStringArray(const nlohmann::json &js, const std::string &key) {
        const auto &values = RequireArray(js, key);
        std::vector<std::string> out;
        out.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); i++) {
            if (!values[i].is_string()) {
                throw WrongType(key + "[" + std::to_string(i) + "]", "string", values[i]);
            }
            out.push_back(values[i].get<std::string>());
        }
        return out;
    }

}

#endif //DOMAIN_JSON_FIELDS_HPP
