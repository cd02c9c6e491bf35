#ifndef DOMAIN_FETCHABLE_HPP
#define DOMAIN_FETCHABLE_HPP

#include <algorithm>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/strings.hpp"
#include "protect_error.hpp"

namespace domain {

    template <typename T>
    concept CsvConvertible = requires(const T &resource) {
        { T::csv_header } -> std::convertible_to<std::string_view>;
        { resource.CsvDescription() } -> std::convertible_to<std::string>;
    };

    /*
     * A resource kind served by one collection endpoint of the integration api. Anything
     * satisfying this can go through ProtectService's fetch-and-cache pipeline:
     *  - url_suffix names the collection endpoint under the api base url
     *  - id and name are server assigned strings
     *  - decoding comes from an ADL-visible from_json(const nlohmann::json &, T &)
     */
    template <typename T>
    concept Fetchable = CsvConvertible<T> && std::default_initializable<T> &&
        requires(const T &resource, const nlohmann::json &js) {
            { T::url_suffix } -> std::convertible_to<std::string_view>;
            { resource.id } -> std::convertible_to<std::string>;
            { resource.name } -> std::convertible_to<std::string>;
            { js.get<T>() } -> std::same_as<T>;
        };

    /*
     * Decodes a json array into resources, preserving server order. Any failure (malformed json,
     * not an array, a bad element) rejects the whole buffer; nothing is partially accepted.
     */
    template <Fetchable T>
    std::vector<T> ParseCollection(const std::string &data) {
        const std::string kind(T::url_suffix);
        nlohmann::json js;
        try {
            js = nlohmann::json::parse(data);
        } catch (const nlohmann::json::parse_error &e) {
            // e.what() carries the byte offset
            throw DecodingError(kind + ": " + e.what());
        }
        if (!js.is_array()) {
            throw DecodingError(kind + ": expected a json array, got " + std::string(js.type_name()));
        }
        std::vector<T> resources;
        resources.reserve(js.size());
        for (std::size_t i = 0; i < js.size(); i++) {
            try {
                resources.push_back(js[i].get<T>());
            } catch (const DecodingError &e) {
                throw DecodingError(kind + "[" + std::to_string(i) + "]: " + e.what());
            } catch (const std::exception &e) {
                // json library errors, or anything else a from_json throws
                throw DecodingError(kind + "[" + std::to_string(i) + "]: " + e.what());
            }
        }
        return resources;
    }

    // a resource's own Description() when it has one, otherwise "<name> [<id>]"
    template <Fetchable T>
    std::string Describe(const T &resource) {
        if constexpr (requires { { resource.Description() } -> std::convertible_to<std::string>; }) {
            return resource.Description();
        } else {
            return resource.name + " [" + resource.id + "]";
        }
    }

    // header line followed by one row per resource
    template <CsvConvertible T>
    std::string ToCsv(const std::vector<T> &resources) {
        std::string out(T::csv_header);
        for (const auto &resource : resources) {
            out += "\n";
            out += resource.CsvDescription();
        }
        return out;
    }

    // first resource, in collection order, whose name matches ignoring ascii case
    template <Fetchable T>
    std::optional<std::string> FindIdByName(const std::vector<T> &resources, const std::string &name) {
        const auto wanted = ToLower(name);
        const auto found = std::find_if(resources.begin(), resources.end(), [&wanted](const T &resource) {
            return ToLower(resource.name) == wanted;
        });
        if (found == resources.end()) {
            return std::nullopt;
        }
        return found->id;
    }

    template <Fetchable T>
    std::optional<std::string> FindNameById(const std::vector<T> &resources, const std::string &id) {
        const auto found = std::find_if(resources.begin(), resources.end(), [&id](const T &resource) {
            return resource.id == id;
        });
        if (found == resources.end()) {
            return std::nullopt;
        }
        return found->name;
    }

    /*
     * Resources order and compare by name only: two cameras with the same name and different
     * ids are equal. Lookups never rely on this; they walk the collection in server order.
     */
    template <Fetchable T>
    bool operator<(const T &lhs, const T &rhs) {
        return lhs.name < rhs.name;
    }

    template <Fetchable T>
    bool operator==(const T &lhs, const T &rhs) {
        return lhs.name == rhs.name;
    }

}

#endif //DOMAIN_FETCHABLE_HPP
