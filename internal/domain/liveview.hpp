#ifndef DOMAIN_LIVEVIEW_HPP
#define DOMAIN_LIVEVIEW_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fetchable.hpp"

namespace domain {

    // one layout cell; cameras are ids only and are not checked against the camera collection
    struct Slot {
        std::vector<std::string> cameras;
        std::string cycle_mode;
        // seconds
        int cycle_interval = 0;
    };

    struct Liveview {
        static constexpr const char *url_suffix = "liveviews";
        static constexpr const char *csv_header = "name,id,isDefault,isGlobal,owner,layout";

        std::string id;
        std::string name;
        bool is_default = false;
        bool is_global = false;
        // opaque user reference
        std::string owner;
        // grid code
        int layout = 0;
        std::vector<Slot> slots;

        [[nodiscard]] std::string Description() const;
        [[nodiscard]] std::string CsvDescription() const;
    };

    void from_json(const nlohmann::json &js, Slot &slot);
    void to_json(nlohmann::json &js, const Slot &slot);

    void from_json(const nlohmann::json &js, Liveview &liveview);
    void to_json(nlohmann::json &js, const Liveview &liveview);

}

#endif //DOMAIN_LIVEVIEW_HPP
