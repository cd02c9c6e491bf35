#ifndef DOMAIN_VIEWPORT_HPP
#define DOMAIN_VIEWPORT_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "fetchable.hpp"

namespace domain {

    // a viewer device; the api calls the collection "viewers"
    struct Viewport {
        static constexpr const char *url_suffix = "viewers";
        static constexpr const char *csv_header = "name,id,liveview,state,streamLimit";

        std::string id;
        std::string name;
        // id of the liveview currently on screen
        std::string liveview;
        std::string state;
        int stream_limit = 0;

        [[nodiscard]] std::string Description() const;
        [[nodiscard]] std::string CsvDescription() const;
    };

    void from_json(const nlohmann::json &js, Viewport &viewport);
    void to_json(nlohmann::json &js, const Viewport &viewport);

}

#endif //DOMAIN_VIEWPORT_HPP
