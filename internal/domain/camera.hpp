#ifndef DOMAIN_CAMERA_HPP
#define DOMAIN_CAMERA_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "fetchable.hpp"

namespace domain {

    struct Camera {
        static constexpr const char *url_suffix = "cameras";
        static constexpr const char *csv_header = "name,id,state,isMicEnabled,micVolume,videoMode,hdrType";

        std::string id;
        std::string name;
        // e.g. CONNECTED, DISCONNECTED
        std::string state;
        bool is_mic_enabled = false;
        // 0 - 100, not validated
        int mic_volume = 0;
        std::string video_mode;
        std::string hdr_type;

        [[nodiscard]] std::string Description() const;
        [[nodiscard]] std::string CsvDescription() const;
    };

    void from_json(const nlohmann::json &js, Camera &camera);
    void to_json(nlohmann::json &js, const Camera &camera);

}

#endif //DOMAIN_CAMERA_HPP
