#include "camera.hpp"

#include "json_fields.hpp"
#include "utils/strings.hpp"

namespace domain {

    std::string Camera::Description() const {
        return Padded(name, 17) + " <" + id + "> [" + state + "]";
    }

    std::string Camera::CsvDescription() const {
        return name + "," + id + "," + state + "," + BoolString(is_mic_enabled) + "," +
            std::to_string(mic_volume) + "," + video_mode + "," + hdr_type;
    }

    void from_json(const nlohmann::json &js, Camera &camera) {
        using namespace json_fields;
        camera.id = RequireString(js, "id");
        camera.name = RequireString(js, "name");
        camera.state = RequireString(js, "state");
        camera.is_mic_enabled = RequireBool(js, "isMicEnabled");
        camera.mic_volume = RequireInt(js, "micVolume");
        camera.video_mode = RequireString(js, "videoMode");
        camera.hdr_type = RequireString(js, "hdrType");
    }

    void to_json(nlohmann::json &js, const Camera &camera) {
        js = nlohmann::json{
            {"id", camera.id},
            {"name", camera.name},
            {"state", camera.state},
            {"isMicEnabled", camera.is_mic_enabled},
            {"micVolume", camera.mic_volume},
            {"videoMode", camera.video_mode},
            {"hdrType", camera.hdr_type}
        };
    }

}
