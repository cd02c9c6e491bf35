#include "viewport.hpp"

#include "json_fields.hpp"
#include "utils/strings.hpp"

namespace domain {

    std::string Viewport::Description() const {
        return Padded(name, 17) + " <" + id + "> (viewing '" + liveview + "')";
    }

    std::string Viewport::CsvDescription() const {
        return name + "," + id + "," + liveview + "," + state + "," + std::to_string(stream_limit);
    }

    void from_json(const nlohmann::json &js, Viewport &viewport) {
        using namespace json_fields;
        viewport.id = RequireString(js, "id");
        viewport.name = RequireString(js, "name");
        viewport.liveview = RequireString(js, "liveview");
        viewport.state = RequireString(js, "state");
        viewport.stream_limit = RequireInt(js, "streamLimit");
    }

    void to_json(nlohmann::json &js, const Viewport &viewport) {
        js = nlohmann::json{
            {"id", viewport.id},
            {"name", viewport.name},
            {"liveview", viewport.liveview},
            {"state", viewport.state},
            {"streamLimit", viewport.stream_limit}
        };
    }

}
