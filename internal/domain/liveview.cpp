#include "liveview.hpp"

#include "json_fields.hpp"
#include "utils/strings.hpp"

namespace domain {

    std::string Liveview::Description() const {
        return Padded(name, 17) + " <" + id + "> " + (is_default ? "(default)" : "");
    }

    std::string Liveview::CsvDescription() const {
        return name + "," + id + "," + BoolString(is_default) + "," + BoolString(is_global) + "," +
            owner + "," + std::to_string(layout);
    }

    void from_json(const nlohmann::json &js, Slot &slot) {
        using namespace json_fields;
        slot.cameras = RequireStringArray(js, "cameras");
        slot.cycle_mode = RequireString(js, "cycleMode");
        slot.cycle_interval = RequireInt(js, "cycleInterval");
    }

    void to_json(nlohmann::json &js, const Slot &slot) {
        js = nlohmann::json{
            {"cameras", slot.cameras},
            {"cycleMode", slot.cycle_mode},
            {"cycleInterval", slot.cycle_interval}
        };
    }

    void from_json(const nlohmann::json &js, Liveview &liveview) {
        using namespace json_fields;
        liveview.id = RequireString(js, "id");
        liveview.name = RequireString(js, "name");
        liveview.is_default = RequireBool(js, "isDefault");
        liveview.is_global = RequireBool(js, "isGlobal");
        liveview.owner = RequireString(js, "owner");
        liveview.layout = RequireInt(js, "layout");

        const auto &slots = RequireArray(js, "slots");
        liveview.slots.clear();
        liveview.slots.reserve(slots.size());
        for (std::size_t i = 0; i < slots.size(); i++) {
            try {
                liveview.slots.push_back(slots[i].get<Slot>());
            } catch (const DecodingError &e) {
                throw DecodingError("slots[" + std::to_string(i) + "]: " + e.what());
            }
        }
    }

    void to_json(nlohmann::json &js, const Liveview &liveview) {
        js = nlohmann::json{
            {"id", liveview.id},
            {"name", liveview.name},
            {"isDefault", liveview.is_default},
            {"isGlobal", liveview.is_global},
            {"owner", liveview.owner},
            {"layout", liveview.layout},
            {"slots", liveview.slots}
        };
    }

}
