#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include "domain/liveview.hpp"

TEST_CASE("DOMAIN_LIVEVIEW-Decode_object") {
    const auto liveview = nlohmann::json::parse(R"({
        "id": "lv123",
        "name": "Main View",
        "isDefault": true,
        "isGlobal": false,
        "owner": "admin",
        "layout": 4,
        "slots": [
            { "cameras": ["cam1", "cam2"], "cycleMode": "auto", "cycleInterval": 30 }
        ]
    })").get<domain::Liveview>();

    CHECK(liveview.id == "lv123");
    CHECK(liveview.name == "Main View");
    CHECK(liveview.is_default);
    CHECK_FALSE(liveview.is_global);
    CHECK(liveview.owner == "admin");
    CHECK(liveview.layout == 4);
    REQUIRE(liveview.slots.size() == 1);
    CHECK(liveview.slots[0].cameras == std::vector<std::string>{"cam1", "cam2"});
    CHECK(liveview.slots[0].cycle_mode == "auto");
    CHECK(liveview.slots[0].cycle_interval == 30);
}

TEST_CASE("DOMAIN_LIVEVIEW-Slot_camera_ids_are_not_checked") {
    const auto liveviews = domain::ParseCollection<domain::Liveview>(R"([{
        "id": "lv1", "name": "Grid", "isDefault": false, "isGlobal": true, "owner": "nobody",
        "layout": 9, "slots": [ { "cameras": ["does-not-exist"], "cycleMode": "time", "cycleInterval": 0 } ]
    }])");
    REQUIRE(liveviews.size() == 1);
    CHECK(liveviews[0].slots[0].cameras.front() == "does-not-exist");
}

TEST_CASE("DOMAIN_LIVEVIEW-Bad_slot_is_a_decoding_error") {
    try {
        domain::ParseCollection<domain::Liveview>(R"([{
            "id": "lv1", "name": "Grid", "isDefault": false, "isGlobal": true, "owner": "o",
            "layout": 9, "slots": [
                { "cameras": [], "cycleMode": "time", "cycleInterval": 5 },
                { "cameras": ["cam1", 2], "cycleMode": "time", "cycleInterval": 5 }
            ]
        }])");
        FAIL("expected DecodingError");
    } catch (const domain::DecodingError &e) {
        const std::string message = e.what();
        CHECK(message.find("liveviews[0]") != std::string::npos);
        CHECK(message.find("slots[1]") != std::string::npos);
        CHECK(message.find("cameras[1]") != std::string::npos);
    }
}

TEST_CASE("DOMAIN_LIVEVIEW-Csv_row") {
    const domain::Liveview liveview{
        .id = "lv123",
        .name = "Test View",
        .is_default = true,
        .is_global = false,
        .owner = "admin",
        .layout = 2,
        .slots = {}
    };

    CHECK(liveview.CsvDescription() == "Test View,lv123,true,false,admin,2");
    CHECK(std::string(domain::Liveview::csv_header) == "name,id,isDefault,isGlobal,owner,layout");
}

TEST_CASE("DOMAIN_LIVEVIEW-Description_marks_default") {
    const domain::Liveview default_view{ .id = "lv1", .name = "Default", .is_default = true, .owner = "admin", .layout = 1 };
    const domain::Liveview normal_view{ .id = "lv2", .name = "Normal", .is_default = false, .owner = "admin", .layout = 1 };

    CHECK(default_view.Description() == "Default           <lv1> (default)");
    CHECK(normal_view.Description() == "Normal            <lv2> ");
    CHECK(normal_view.Description().find("(default)") == std::string::npos);
}

TEST_CASE("DOMAIN_LIVEVIEW-Round_trip") {
    const std::string original = R"([{
        "id": "lv1", "name": "Main", "isDefault": true, "isGlobal": false, "owner": "admin", "layout": 4,
        "slots": [ { "cameras": ["cam1"], "cycleMode": "motion", "cycleInterval": 15 } ]
    }])";
    const auto first = domain::ParseCollection<domain::Liveview>(original);
    const auto second = domain::ParseCollection<domain::Liveview>(nlohmann::json(first).dump());

    REQUIRE(second.size() == 1);
    CHECK(second[0].slots.size() == 1);
    CHECK(second[0].slots[0].cameras == first[0].slots[0].cameras);
    CHECK(second[0].slots[0].cycle_interval == 15);
    CHECK(nlohmann::json(second) == nlohmann::json::parse(original));
}
