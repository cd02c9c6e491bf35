#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/camera.hpp"
#include "domain/liveview.hpp"
#include "domain/viewport.hpp"

// declared in domain so the name-only operators are found by ADL
namespace domain {

    // smallest resource kind: no Description() of its own
    struct Sensor {
        static constexpr const char *url_suffix = "sensors";
        static constexpr const char *csv_header = "name,id";
        std::string id;
        std::string name;
        [[nodiscard]] std::string CsvDescription() const {
            return name + "," + id;
        }
    };

    void from_json(const nlohmann::json &js, Sensor &sensor) {
        sensor.id = js.at("id").get<std::string>();
        sensor.name = js.at("name").get<std::string>();
    }

    // decoder that fails outside the json library
    struct Doorbell {
        static constexpr const char *url_suffix = "doorbells";
        static constexpr const char *csv_header = "name,id";
        std::string id;
        std::string name;
        [[nodiscard]] std::string CsvDescription() const {
            return name + "," + id;
        }
    };

    void from_json(const nlohmann::json &js, Doorbell &doorbell) {
        doorbell.id = js.at("id").get<std::string>();
        doorbell.name = js.at("name").get<std::string>();
        if (doorbell.name.empty()) {
            throw std::invalid_argument("doorbell name must not be empty");
        }
    }

}

namespace {

    struct NotFetchable {
        std::string name;
    };

}

using domain::Sensor;

static_assert(domain::Fetchable<domain::Camera>);
static_assert(domain::Fetchable<domain::Liveview>);
static_assert(domain::Fetchable<domain::Viewport>);
static_assert(domain::Fetchable<Sensor>);
static_assert(!domain::Fetchable<NotFetchable>);
static_assert(!domain::Fetchable<domain::Slot>);

TEST_CASE("DOMAIN_FETCHABLE-Default_description") {
    const Sensor sensor{ "s1", "Door Contact" };
    CHECK(domain::Describe(sensor) == "Door Contact [s1]");
}

TEST_CASE("DOMAIN_FETCHABLE-Sort_by_name_bytewise") {
    std::vector<Sensor> sensors = {
        { "1", "beta" }, { "2", "Alpha" }, { "3", "alpha" }, { "4", "Beta" }
    };
    std::sort(sensors.begin(), sensors.end());
    // uppercase sorts before lowercase
    CHECK(sensors[0].name == "Alpha");
    CHECK(sensors[1].name == "Beta");
    CHECK(sensors[2].name == "alpha");
    CHECK(sensors[3].name == "beta");
}

TEST_CASE("DOMAIN_FETCHABLE-Equality_ignores_everything_but_name") {
    const domain::Viewport kitchen{ .id = "vp1", .name = "Kitchen", .liveview = "lv1", .state = "CONNECTED", .stream_limit = 4 };
    const domain::Viewport other_kitchen{ .id = "vp2", .name = "Kitchen", .liveview = "lv9", .state = "DISCONNECTED", .stream_limit = 1 };
    const domain::Viewport lounge{ .id = "vp1", .name = "Lounge", .liveview = "lv1", .state = "CONNECTED", .stream_limit = 4 };

    CHECK(kitchen == other_kitchen);
    CHECK_FALSE(kitchen == lounge);
    CHECK(kitchen < lounge);
}

TEST_CASE("DOMAIN_FETCHABLE-Parse_collection_errors") {
    SUBCASE("malformed json carries the byte offset") {
        try {
            domain::ParseCollection<Sensor>(R"([{"id": "s1", "name": )");
            FAIL("expected DecodingError");
        } catch (const domain::DecodingError &e) {
            const std::string message = e.what();
            CHECK(message.rfind("sensors: ", 0) == 0);
            CHECK(message.find("byte") != std::string::npos);
        }
    }
    SUBCASE("object instead of array") {
        CHECK_THROWS_WITH_AS(
            domain::ParseCollection<Sensor>(R"({"id": "s1", "name": "n"})"),
            "sensors: expected a json array, got object",
            domain::DecodingError
        );
    }
    SUBCASE("empty buffer") {
        CHECK_THROWS_AS(domain::ParseCollection<Sensor>(""), domain::DecodingError);
    }
    SUBCASE("library errors from a custom decoder are wrapped") {
        CHECK_THROWS_AS(domain::ParseCollection<Sensor>(R"([{"id": "s1"}])"), domain::DecodingError);
    }
    SUBCASE("element that is not an object") {
        try {
            domain::ParseCollection<domain::Camera>(R"([42])");
            FAIL("expected DecodingError");
        } catch (const domain::DecodingError &e) {
            CHECK(std::string(e.what()).find("cameras[0]") != std::string::npos);
        }
    }
}

TEST_CASE("DOMAIN_FETCHABLE-Any_element_failure_is_a_decoding_error") {
    try {
        domain::ParseCollection<domain::Doorbell>(R"([{"id": "d1", "name": "Porch"}, {"id": "d2", "name": ""}])");
        FAIL("expected DecodingError");
    } catch (const domain::DecodingError &e) {
        CHECK(std::string(e.what()) == "doorbells[1]: doorbell name must not be empty");
    }
}

TEST_CASE("DOMAIN_FETCHABLE-Empty_array") {
    CHECK(domain::ParseCollection<domain::Viewport>("[]").empty());
}

TEST_CASE("DOMAIN_FETCHABLE-To_csv") {
    const std::vector<Sensor> sensors = { { "s1", "Door" }, { "s2", "Window" } };
    CHECK(domain::ToCsv(sensors) == "name,id\nDoor,s1\nWindow,s2");
    CHECK(domain::ToCsv(std::vector<Sensor>{}) == "name,id");
}

TEST_CASE("DOMAIN_FETCHABLE-Find_helpers") {
    const std::vector<Sensor> sensors = { { "s1", "Door" }, { "s2", "DOOR" }, { "s3", "Window" } };
    CHECK(domain::FindIdByName(sensors, "door") == "s1");
    CHECK(domain::FindIdByName(sensors, "WINDOW") == "s3");
    CHECK_FALSE(domain::FindIdByName(sensors, "Garage").has_value());
    CHECK(domain::FindNameById(sensors, "s2") == "DOOR");
    CHECK_FALSE(domain::FindNameById(sensors, "S2").has_value());
}
