/**
 * @file test_breed_registry.cpp
 * @brief Unit tests for BreedRegistry, stock breeds and breed files
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <pupkit/breed_registry.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

using namespace pupkit;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;

namespace {

json beagle() {
    return json{
        {"breedId", "beagle"},
        {"heightScale", 0.6},
        {"torsoAspectRatio", 1.5},
        {"legLengthRatio", 0.36},
        {"earsFloppy", true},
        {"primaryColor", "#A0522D"},
        {"secondaryColor", "#FFFFFF"},
        {"accentColor", 0x1A0A00},
        {"animationSpeedMultiplier", 1.1},
    };
}

json document(const json& entry) {
    return json{{"breeds", json::array({entry})}};
}

std::string writeTemp(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

} // namespace

TEST_CASE("Stock breeds", "[registry]") {
    const BreedRegistry& registry = BreedRegistry::builtin();

    REQUIRE(registry.size() == 11);
    for (const char* id : {"goldenRetriever", "germanShepherd", "dachshund", "corgi", "husky",
                           "shibaInu", "bulldog", "pug", "poodle", "dalmatian", "borderCollie"}) {
        INFO(id);
        REQUIRE(registry.contains(id));
        std::string error;
        REQUIRE(validateSkeleton(registry.configFor(id), error));
        REQUIRE(registry.configFor(id).breedId == id);
    }

    SECTION("German Shepherd is the reference dog") {
        REQUIRE(registry.configFor("germanShepherd").heightScale == 1.0f);
    }

    SECTION("breed proportions") {
        const BreedSkeleton& dachshund = registry.configFor("dachshund");
        const BreedSkeleton& golden = registry.configFor("goldenRetriever");
        const BreedSkeleton& shepherd = registry.configFor("germanShepherd");
        REQUIRE(dachshund.torsoAspectRatio > golden.torsoAspectRatio);
        REQUIRE(dachshund.legLengthRatio < golden.legLengthRatio);
        REQUIRE(dachshund.legLengthRatio < shepherd.legLengthRatio);
        REQUIRE(registry.configFor("bulldog").snoutLengthRatio < golden.snoutLengthRatio);
    }

    SECTION("breed flags") {
        REQUIRE(registry.configFor("goldenRetriever").earsFloppy);
        REQUIRE_FALSE(registry.configFor("germanShepherd").earsFloppy);
        REQUIRE(registry.configFor("husky").tailCurledOverBack);
        REQUIRE(registry.configFor("pug").hasFlatFace);
        REQUIRE(registry.configFor("dalmatian").hasSpots);
        REQUIRE(registry.configFor("poodle").hasPoodleFuzz);
    }

    SECTION("ids are sorted") {
        auto ids = registry.breedIds();
        REQUIRE(ids.size() == registry.size());
        REQUIRE(std::is_sorted(ids.begin(), ids.end()));
    }
}

TEST_CASE("Registry lookup", "[registry]") {
    SECTION("same id returns the same instance") {
        REQUIRE(&configFor("corgi") == &configFor("corgi"));
        REQUIRE(&configFor("corgi") == &BreedRegistry::builtin().configFor("corgi"));
    }

    SECTION("unknown id throws and names the registered ids") {
        REQUIRE_THROWS_AS(configFor("wolf"), std::runtime_error);
        REQUIRE_THROWS_WITH(configFor("wolf"),
                            ContainsSubstring("'wolf'") && ContainsSubstring("goldenRetriever"));
    }

    SECTION("lookup is case sensitive") {
        REQUIRE_THROWS_AS(configFor("Corgi"), std::runtime_error);
    }
}

TEST_CASE("Registering breeds", "[registry]") {
    BreedRegistry registry;
    REQUIRE(registry.size() == 0);

    BreedSkeleton custom;
    custom.breedId = "mutt";

    const BreedSkeleton& stored = registry.registerBreed(custom);
    REQUIRE(&stored == &registry.configFor("mutt"));

    SECTION("duplicate id is rejected") {
        REQUIRE_THROWS_AS(registry.registerBreed(custom), std::runtime_error);
    }

    SECTION("out-of-range skeleton is rejected") {
        BreedSkeleton tiny;
        tiny.breedId = "tiny";
        tiny.heightScale = 0.1f;
        REQUIRE_THROWS_WITH(registry.registerBreed(tiny), ContainsSubstring("heightScale"));
        REQUIRE_FALSE(registry.contains("tiny"));
    }

    SECTION("empty id is rejected") {
        BreedSkeleton unnamed;
        REQUIRE_THROWS_AS(registry.registerBreed(unnamed), std::runtime_error);
    }

    SECTION("references survive later registrations") {
        for (int i = 0; i < 50; ++i) {
            BreedSkeleton s;
            s.breedId = "extra" + std::to_string(i);
            registry.registerBreed(s);
        }
        REQUIRE(&stored == &registry.configFor("mutt"));
    }

    SECTION("moving the registry keeps borrowed skeletons") {
        BreedRegistry moved(std::move(registry));
        REQUIRE(&stored == &moved.configFor("mutt"));
    }

    SECTION("a registry cannot be assigned over") {
        STATIC_REQUIRE(std::is_move_constructible_v<BreedRegistry>);
        STATIC_REQUIRE_FALSE(std::is_move_assignable_v<BreedRegistry>);
        STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<BreedRegistry>);
    }
}

TEST_CASE("Skeleton validation ranges", "[registry]") {
    BreedSkeleton s = configFor("goldenRetriever");
    std::string error;

    SECTION("speed multiplier bounds") {
        s.animationSpeedMultiplier = 2.5f;
        REQUIRE_FALSE(validateSkeleton(s, error));
        REQUIRE_THAT(error, ContainsSubstring("animationSpeedMultiplier"));
    }

    SECTION("zero torso aspect is rejected") {
        s.torsoAspectRatio = 0.0f;
        REQUIRE_FALSE(validateSkeleton(s, error));
    }

    SECTION("NaN is rejected") {
        s.headSizeRatio = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_FALSE(validateSkeleton(s, error));
    }

    SECTION("inclusive bounds are accepted") {
        s.heightScale = 0.4f;
        s.legLengthRatio = 0.7f;
        s.animationSpeedMultiplier = 0.5f;
        REQUIRE(validateSkeleton(s, error));
    }
}

TEST_CASE("Breed documents", "[registry]") {
    BreedRegistry registry = BreedRegistry::withBuiltins();
    const size_t stock = registry.size();

    SECTION("valid document adds breeds") {
        REQUIRE(registry.loadJson(document(beagle())) == 1);

        const BreedSkeleton& b = registry.configFor("beagle");
        REQUIRE(b.heightScale == 0.6f);
        REQUIRE(b.earsFloppy);
        REQUIRE_FALSE(b.hasSpots);
        REQUIRE(b.primaryColor.toHex() == 0xA0522D);
        REQUIRE(b.accentColor.toHex() == 0x1A0A00);
        // Omitted ratios keep their defaults
        REQUIRE(b.headSizeRatio == BreedSkeleton{}.headSizeRatio);
    }

    SECTION("out-of-range breed is rejected") {
        json bad = beagle();
        bad["legLengthRatio"] = 0.95;
        REQUIRE_THROWS_WITH(registry.loadJson(document(bad)),
                            ContainsSubstring("breeds[0]") && ContainsSubstring("legLengthRatio"));
        REQUIRE(registry.size() == stock);
    }

    SECTION("one bad entry leaves the registry untouched") {
        json bad = beagle();
        bad["breedId"] = "husky";
        json doc = json::object();
        doc["breeds"] = json::array({beagle(), bad});
        REQUIRE_THROWS_WITH(registry.loadJson(doc), ContainsSubstring("breeds[1]"));
        REQUIRE_FALSE(registry.contains("beagle"));
    }

    SECTION("duplicate ids within a document are rejected") {
        json doc = json::object();
        doc["breeds"] = json::array({beagle(), beagle()});
        REQUIRE_THROWS_WITH(registry.loadJson(doc), ContainsSubstring("duplicate"));
        REQUIRE_FALSE(registry.contains("beagle"));
    }

    SECTION("malformed fields") {
        json wrongType = beagle();
        wrongType["heightScale"] = "tall";
        REQUIRE_THROWS_WITH(registry.loadJson(document(wrongType)), ContainsSubstring("heightScale"));

        json badColor = beagle();
        badColor["primaryColor"] = "#GG0000";
        REQUIRE_THROWS_WITH(registry.loadJson(document(badColor)), ContainsSubstring("primaryColor"));

        json missingColor = beagle();
        missingColor.erase("secondaryColor");
        REQUIRE_THROWS_WITH(registry.loadJson(document(missingColor)),
                            ContainsSubstring("secondaryColor"));

        json badFlag = beagle();
        badFlag["hasSpots"] = 1;
        REQUIRE_THROWS_WITH(registry.loadJson(document(badFlag)), ContainsSubstring("hasSpots"));

        json bigHex = beagle();
        bigHex["accentColor"] = 0x1000000;
        REQUIRE_THROWS_WITH(registry.loadJson(document(bigHex)), ContainsSubstring("0xRRGGBB"));
    }

    SECTION("document shape is checked") {
        json notObject = json::array();
        json wrongKey = json::object();
        wrongKey["dogs"] = json::array();

        REQUIRE_THROWS_AS(registry.loadJson(notObject), std::runtime_error);
        REQUIRE_THROWS_AS(registry.loadJson(wrongKey), std::runtime_error);
        REQUIRE_THROWS_AS(registry.loadJson(document(42)), std::runtime_error);
        REQUIRE_THROWS_AS(registry.loadJson(document(json::object())), std::runtime_error);
        REQUIRE(registry.size() == stock);
    }
}

TEST_CASE("Breed files", "[registry]") {
    BreedRegistry registry = BreedRegistry::withBuiltins();
    std::string error;

    SECTION("file loads") {
        std::string path = writeTemp("pupkit_breeds_ok.json",
                                     document(beagle()).dump(2));
        REQUIRE(registry.loadFile(path, error));
        REQUIRE(registry.contains("beagle"));
        std::filesystem::remove(path);
    }

    SECTION("missing file reports an error") {
        REQUIRE_FALSE(registry.loadFile("/nonexistent/pupkit/breeds.json", error));
        REQUIRE_THAT(error, ContainsSubstring("Cannot open"));
    }

    SECTION("invalid JSON reports an error") {
        std::string path = writeTemp("pupkit_breeds_bad.json", "{ \"breeds\": [ ");
        REQUIRE_FALSE(registry.loadFile(path, error));
        REQUIRE_THAT(error, ContainsSubstring("parse"));
        std::filesystem::remove(path);
    }

    SECTION("invalid breed reports an error") {
        json bad = beagle();
        bad["heightScale"] = 3.0;
        std::string path = writeTemp("pupkit_breeds_range.json",
                                     document(bad).dump());
        REQUIRE_FALSE(registry.loadFile(path, error));
        REQUIRE_THAT(error, ContainsSubstring("heightScale"));
        REQUIRE_FALSE(registry.contains("beagle"));
        std::filesystem::remove(path);
    }

    SECTION("bundled extra breeds load") {
        REQUIRE(registry.loadFile(std::string(PUPKIT_TEST_DATA_DIR) + "/breeds/extra_breeds.json", error));
        REQUIRE(registry.contains("beagle"));
    }
}
