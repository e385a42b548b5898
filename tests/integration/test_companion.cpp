/**
 * @file test_companion.cpp
 * @brief Integration tests: companion update, render and breed switching
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <pupkit/pupkit.h>
#include <string>
#include <vector>

using namespace pupkit;
using Catch::Matchers::ContainsSubstring;

namespace {

int inkedPixels(const Canvas& canvas) {
    int count = 0;
    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            glm::vec4 p = canvas.pixel(x, y);
            if (p.r < 0.98f || p.g < 0.98f || p.b < 0.98f) {
                ++count;
            }
        }
    }
    return count;
}

} // namespace

TEST_CASE("Companion construction", "[integration][companion]") {
    SECTION("stock breed starts idle") {
        Companion dog(BreedRegistry::builtin(), "goldenRetriever");
        REQUIRE(dog.state() == DogAnimationState::Idle);
        REQUIRE(dog.expression() == DogExpression::Neutral);
        REQUIRE(dog.skeleton().breedId == "goldenRetriever");
        REQUIRE(&dog.skeleton() == &configFor("goldenRetriever"));
    }

    SECTION("unknown breed throws") {
        REQUIRE_THROWS_WITH(Companion(BreedRegistry::builtin(), "wolf"), ContainsSubstring("wolf"));
    }

    SECTION("invalid settings throw") {
        Companion::Settings settings;
        settings.blendDuration = -1.0f;
        REQUIRE_THROWS_AS(Companion(BreedRegistry::builtin(), "pug", settings), std::runtime_error);
    }
}

TEST_CASE("Companion frame loop", "[integration][companion]") {
    Companion dog(BreedRegistry::builtin(), "corgi");
    Canvas canvas(200, 200);
    const glm::vec2 size(200.0f, 200.0f);

    REQUIRE(dog.needsRepaint());

    dog.update(1.0f / 30.0f);
    canvas.clear(1.0f, 1.0f, 1.0f, 1.0f);
    dog.render(canvas, size);

    REQUIRE(inkedPixels(canvas) > 500);
    REQUIRE(canvas.stateDepth() == 0);

    SECTION("no repaint until the pose moves") {
        REQUIRE_FALSE(dog.needsRepaint());
        dog.update(0.1f);
        REQUIRE(dog.needsRepaint());
    }

    SECTION("zero dt keeps the last frame") {
        dog.update(0.0f);
        REQUIRE_FALSE(dog.needsRepaint());
    }

    SECTION("expression change needs a repaint") {
        dog.applyMood("nap");
        REQUIRE(dog.needsRepaint());
    }

    SECTION("every state renders a finite pose") {
        for (int i = 0; i < kAnimationStateCount; ++i) {
            auto state = static_cast<DogAnimationState>(i);
            dog.animation().setAnimationState(state);
            for (int f = 0; f < 20; ++f) {
                dog.update(0.05f);
                INFO(stateName(state) << " frame " << f);
                REQUIRE(dog.transform().isFinite());
            }
            canvas.clear(1.0f, 1.0f, 1.0f, 1.0f);
            dog.render(canvas, size);
            REQUIRE(inkedPixels(canvas) > 0);
        }
    }
}

TEST_CASE("Companion breed switching", "[integration][companion]") {
    Companion dog(BreedRegistry::builtin(), "husky");

    std::vector<std::pair<DogAnimationState, DogAnimationState>> changes;
    int id = dog.addStateListener([&changes](DogAnimationState from, DogAnimationState to) {
        changes.emplace_back(from, to);
    });
    REQUIRE(id != 0);

    dog.interaction().onTap();
    REQUIRE(changes.size() == 1);

    SECTION("new breed starts idle with the last mood re-applied") {
        dog.applyMood("zoomies");
        REQUIRE(dog.state() == DogAnimationState::Walking);

        dog.setBreed("dachshund");
        REQUIRE(dog.skeleton().breedId == "dachshund");
        REQUIRE(dog.state() == DogAnimationState::Walking);
        REQUIRE(dog.lastMood() == "zoomies");
    }

    SECTION("without a mood the new breed is idle") {
        dog.setBreed("pug");
        REQUIRE(dog.state() == DogAnimationState::Idle);
        REQUIRE(dog.needsRepaint());
    }

    SECTION("listeners survive a rebuild") {
        dog.setBreed("bulldog");
        size_t before = changes.size();
        dog.interaction().onLongPressStart();
        REQUIRE(changes.size() == before + 1);
        REQUIRE(changes.back().second == DogAnimationState::Petting);

        dog.removeStateListener(id);
        dog.interaction().onLongPressEnd();
        REQUIRE(changes.size() == before + 1);
    }

    SECTION("unknown breed leaves the companion unchanged") {
        const BreedSkeleton* before = &dog.skeleton();
        REQUIRE_THROWS_AS(dog.setBreed("wolf"), std::runtime_error);
        REQUIRE(&dog.skeleton() == before);
        REQUIRE(dog.state() == DogAnimationState::TailWag);
    }

    SECTION("same breed is a no-op") {
        dog.setBreed("husky");
        REQUIRE(dog.state() == DogAnimationState::TailWag);
    }

    SECTION("loaded breeds are usable") {
        BreedRegistry registry = BreedRegistry::withBuiltins();
        std::string error;
        REQUIRE(registry.loadFile(std::string(PUPKIT_TEST_DATA_DIR) + "/breeds/extra_breeds.json", error));

        Companion beagle(registry, "beagle");
        Canvas canvas(128, 128);
        beagle.update(0.5f);
        beagle.render(canvas, {128.0f, 128.0f});
        REQUIRE(canvas.stats().fills > 0);
    }
}

TEST_CASE("Scripted session", "[integration][companion]") {
    Companion::Settings settings;
    settings.blendDuration = 0.2f;
    Companion dog(BreedRegistry::builtin(), "borderCollie", settings);

    GestureScript script;
    std::string error;
    REQUIRE(GestureScript::loadFile(std::string(PUPKIT_TEST_DATA_DIR) + "/scripts/demo.json", script, error));

    int notified = 0;
    dog.addStateListener([&notified](DogAnimationState, DogAnimationState) { ++notified; });

    Canvas canvas(160, 160);
    const float dt = 1.0f / 30.0f;
    size_t dispatched = 0;
    int frames = static_cast<int>(script.duration() / dt) + 30;
    for (int i = 0; i < frames; ++i) {
        dispatched += script.advance(dt, dog);
        dog.update(dt);
        REQUIRE(dog.transform().isFinite());
        if (dog.needsRepaint()) {
            canvas.clear(1.0f, 1.0f, 1.0f, 1.0f);
            dog.render(canvas, {160.0f, 160.0f});
        }
    }

    REQUIRE(script.finished());
    REQUIRE(dispatched == script.events().size());
    REQUIRE(notified > 0);
    REQUIRE(canvas.stateDepth() == 0);
}
