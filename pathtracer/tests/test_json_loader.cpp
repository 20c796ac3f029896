/**
 * @brief JSON loader unit tests for camera settings, materials, objects, and validation.
 * Verifies successful parsing, defaults, material references, and rejection of bad input.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <string>
#include "json_loader.h"
#include "scene.h"
#include "camera.h"
#include "material.h"

TEST_CASE("JSON scene loading", "[json][loader]") {
    /// Valid scene: camera, render settings, named and inline materials, three shapes.
    const std::string testJson = R"({
        "camera": {
            "vfov": 40,
            "from": [0, 1, 3],
            "at": [0, 0, -1],
            "up": [0, 1, 0],
            "aperture": 0.05,
            "focus": 4.0,
            "background": { "type": "gradient", "top": [0.2, 0.3, 0.9], "bottom": [1, 1, 1] }
        },
        "render": { "width": 64, "aspect": 2.0, "samples": 8, "depth": 6 },
        "materials": [
            { "id": "ground", "material": { "type": "lambert", "color": [0.8, 0.8, 0.0] } },
            { "id": "chrome", "material": { "type": "metal", "color": [0.9, 0.9, 0.9], "fuzz": 0.1 } },
            { "id": "glass",  "material": { "type": "glass", "ior": 1.5 } },
            { "id": "coated", "material": { "type": "layered", "inner": "ground", "outer": "glass" } },
            { "id": "satin",  "material": { "type": "mixed", "diff": "ground", "spec": "chrome", "weight": 0.7 } }
        ],
        "objects": [
            { "type": "sphere", "pos": [0, 0, -1], "r": 0.5, "material": "coated" },
            { "type": "plane", "pos": [0, -0.5, 0], "u": [1, 0, 0], "v": [0, 0, -1], "material": "satin" },
            { "type": "quad", "pos": [-1, 2, -2], "u": [2, 0, 0], "v": [0, 0, 2],
              "material": { "type": "light", "emit": [4, 4, 4] } }
        ]
    })";

    Scene scene;

    SECTION("Valid JSON loads successfully") {
        REQUIRE(jsonio::load_scene_from_json_text(testJson, scene));

        REQUIRE(scene.world);
        REQUIRE(scene.world->size() == 3);
        REQUIRE(scene.materials.size() == 5);

        const CameraConfig& cfg = scene.camera;
        REQUIRE(cfg.vfov == Catch::Approx(40.0));
        REQUIRE(cfg.look_from.z == Catch::Approx(3.0));
        REQUIRE(cfg.aperture == Catch::Approx(0.05));
        REQUIRE(cfg.focus_dist == Catch::Approx(4.0));
        REQUIRE(cfg.background.top.b == Catch::Approx(0.9));
        REQUIRE(cfg.image_width == 64);
        REQUIRE(cfg.image_height == 32);
        REQUIRE(cfg.samples_per_pixel == 8);
        REQUIRE(cfg.max_depth == 6);
    }

    /// Composite materials point at the shared named children.
    SECTION("Material references resolve to shared instances") {
        REQUIRE(jsonio::load_scene_from_json_text(testJson, scene));
        auto mixed = std::dynamic_pointer_cast<const MixedMaterial>(scene.materials.at("satin"));
        REQUIRE(mixed);
        REQUIRE(mixed->weight == Catch::Approx(0.7));
        REQUIRE(mixed->diffuse == scene.materials.at("ground"));
        REQUIRE(mixed->specular == scene.materials.at("chrome"));

        auto layered = std::dynamic_pointer_cast<const LayeredMaterial>(scene.materials.at("coated"));
        REQUIRE(layered);
        REQUIRE(layered->outer == scene.materials.at("glass"));
        REQUIRE(layered->inner == scene.materials.at("ground"));
    }

    /// Omitted blocks keep CameraConfig defaults.
    SECTION("Defaults for missing camera and render blocks") {
        const std::string minimal = R"({
            "objects": [ { "type": "sphere", "pos": [0, 0, -1], "r": 0.5,
                           "material": { "type": "lambert", "color": [0.5, 0.5, 0.5] } } ]
        })";
        REQUIRE(jsonio::load_scene_from_json_text(minimal, scene));
        const CameraConfig defaults;
        REQUIRE(scene.camera.image_width == defaults.image_width);
        REQUIRE(scene.camera.image_height == defaults.image_height);
        REQUIRE(scene.camera.samples_per_pixel == defaults.samples_per_pixel);
        REQUIRE(scene.camera.background.kind == Background::Kind::Gradient);
        REQUIRE(scene.materials.empty());
    }

    SECTION("Explicit height wins over aspect") {
        const std::string sized = R"({
            "render": { "width": 10, "height": 7, "aspect": 2.0 },
            "objects": [ { "type": "sphere", "pos": [0, 0, -1], "r": 0.5,
                           "material": { "type": "lambert", "color": [0.5, 0.5, 0.5] } } ]
        })";
        REQUIRE(jsonio::load_scene_from_json_text(sized, scene));
        REQUIRE(scene.camera.image_height == 7);
    }

    SECTION("Black background") {
        const std::string dark = R"({
            "camera": { "background": { "type": "none" } },
            "objects": [ { "type": "sphere", "pos": [0, 0, -1], "r": 0.5,
                           "material": { "type": "light", "emit": [1, 1, 1] } } ]
        })";
        REQUIRE(jsonio::load_scene_from_json_text(dark, scene));
        REQUIRE(scene.camera.background.kind == Background::Kind::Black);
    }
}

/// Every malformed description raises SceneBuildError before rendering.
TEST_CASE("JSON scene validation", "[json][loader][error]") {
    Scene scene;
    const auto load = [&scene](const std::string& text) {
        return jsonio::load_scene_from_json_text(text, scene);
    };

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(load("{ \"objects\": [ "), SceneBuildError);
    }

    SECTION("Missing or empty object list") {
        REQUIRE_THROWS_AS(load(R"({ "camera": {} })"), SceneBuildError);
        REQUIRE_THROWS_AS(load(R"({ "objects": [] })"), SceneBuildError);
    }

    SECTION("Unknown object type") {
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "torus", "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
    }

    /// The object's type tag is checked before its material.
    SECTION("Unknown object type without material") {
        try {
            load(R"({ "objects": [ { "type": "torus", "pos": [0,0,0] } ] })");
            FAIL("load should have thrown");
        } catch (const SceneBuildError& e) {
            REQUIRE(std::string(e.what()).find("unknown object type") != std::string::npos);
        }
    }

    SECTION("Unknown material type") {
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0,0], "r": 1,
                                                   "material": { "type": "velvet" } } ] })"),
                          SceneBuildError);
    }

    SECTION("Unknown material id") {
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0,0], "r": 1, "material": "nope" } ] })"),
                          SceneBuildError);
    }

    SECTION("Duplicate material id") {
        REQUIRE_THROWS_AS(load(R"({
            "materials": [ { "id": "a", "material": { "type": "light", "emit": [1,1,1] } },
                           { "id": "a", "material": { "type": "light", "emit": [1,1,1] } } ],
            "objects": [ { "type": "sphere", "pos": [0,0,0], "r": 1, "material": "a" } ] })"),
                          SceneBuildError);
    }

    SECTION("Material reference cycle") {
        REQUIRE_THROWS_AS(load(R"({
            "materials": [ { "id": "a", "material": { "type": "mixed", "diff": "b", "spec": "b" } },
                           { "id": "b", "material": { "type": "layered", "inner": "a", "outer": "a" } } ],
            "objects": [ { "type": "sphere", "pos": [0,0,0], "r": 1, "material": "a" } ] })"),
                          SceneBuildError);
    }

    SECTION("Degenerate geometry") {
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "quad", "pos": [0,0,0], "u": [1,0,0], "v": [2,0,0],
                                                   "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0,0], "r": -1,
                                                   "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
    }

    SECTION("Wrong value types") {
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0], "r": 1,
                                                   "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
        REQUIRE_THROWS_AS(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0,0], "r": "big",
                                                   "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
    }

    SECTION("Invalid camera settings") {
        REQUIRE_THROWS_AS(load(R"({ "render": { "samples": 0 },
            "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                           "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
        REQUIRE_THROWS_AS(load(R"({ "camera": { "background": { "type": "starfield" } },
            "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                           "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
    }

    /// Image sizes are bounded, including heights derived from the aspect ratio.
    SECTION("Oversized image") {
        REQUIRE_THROWS_AS(load(R"({ "render": { "width": 400, "aspect": 1e-12 },
            "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                           "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
        REQUIRE_THROWS_AS(load(R"({ "render": { "width": 100000, "height": 10 },
            "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                           "material": { "type": "light", "emit": [1,1,1] } } ] })"),
                          SceneBuildError);
        REQUIRE(load(R"({ "render": { "width": 4096, "aspect": 1.0 },
            "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                           "material": { "type": "light", "emit": [1,1,1] } } ] })"));
        REQUIRE(scene.camera.image_height == 4096);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(jsonio::load_scene_from_json("/nonexistent/scene.json", scene), SceneBuildError);
    }

    /// A failed load leaves the previous scene untouched.
    SECTION("Output unchanged on failure") {
        REQUIRE(load(R"({ "objects": [ { "type": "sphere", "pos": [0,0,-1], "r": 1,
                                         "material": { "type": "light", "emit": [1,1,1] } } ] })"));
        REQUIRE_THROWS_AS(load("[]"), SceneBuildError);
        REQUIRE(scene.world->size() == 1);
    }
}
