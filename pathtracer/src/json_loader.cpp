#include "json_loader.h"

// STL
#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Project headers
#include "core.h"
#include "camera.h"
#include "scene.h"
#include "geometry.h"
#include "material.h"

// JSON
#include <nlohmann/json.hpp>
using nlohmann::json;

namespace {

/// Largest accepted image width or height.
constexpr int kMaxImageSide = 32768;

/**
 * @brief Read key or fallback from a JSON object.
 * @param j Source object.
 * @param key Property to read.
 * @param fallback Value returned if key is absent.
 * @return Parsed value of T or fallback.
 */
template <typename T>
T get_or(const json& j, const char* key, const T& fallback) {
    if (!j.contains(key)) return fallback;
    return j.at(key).get<T>();
}

/// Fetch a required key or fail with the owning node's name.
const json& require(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw SceneBuildError(where + ": missing '" + key + "'");
    }
    return j.at(key);
}

/**
 * @brief Parse a JSON array[3] into Vec3.
 * @param arr JSON array with 3 numbers.
 * @return Vec3 filled from arr.
 */
inline Vec3 as_vec3(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw SceneBuildError("Expected array[3]");
    return Vec3(arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>());
}

/**
 * @brief Parse a JSON array[3] into linear RGB Color.
 * @param arr JSON array with 3 numbers.
 * @return Color filled from arr.
 */
inline Color as_rgb(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw SceneBuildError("Expected color array[3]");
    return Color(arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>());
}

/**
 * @brief Resolves material references and inline material definitions.
 * Named materials are built on first use, so declarations may reference each other
 * in any order; reference cycles are rejected.
 */
class MaterialResolver {
public:
    explicit MaterialResolver(const json& root) {
        if (!root.contains("materials")) return;
        const json& arr = root.at("materials");
        if (!arr.is_array()) throw SceneBuildError("'materials' must be an array");
        for (const auto& entry : arr) {
            const std::string id = require(entry, "id", "material entry").get<std::string>();
            if (!decls_.emplace(id, &require(entry, "material", "material '" + id + "'")).second) {
                throw SceneBuildError("duplicate material id: " + id);
            }
        }
    }

    /// Every declared material, built even if no object references it.
    std::map<std::string, std::shared_ptr<const Material>> build_all() {
        for (const auto& d : decls_) by_id(d.first);
        return built_;
    }

    /// Material from an id string or an inline object.
    std::shared_ptr<const Material> resolve(const json& ref) {
        if (ref.is_string()) return by_id(ref.get<std::string>());
        if (ref.is_object()) return build(ref);
        throw SceneBuildError("material must be an id string or an object");
    }

private:
    std::shared_ptr<const Material> by_id(const std::string& id) {
        auto done = built_.find(id);
        if (done != built_.end()) return done->second;

        auto decl = decls_.find(id);
        if (decl == decls_.end()) throw SceneBuildError("unknown material id: " + id);
        if (!pending_.insert(id).second) throw SceneBuildError("material reference cycle at: " + id);

        auto m = build(*decl->second);
        pending_.erase(id);
        built_.emplace(id, m);
        return m;
    }

    std::shared_ptr<const Material> build(const json& jm) {
        const std::string type = require(jm, "type", "material").get<std::string>();

        if (type == "lambert") {
            return std::make_shared<Lambertian>(as_rgb(require(jm, "color", "lambert")));
        }
        if (type == "metal") {
            return std::make_shared<Metal>(as_rgb(require(jm, "color", "metal")),
                                           get_or<double>(jm, "fuzz", 0.0));
        }
        if (type == "glass") {
            const double ior = require(jm, "ior", "glass").get<double>();
            if (!(ior > 0.0)) throw SceneBuildError("glass: ior must be positive");
            return std::make_shared<Dielectric>(ior);
        }
        if (type == "light") {
            return std::make_shared<DiffuseLight>(as_rgb(require(jm, "emit", "light")));
        }
        if (type == "mixed") {
            auto diff = resolve(require(jm, "diff", "mixed"));
            auto spec = resolve(require(jm, "spec", "mixed"));
            return std::make_shared<MixedMaterial>(diff, spec, get_or<double>(jm, "weight", 0.5));
        }
        if (type == "layered") {
            auto inner = resolve(require(jm, "inner", "layered"));
            auto outer = resolve(require(jm, "outer", "layered"));
            return std::make_shared<LayeredMaterial>(outer, inner);
        }
        throw SceneBuildError("unknown material type: " + type);
    }

    std::map<std::string, const json*> decls_;
    std::map<std::string, std::shared_ptr<const Material>> built_;
    std::set<std::string> pending_;
};

/**
 * @brief Build one primitive from an object node.
 * @param jo Object with "type", geometry fields, and "material".
 * @param mats Material resolver.
 * @return Constructed primitive.
 */
std::shared_ptr<const Primitive> parse_object(const json& jo, MaterialResolver& mats) {
    const std::string type = require(jo, "type", "object").get<std::string>();
    if (type != "sphere" && type != "plane" && type != "quad") {
        throw SceneBuildError("unknown object type: " + type);
    }
    auto mat = mats.resolve(require(jo, "material", type));

    try {
        if (type == "sphere") {
            return std::make_shared<Sphere>(as_vec3(require(jo, "pos", type)),
                                            require(jo, "r", type).get<double>(), mat);
        }
        if (type == "plane") {
            return std::make_shared<Plane>(as_vec3(require(jo, "pos", type)),
                                           as_vec3(require(jo, "u", type)),
                                           as_vec3(require(jo, "v", type)), mat);
        }
        if (type == "quad") {
            return std::make_shared<Quad>(as_vec3(require(jo, "pos", type)),
                                          as_vec3(require(jo, "u", type)),
                                          as_vec3(require(jo, "v", type)), mat);
        }
    } catch (const std::invalid_argument& e) {
        // degenerate geometry
        throw SceneBuildError(type + ": " + e.what());
    }
    throw SceneBuildError("unknown object type: " + type);
}

/**
 * @brief Parse "camera" and "render" blocks into camera settings.
 * @param root Root JSON object.
 * @param cfg Output configuration (defaults kept for missing keys).
 */
void parse_camera(const json& root, CameraConfig& cfg) {
    if (root.contains("camera")) {
        const json& j = root.at("camera");
        cfg.vfov       = get_or<double>(j, "vfov", cfg.vfov);
        if (j.contains("from")) cfg.look_from = as_vec3(j.at("from"));
        if (j.contains("at"))   cfg.look_at   = as_vec3(j.at("at"));
        if (j.contains("up"))   cfg.vup       = as_vec3(j.at("up"));
        cfg.aperture   = get_or<double>(j, "aperture", cfg.aperture);
        cfg.focus_dist = get_or<double>(j, "focus", cfg.focus_dist);

        if (j.contains("background")) {
            const json& jb = j.at("background");
            const std::string kind = require(jb, "type", "background").get<std::string>();
            if (kind == "gradient") {
                cfg.background.kind   = Background::Kind::Gradient;
                cfg.background.top    = as_rgb(require(jb, "top", "background"));
                cfg.background.bottom = as_rgb(require(jb, "bottom", "background"));
            } else if (kind == "none") {
                cfg.background.kind = Background::Kind::Black;
            } else {
                throw SceneBuildError("unknown background type: " + kind);
            }
        }
    }

    if (root.contains("render")) {
        const json& j = root.at("render");
        cfg.image_width = get_or<int>(j, "width", cfg.image_width);
        if (j.contains("height")) {
            cfg.image_height = j.at("height").get<int>();
        } else if (j.contains("aspect")) {
            const double aspect = j.at("aspect").get<double>();
            if (!(aspect > 0.0)) throw SceneBuildError("render.aspect must be positive");
            const double h = cfg.image_width / aspect;
            if (!(h <= kMaxImageSide)) throw SceneBuildError("render.aspect gives an image height above the limit");
            cfg.image_height = std::max(1, int(h));
        }
        if (cfg.image_width > kMaxImageSide || cfg.image_height > kMaxImageSide) {
            throw SceneBuildError("render size exceeds " + std::to_string(kMaxImageSide) + " pixels per side");
        }
        cfg.samples_per_pixel  = get_or<int>(j, "samples", cfg.samples_per_pixel);
        cfg.max_depth          = get_or<int>(j, "depth", cfg.max_depth);
        cfg.adaptive_tolerance = get_or<double>(j, "adaptTol", cfg.adaptive_tolerance);
        cfg.adaptive_batch     = get_or<int>(j, "adaptBatch", cfg.adaptive_batch);
    }

    // let the camera validate now rather than at render time
    try {
        Camera probe(cfg);
        (void)probe;
    } catch (const std::invalid_argument& e) {
        throw SceneBuildError(std::string("camera: ") + e.what());
    }
}

} // anon

// ---------- public API ----------
namespace jsonio {

/**
 * @brief Parse a scene from JSON text.
 * @param json_text UTF-8 JSON string.
 * @param scene Output scene (world, materials, camera).
 * @return true on success; throws SceneBuildError on parse/validation errors.
 */
bool load_scene_from_json_text(const std::string& json_text, Scene& scene) {
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) throw SceneBuildError("scene root must be an object");

        Scene out;
        parse_camera(root, out.camera);

        MaterialResolver mats(root);

        auto world = std::make_shared<PrimitiveList>();
        const json& arr = require(root, "objects", "scene");
        if (!arr.is_array()) throw SceneBuildError("'objects' must be an array");
        for (const auto& node : arr) {
            world->add(parse_object(node, mats));
        }
        if (world->empty()) throw SceneBuildError("scene has no objects");

        out.materials = mats.build_all();
        out.world = std::move(world);
        scene = std::move(out);
        return true;
    } catch (const SceneBuildError&) {
        throw;
    } catch (const json::parse_error& e) {
        throw SceneBuildError(std::string("JSON parse error: ") + e.what());
    } catch (const json::exception& e) {
        throw SceneBuildError(std::string("JSON processing error: ") + e.what());
    }
}

/**
 * @brief Parse a scene from a JSON file on disk.
 * @param filename Path to scene.json.
 * @param scene Output scene.
 * @return true on success; throws SceneBuildError on I/O or parse errors.
 */
bool load_scene_from_json(const std::string& filename, Scene& scene) {
    std::ifstream ifs(filename);
    if (!ifs) throw SceneBuildError("Cannot open JSON file: " + filename);
    std::ostringstream ss; ss << ifs.rdbuf();
    return load_scene_from_json_text(ss.str(), scene);
}

} // namespace jsonio
