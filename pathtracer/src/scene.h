#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include "camera.h"
#include "geometry.h"
#include "material.h"

/// SceneBuildError: malformed scene description, raised before rendering starts.
class SceneBuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Renderable world built from a scene description.
 * Owns the primitive tree and the named materials; immutable once loaded.
 */
struct Scene {
    /// Root of the primitive tree.
    std::shared_ptr<const PrimitiveList> world;
    /// Materials declared by id in the description (inline materials are owned by primitives).
    std::map<std::string, std::shared_ptr<const Material>> materials;
    /// Camera and sampling settings.
    CameraConfig camera;
};
