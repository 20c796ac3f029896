#pragma once

#include <string>
#include <stdexcept>

/// Scene: renderable world with primitives, materials, and camera (forward-declared).
struct Scene;

/**
 * @brief JSON scene I/O utilities.
 * Builds an immutable Scene (primitive tree, material registry, camera settings)
 * from a JSON description on disk or in memory.
 *
 * Every problem (malformed JSON, unknown type tags, missing material ids,
 * degenerate geometry, invalid camera settings) throws SceneBuildError.
 */
namespace jsonio {

/**
 * @brief Load a scene from a JSON file.
 * @param filename Path to scene description (UTF-8 JSON).
 * @param scene Output scene.
 * @return true on success; throws SceneBuildError if unreadable or invalid.
 */
bool load_scene_from_json(const std::string& filename, Scene& scene);

/**
 * @brief Load a scene from JSON text in memory.
 * @param json_text Scene JSON as a single string.
 * @param scene Output scene.
 * @return true on success; throws SceneBuildError on invalid content.
 */
bool load_scene_from_json_text(const std::string& json_text, Scene& scene);

} // namespace jsonio
