#pragma once

#include <memory>
#include <string>
#include <stdexcept>
#include <vector>

#include "roots.h"

class Primitive;

/// ElementSet: top-level elements of a document plus global settings.
struct ElementSet {
    /// Relative tolerance for quartic roots of toric surfaces ("settings.rootTolerance").
    double root_tolerance{kRootImagTolerance};
    /// Top-level elements in document order.
    std::vector<std::shared_ptr<Primitive>> elements;
};

/**
 * @brief JSON element I/O utilities.
 * Documents hold a "settings" block and an "objects" array of one-key tagged nodes.
 */
namespace jsonio {

/**
 * @brief Load elements from a JSON file.
 * @param filename Path to element description (UTF-8 JSON).
 * @param out Output element set (previous contents are replaced).
 * @return true on success; throws std::runtime_error on I/O, parse or geometry errors.
 */
bool load_elements_from_json(const std::string& filename, ElementSet& out);

/**
 * @brief Load elements from JSON text in memory.
 * @param json_text Document as a single string.
 * @param out Output element set (previous contents are replaced).
 * @return true on success; throws std::runtime_error on parse or geometry errors.
 */
bool load_elements_from_json_text(const std::string& json_text, ElementSet& out);

} // namespace jsonio
