#pragma once
#include <memory>
#include <ostream>
#include <vector>

#include "bounds.h"
#include "geometry.h"

/// Orthographic coverage sample of an element assembly.
struct HitMap {
    int width{0};
    int height{0};
    /// World bounds the map covers.
    BoundingBox bounds;
    /// World z of the nearest hit per pixel, row-major from the top row; NaN for a miss.
    std::vector<double> depth;
    /// Surface crossings per pixel over all elements.
    std::vector<int> crossings;

    /// 8-bit intensity: 0 for a miss, 1..255 from the lowest to the highest hit.
    unsigned char intensity(int x, int y) const;
};

/// Running totals of a hit-map pass.
struct ProbeProgress {
    int rows_done{0};
    int rows{0};
    long long rays{0};
    /// Rays that met at least one element.
    long long covered{0};
    /// Surface crossings over all rays.
    long long crossings{0};
};

/**
 * @brief Casts one ray per pixel along -z over the bounding box of a set of elements.
 * Owns no resources; rays are independent so hit_all() is used throughout.
 */
struct HitMapper {
    /// Elements to probe (non-owning).
    const std::vector<std::shared_ptr<Primitive>>* elements{nullptr};
    /// Pixels along the longer side of the box.
    int size{256};
    /// Print a progress bar to std::cout.
    bool show_progress{true};

    /**
     * @brief Sample the assembly.
     * @param out Output map; left empty when there is nothing to probe.
     */
    void render(HitMap& out) const;

    /// Union of the world bounding boxes of all elements.
    BoundingBox assembly_bounds() const;

    /**
     * @brief Write one progress line: rows done, rays cast, coverage and crossings.
     * @param os Destination; the line starts with a carriage return so it overwrites itself.
     * @param p Totals so far.
     * @param seconds Elapsed time; a ray rate is added when positive.
     */
    static void report_progress(std::ostream& os, const ProbeProgress& p, double seconds);
};
