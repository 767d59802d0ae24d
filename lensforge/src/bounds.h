#pragma once
#include "core.h"

/// Absolute padding applied to leaf bounding boxes.
constexpr double kBoxPadding = 1e-9;
/// Relative radius multiplier applied to bounding spheres.
constexpr double kSpherePadding = 1.0 + 1e-9;

/**
 * @brief Axis-aligned bounding box; a default-constructed box is empty.
 * Used for scene culling and for sizing the CLI hit map.
 */
struct BoundingBox {
    /// Minimum corner.
    Point3 lower{kINF, kINF, kINF};
    /// Maximum corner.
    Point3 upper{-kINF, -kINF, -kINF};

    BoundingBox() = default;
    BoundingBox(const Point3& lo, const Point3& hi) : lower(lo), upper(hi) {}

    /// True if the box encloses no point.
    bool empty() const {
        return lower.x > upper.x || lower.y > upper.y || lower.z > upper.z;
    }

    /// Grow to include @p p.
    void extend(const Point3& p);

    /// Grow by @p amount on every side (no-op for empty boxes).
    BoundingBox padded(double amount) const;

    /// Smallest box enclosing both.
    BoundingBox united(const BoundingBox& other) const;

    /// Overlap of both boxes (possibly empty).
    BoundingBox intersected(const BoundingBox& other) const;

    /**
     * @brief Box enclosing the 8 transformed corners.
     * @param M Affine transform into the target frame.
     * @return Axis-aligned box in the target frame.
     */
    BoundingBox transformed(const Matrix4& M) const;

    /// Inclusive point test.
    bool contains(const Point3& p) const {
        return p.x >= lower.x && p.x <= upper.x &&
               p.y >= lower.y && p.y <= upper.y &&
               p.z >= lower.z && p.z <= upper.z;
    }

    /// Extent along axis 0, 1 or 2.
    double extent(int axis) const;

    Point3 center() const {
        return Point3(0.5*(lower.x + upper.x), 0.5*(lower.y + upper.y), 0.5*(lower.z + upper.z));
    }
};

/// Bounding sphere (center, radius).
struct BoundingSphere {
    Point3 center;
    double radius{0.0};

    /// Smallest sphere around @p box, radius padded by kSpherePadding.
    static BoundingSphere around(const BoundingBox& box);
};
