#pragma once
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core.h"
#include "bounds.h"

/// Material: optical tag carried by a primitive (shading is out of scope).
struct Material {
    /// Catalogue name (e.g. "N-BK7", "MIRROR").
    std::string name{"air"};
    /// Refractive index at the reference wavelength.
    double refractive_index{1.0};
    /// True for reflecting coatings.
    bool mirror{false};
};

/// Raised when construction parameters describe an impossible shape.
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Primitive;

/// Offset used to push inner/outer points off the surface.
constexpr double kPointOffset = 1e-9;

/**
 * @brief Result of a ray–surface query.
 * Points and the normal are expressed in the local frame of the primitive that was hit;
 * to_world/to_local map between that frame and the frame of the query ray.
 */
struct Intersection {
    /// Distance along the query ray.
    double t{kINF};
    /// Surface point.
    Point3 hit_point;
    /// hit_point nudged to the inside of the surface.
    Point3 inner_point;
    /// hit_point nudged to the outside of the surface.
    Point3 outer_point;
    /// Outward unit normal.
    Dir3 normal;
    /// True if the ray leaves the solid here (direction·normal >= 0).
    bool exiting{false};
    /// Query frame -> primitive local frame.
    Matrix4 to_local;
    /// Primitive local frame -> query frame.
    Matrix4 to_world;
    /// Leaf primitive that produced the hit.
    const Primitive* primitive{nullptr};

    /// hit_point in the query frame.
    Point3 world_point() const;
    /// Outward normal in the query frame.
    Dir3 world_normal() const;
    /// Normal oriented against the incoming ray (local frame).
    Dir3 facing_normal() const {
        return exiting ? Dir3(-normal.x, -normal.y, -normal.z) : normal;
    }
    /// Turn the surface inside out (used by subtraction).
    void flip();
};

/// Hits ordered by ascending distance.
using HitList = std::vector<Intersection>;

/**
 * @brief Build a hit record from a local ray and an outward normal.
 * @param local_ray Ray in the primitive's local frame.
 * @param t Hit distance.
 * @param outward Outward unit normal at the hit.
 * @param prim Primitive that owns the surface.
 * @return Intersection with offsets and exiting flag filled in.
 */
Intersection make_intersection(const Ray& local_ray, double t, const Dir3& outward, const Primitive* prim);

/// True if @p t lies in [0, ray.max_distance].
inline bool in_ray_range(const Ray& r, double t) {
    return t >= 0.0 && t <= r.max_distance;
}

/// Sort hits by distance.
void sort_hits(HitList& hits);

/**
 * @brief Abstract solid or surface supporting ray queries in its own frame.
 * Derived classes describe their shape in local coordinates; this base maps rays,
 * points and bounds through the rigid placement transform.
 */
class Primitive {
public:
    /// Callback fired when geometry or placement changes.
    using GeometryListener = std::function<void(const Primitive&)>;

    virtual ~Primitive() = default;
    Primitive(const Primitive&) = delete;
    Primitive& operator=(const Primitive&) = delete;

    /**
     * @brief All hits along @p ray within [0, ray.max_distance], nearest first.
     * Stateless and safe to call concurrently.
     * @param ray Ray in the parent frame.
     * @return Ordered hit list (empty on miss).
     */
    HitList hit_all(const Ray& ray) const;

    /**
     * @brief Nearest hit; remaining hits are kept for next_intersection().
     * Not thread-safe: pending hits live on the instance.
     * @param ray Ray in the parent frame.
     * @param out Nearest hit when found.
     * @return true on hit.
     */
    bool hit(const Ray& ray, Intersection& out) const;

    /**
     * @brief Pop the next pending hit of the last hit() call.
     * Must follow hit() with the same ray; the ray is not re-validated.
     * @param out Next hit when available.
     * @return false once the pending hits are exhausted.
     */
    bool next_intersection(Intersection& out) const;

    /// Point-in-solid test, @p p in the parent frame.
    bool contains(const Point3& p) const;

    /// Padded bounds in the parent frame.
    BoundingBox bounding_box() const;

    /// Padded bounding sphere in the parent frame.
    BoundingSphere bounding_sphere() const;

    /// Short type label used in diagnostics.
    virtual std::string kind() const = 0;

    const Matrix4& transform() const { return transform_; }
    const Matrix4& inverse_transform() const { return inverse_; }

    /**
     * @brief Replace the placement transform.
     * @param M Local-to-parent transform; must be rigid.
     * @throws GeometryError if @p M scales or shears.
     */
    void set_transform(const Matrix4& M);

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    const Material* material() const { return material_.get(); }
    void set_material(std::shared_ptr<const Material> m) { material_ = std::move(m); }

    Primitive* parent() const { return parent_; }
    void set_parent(Primitive* p) { parent_ = p; }

    void set_geometry_listener(GeometryListener listener) { listener_ = std::move(listener); }

    /**
     * @brief Drop pending hits and tell the parent chain that bounds are stale.
     */
    void notify_geometry_change();

protected:
    explicit Primitive(std::string name = {});

    /// Hits of a ray already expressed in the local frame.
    virtual HitList local_hits(const Ray& local_ray) const = 0;
    /// Containment of a local point.
    virtual bool local_contains(const Point3& p) const = 0;
    /// Local bounds (leaves include kBoxPadding).
    virtual BoundingBox local_bounds() const = 0;

private:
    Matrix4 transform_;
    Matrix4 inverse_;
    std::string name_;
    std::shared_ptr<const Material> material_;
    Primitive* parent_{nullptr};
    GeometryListener listener_;
    mutable HitList pending_;
};

/// Throw GeometryError with @p message unless @p condition holds.
inline void require_geometry(bool condition, const std::string& message) {
    if (!condition) throw GeometryError(message);
}
