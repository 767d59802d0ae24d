#pragma once
#include "geometry.h"
#include <memory>

/// CSGOp: boolean operation applied to child solids.
enum class CSGOp { Union, Intersection, Difference };

/**
 * @brief Constructive Solid Geometry node combining two primitives.
 * Each child's hits are kept or dropped by asking the other child whether the hit point
 * lies inside it; for Difference the surviving hits of B become inward-facing walls of A.
 */
class CSG final : public Primitive {
public:
    /**
     * @brief Create a node with operation @p op over children @p a and @p b.
     * The node becomes the parent of both children.
     * @param transform Placement of the node in its parent frame (rigid).
     */
    CSG(CSGOp op, std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
        const Matrix4& transform = Matrix4(), std::string name = {});
    ~CSG() override;

    CSGOp op() const { return op_; }
    const Primitive& left() const { return *A_; }
    const Primitive& right() const { return *B_; }
    std::string kind() const override;

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    /// Selected boolean operation.
    CSGOp op_;
    /// Left child solid.
    std::shared_ptr<Primitive> A_;
    /// Right child solid.
    std::shared_ptr<Primitive> B_;
};

/// a ∪ b placed by @p transform.
std::shared_ptr<CSG> Union(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                           const Matrix4& transform = Matrix4());

/// a ∩ b placed by @p transform.
std::shared_ptr<CSG> Intersect(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                               const Matrix4& transform = Matrix4());

/// a − b placed by @p transform.
std::shared_ptr<CSG> Subtract(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                              const Matrix4& transform = Matrix4());
