#include "csg.h"

#include <algorithm>

CSG::CSG(CSGOp op, std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
         const Matrix4& transform, std::string name)
    : Primitive(std::move(name)), op_(op), A_(std::move(a)), B_(std::move(b)) {
    require_geometry(A_ != nullptr && B_ != nullptr, "CSG node needs two children");
    set_transform(transform);
    A_->set_parent(this);
    B_->set_parent(this);
}

CSG::~CSG() {
    if (A_->parent() == this) A_->set_parent(nullptr);
    if (B_->parent() == this) B_->set_parent(nullptr);
}

std::string CSG::kind() const {
    switch (op_) {
        case CSGOp::Union:        return "Union";
        case CSGOp::Intersection: return "Intersect";
        case CSGOp::Difference:   return "Subtract";
    }
    return "CSG";
}

HitList CSG::local_hits(const Ray& r) const {
    HitList out;

    // A's surface survives where B does not cover it (or covers it, for Intersection).
    const bool keep_a_inside_b = (op_ == CSGOp::Intersection);
    for (const auto& h : A_->hit_all(r)) {
        if (B_->contains(h.world_point()) == keep_a_inside_b) out.push_back(h);
    }

    // B's surface survives outside A for Union, inside A otherwise.
    const bool keep_b_inside_a = (op_ != CSGOp::Union);
    for (auto h : B_->hit_all(r)) {
        if (A_->contains(h.world_point()) != keep_b_inside_a) continue;
        if (op_ == CSGOp::Difference) h.flip();
        out.push_back(h);
    }

    sort_hits(out);
    return out;
}

bool CSG::local_contains(const Point3& p) const {
    switch (op_) {
        case CSGOp::Union:        return A_->contains(p) || B_->contains(p);
        case CSGOp::Intersection: return A_->contains(p) && B_->contains(p);
        case CSGOp::Difference:   return A_->contains(p) && !B_->contains(p);
    }
    return false;
}

BoundingBox CSG::local_bounds() const {
    switch (op_) {
        case CSGOp::Union:        return A_->bounding_box().united(B_->bounding_box());
        case CSGOp::Intersection: return A_->bounding_box().intersected(B_->bounding_box());
        case CSGOp::Difference:   return A_->bounding_box();
    }
    return BoundingBox();
}

std::shared_ptr<CSG> Union(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                           const Matrix4& transform) {
    return std::make_shared<CSG>(CSGOp::Union, std::move(a), std::move(b), transform);
}

std::shared_ptr<CSG> Intersect(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                               const Matrix4& transform) {
    return std::make_shared<CSG>(CSGOp::Intersection, std::move(a), std::move(b), transform);
}

std::shared_ptr<CSG> Subtract(std::shared_ptr<Primitive> a, std::shared_ptr<Primitive> b,
                              const Matrix4& transform) {
    return std::make_shared<CSG>(CSGOp::Difference, std::move(a), std::move(b), transform);
}
