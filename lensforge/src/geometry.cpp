#include "geometry.h"
#include "transform.h"

#include <algorithm>

Point3 Intersection::world_point() const {
    return xform::apply_point(to_world, hit_point);
}

Dir3 Intersection::world_normal() const {
    return xform::apply_normal(to_local, normal);
}

void Intersection::flip() {
    normal = Dir3(-normal.x, -normal.y, -normal.z);
    exiting = !exiting;
    std::swap(inner_point, outer_point);
}

Intersection make_intersection(const Ray& local_ray, double t, const Dir3& outward, const Primitive* prim) {
    Intersection h;
    h.t = t;
    h.hit_point = local_ray.at(t);
    h.normal = outward.normalized();
    h.exiting = local_ray.d.dot(h.normal) >= 0.0;

    const Point3& p = h.hit_point;
    const double scale = std::max({1.0, std::abs(p.x), std::abs(p.y), std::abs(p.z)});
    const Vec4 offset = h.normal * (kPointOffset * scale);
    h.inner_point = Point3(p - offset);
    h.outer_point = Point3(p + offset);
    h.primitive = prim;
    return h;
}

void sort_hits(HitList& hits) {
    std::stable_sort(hits.begin(), hits.end(),
                     [](const Intersection& a, const Intersection& b) { return a.t < b.t; });
}

Primitive::Primitive(std::string name) : name_(std::move(name)) {}

HitList Primitive::hit_all(const Ray& ray) const {
    const Ray local = xform::to_local(inverse_, ray);
    HitList hits = local_hits(local);
    for (auto& h : hits) {
        h.to_world = transform_ * h.to_world;
        h.to_local = h.to_local * inverse_;
    }
    return hits;
}

bool Primitive::hit(const Ray& ray, Intersection& out) const {
    pending_.clear();
    HitList hits = hit_all(ray);
    if (hits.empty()) return false;
    out = hits.front();
    pending_.assign(hits.begin() + 1, hits.end());
    return true;
}

bool Primitive::next_intersection(Intersection& out) const {
    if (pending_.empty()) return false;
    out = pending_.front();
    pending_.erase(pending_.begin());
    return true;
}

bool Primitive::contains(const Point3& p) const {
    return local_contains(xform::apply_point(inverse_, p));
}

BoundingBox Primitive::bounding_box() const {
    return local_bounds().transformed(transform_);
}

BoundingSphere Primitive::bounding_sphere() const {
    return BoundingSphere::around(bounding_box());
}

void Primitive::set_transform(const Matrix4& M) {
    require_geometry(xform::is_rigid(M), "primitive transforms must be rigid (no scale or shear)");
    transform_ = M;
    inverse_ = M.inverse();
    notify_geometry_change();
}

void Primitive::notify_geometry_change() {
    pending_.clear();
    if (listener_) listener_(*this);
    if (parent_) parent_->notify_geometry_change();
}
