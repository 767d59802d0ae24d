#pragma once
#include <memory>
#include <string>

#include "faces.h"
#include "geometry.h"

/**
 * @brief Lens: rotationally bounded optical element built from two faces and a round barrel.
 *
 * Local frame: the back vertex sits at z=0, the front vertex at z=center_thickness and
 * the optical axis is +z. The solid is assembled once at construction:
 *  - short lenses, where every convex face solid spans the whole element at the rim,
 *    are barrel ∩ convex faces − concave faces;
 *  - long lenses union a straight barrel with one capped slab per convex face, then
 *    subtract the concave faces.
 * Coincident boundaries are pushed apart by padding_for(axial thickness).
 */
class Lens : public Primitive {
public:
    double diameter() const { return diameter_; }
    double center_thickness() const { return center_thickness_; }
    double edge_thickness() const { return edge_thickness_; }
    /// Sag of the front face (0 when flat).
    double front_thickness() const { return front_.sag; }
    /// Sag of the back face (0 when flat).
    double back_thickness() const { return back_.sag; }
    const FaceGeometry& front() const { return front_; }
    const FaceGeometry& back() const { return back_; }
    /// Lowest axial coordinate of the element.
    double z_min() const { return z_min_; }
    /// Highest axial coordinate of the element.
    double z_max() const { return z_max_; }
    /// Padding used between coincident boundaries.
    double padding() const { return padding_; }

    /**
     * @brief True if the element was assembled by pure intersection.
     * A convex face qualifies when its solid reaches across the whole axial extent at the rim.
     */
    bool is_short() const { return short_; }

    /// Root of the internal CSG tree (lens frame).
    const Primitive& solid() const { return *solid_; }

    std::string kind() const override { return kind_; }

    /// One-line summary of the derived geometry.
    std::string describe() const;

protected:
    /**
     * @brief Validate and assemble a lens.
     * @param kind Type label reported by kind().
     * @param diameter Barrel diameter (>0).
     * @param center_thickness Vertex-to-vertex thickness (>0).
     * @param back Face at z=0, looking toward -z.
     * @param front Face at z=center_thickness, looking toward +z.
     * @param name Optional label.
     * @throws GeometryError before any solid is built if the faces cannot fit.
     */
    Lens(std::string kind, double diameter, double center_thickness,
         const FaceSpec& back, const FaceSpec& front, std::string name);

    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    std::shared_ptr<Primitive> build_short() const;
    std::shared_ptr<Primitive> build_long() const;
    /// Body with every concave face carved out.
    std::shared_ptr<Primitive> carve(std::shared_ptr<Primitive> body) const;
    /// Barrel cylinder spanning [lo, hi].
    std::shared_ptr<Primitive> barrel(double lo, double hi) const;

    std::string kind_;
    double diameter_;
    double center_thickness_;
    FaceGeometry back_;
    FaceGeometry front_;
    double edge_thickness_{0.0};
    double z_min_{0.0};
    double z_max_{0.0};
    double padding_{0.0};
    bool short_{false};
    std::shared_ptr<Primitive> solid_;
};

// ---------------- spherical ----------------

/// Both faces convex.
class BiConvex final : public Lens {
public:
    BiConvex(double diameter, double center_thickness,
             double front_curvature, double back_curvature, std::string name = {});
};

/// Both faces concave.
class BiConcave final : public Lens {
public:
    BiConcave(double diameter, double center_thickness,
              double front_curvature, double back_curvature, std::string name = {});
};

/// Convex front, concave back.
class Meniscus final : public Lens {
public:
    Meniscus(double diameter, double center_thickness,
             double front_curvature, double back_curvature, std::string name = {});
};

/// Flat back, convex front.
class PlanoConvex final : public Lens {
public:
    PlanoConvex(double diameter, double center_thickness, double curvature, std::string name = {});
};

/// Flat back, concave front.
class PlanoConcave final : public Lens {
public:
    PlanoConcave(double diameter, double center_thickness, double curvature, std::string name = {});
};

// ---------------- cylindrical ----------------
// Curvature lies in the yz-plane, or in the xz-plane when @c horizontal is set.

class CylindricalBiConvex final : public Lens {
public:
    CylindricalBiConvex(double diameter, double center_thickness,
                        double front_curvature, double back_curvature,
                        bool horizontal = false, std::string name = {});
};

class CylindricalBiConcave final : public Lens {
public:
    CylindricalBiConcave(double diameter, double center_thickness,
                         double front_curvature, double back_curvature,
                         bool horizontal = false, std::string name = {});
};

class CylindricalMeniscus final : public Lens {
public:
    CylindricalMeniscus(double diameter, double center_thickness,
                        double front_curvature, double back_curvature,
                        bool horizontal = false, std::string name = {});
};

class CylindricalPlanoConvex final : public Lens {
public:
    CylindricalPlanoConvex(double diameter, double center_thickness, double curvature,
                           bool horizontal = false, std::string name = {});
};

class CylindricalPlanoConcave final : public Lens {
public:
    CylindricalPlanoConcave(double diameter, double center_thickness, double curvature,
                            bool horizontal = false, std::string name = {});
};

// ---------------- toric ----------------
// Each face takes a vertical (yz-plane) and a horizontal (xz-plane) curvature, which must differ.

class ToricBiConvex final : public Lens {
public:
    ToricBiConvex(double diameter, double center_thickness,
                  double front_vertical, double front_horizontal,
                  double back_vertical, double back_horizontal,
                  std::string name = {}, double root_tolerance = kRootImagTolerance);
};

class ToricBiConcave final : public Lens {
public:
    ToricBiConcave(double diameter, double center_thickness,
                   double front_vertical, double front_horizontal,
                   double back_vertical, double back_horizontal,
                   std::string name = {}, double root_tolerance = kRootImagTolerance);
};

class ToricMeniscus final : public Lens {
public:
    ToricMeniscus(double diameter, double center_thickness,
                  double front_vertical, double front_horizontal,
                  double back_vertical, double back_horizontal,
                  std::string name = {}, double root_tolerance = kRootImagTolerance);
};

class ToricPlanoConvex final : public Lens {
public:
    ToricPlanoConvex(double diameter, double center_thickness,
                     double vertical, double horizontal,
                     std::string name = {}, double root_tolerance = kRootImagTolerance);
};

class ToricPlanoConcave final : public Lens {
public:
    ToricPlanoConcave(double diameter, double center_thickness,
                      double vertical, double horizontal,
                      std::string name = {}, double root_tolerance = kRootImagTolerance);
};
