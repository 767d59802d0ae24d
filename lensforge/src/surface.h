#pragma once
#include <array>
#include <optional>
#include <string>

/// Prescription surface model.
enum class SurfaceKind { Standard, Toroidal };

/// Geometric family a surface resolves to.
enum class SurfaceType { Flat, Cylindrical, Spherical, Toroidal };

/// Outline a surface resolves to.
enum class ShapeType { Round, Rectangular };

/**
 * @brief One surface of an optical prescription.
 * Radii are signed: positive when the centre of curvature lies on the +z side of the vertex,
 * 0 for a flat surface.
 */
struct SurfaceDesc {
    SurfaceKind kind{SurfaceKind::Standard};
    std::string name;
    /// Vertical (yz-plane) radius; the only radius of a Standard surface.
    double radius{0.0};
    /// Horizontal (xz-plane) radius, Toroidal surfaces only.
    double radius_horizontal{0.0};
    /// Axial distance to the next surface.
    double thickness{0.0};
    /// Glass name of the medium after the surface.
    std::string material;
    double semi_diameter{0.0};
    /// Half-width and half-height for rectangular apertures; hole and outer radius for round ones.
    std::optional<std::array<double, 2>> aperture;
    bool rectangular_aperture{false};
    /// Horizontal and vertical aperture decenter.
    std::optional<std::array<double, 2>> aperture_decenter;
};

/// Result of classify_surface().
struct SurfaceClass {
    SurfaceType type{SurfaceType::Flat};
    ShapeType shape{ShapeType::Round};
};

/// Radii closer than this count as equal.
constexpr double kRadiusEqualTolerance = 1e-8;

/**
 * @brief Resolve a surface to a geometric family and outline.
 *
 * Standard surfaces are flat or spherical. Toroidal surfaces are flat when both radii are 0,
 * cylindrical when exactly one is 0, spherical when both radii match within
 * kRadiusEqualTolerance and toroidal otherwise. The outline is rectangular only for a
 * rectangular aperture.
 */
SurfaceClass classify_surface(const SurfaceDesc& surface);

const char* to_string(SurfaceType type);
const char* to_string(ShapeType shape);
