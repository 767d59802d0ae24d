#include "json_loader.h"

// STL
#include <fstream>
#include <sstream>
#include <utility>

// Project headers
#include "core.h"
#include "csg.h"
#include "factory.h"
#include "flat.h"
#include "geometry.h"
#include "lens.h"
#include "mirror.h"
#include "segments.h"
#include "solids.h"
#include "surface.h"
#include "torus.h"
#include "transform.h"

// JSON
#include <nlohmann/json.hpp>
using nlohmann::json;

namespace {

/// Settings visible to every node builder of one document.
struct LoadContext {
    double root_tolerance{kRootImagTolerance};
};

/**
 * @brief Read key or fallback from a JSON object.
 * @param j Source object.
 * @param key Property to read.
 * @param fallback Value returned if key is absent.
 * @return Parsed value of T or fallback.
 */
template <typename T>
T get_or(const json& j, const char* key, const T& fallback) {
    if (!j.contains(key)) return fallback;
    return j.at(key).get<T>();
}

/// Required numeric field; names the node kind in the error.
double require_number(const json& j, const char* key, const char* kind) {
    if (!j.contains(key)) throw std::runtime_error(std::string(kind) + " requires '" + key + "'");
    return j.at(key).get<double>();
}

/**
 * @brief Parse a JSON array[3] into Vec3.
 * @param arr JSON array with 3 doubles.
 * @return Vec3 filled from arr.
 */
inline Vec3 as_vec3(const json& arr) {
    if (!arr.is_array() || arr.size() != 3) throw std::runtime_error("Expected array[3]");
    return Vec3(arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>());
}

/// Parse a JSON array[2] of doubles.
inline std::array<double, 2> as_pair(const json& arr) {
    if (!arr.is_array() || arr.size() != 2) throw std::runtime_error("Expected array[2]");
    return {arr[0].get<double>(), arr[1].get<double>()};
}

/// Ensure node is a one-entry object (tagged union form).
inline void ensure_object_1key(const json& j) {
    if (!j.is_object() || j.size() != 1) throw std::runtime_error("Each object node must be a one-entry object");
}

/**
 * @brief Build a Material from a "material" block.
 * @param jm JSON object with optional fields: name, index, mirror.
 */
std::shared_ptr<Material> parse_material_block(const json& jm) {
    if (!jm.is_object()) throw std::runtime_error("material must be an object");
    auto m = std::make_shared<Material>();
    m->name             = get_or<std::string>(jm, "name", m->name);
    m->refractive_index = get_or<double>(jm, "index", m->refractive_index);
    m->mirror           = get_or<bool>(jm, "mirror", m->mirror);
    return m;
}

/// Apply the optional "position" offset of a leaf node.
std::shared_ptr<Primitive> place(std::shared_ptr<Primitive> prim, const json& j) {
    if (j.contains("position")) {
        const Vec3 p = as_vec3(j.at("position"));
        prim->set_transform(xform::translate(p.x, p.y, p.z) * prim->transform());
    }
    return prim;
}

/// Forward declaration for object node dispatcher.
std::shared_ptr<Primitive> parse_object_node(const json& jnode, const LoadContext& ctx);

// ---------- flat surfaces and host solids ----------

std::shared_ptr<Primitive> make_circle(const json& j) {
    return place(std::make_shared<Circle>(require_number(j, "radius", "circle")), j);
}

std::shared_ptr<Primitive> make_rectangle(const json& j) {
    return place(std::make_shared<Rectangle>(require_number(j, "width", "rectangle"),
                                             require_number(j, "height", "rectangle")), j);
}

std::shared_ptr<Primitive> make_triangle(const json& j) {
    if (!j.contains("vertices") || !j.at("vertices").is_array() || j.at("vertices").size() != 3)
        throw std::runtime_error("triangle requires 'vertices' as three [x,y,z] points");
    const json& v = j.at("vertices");
    const Vec3 a = as_vec3(v[0]), b = as_vec3(v[1]), c = as_vec3(v[2]);
    return place(std::make_shared<Triangle>(Point3{a.x, a.y, a.z}, Point3{b.x, b.y, b.z},
                                            Point3{c.x, c.y, c.z}), j);
}

std::shared_ptr<Primitive> make_sphere(const json& j) {
    return place(std::make_shared<Sphere>(require_number(j, "radius", "sphere")), j);
}

std::shared_ptr<Primitive> make_cylinder(const json& j) {
    return place(std::make_shared<Cylinder>(require_number(j, "radius", "cylinder"),
                                            require_number(j, "length", "cylinder")), j);
}

std::shared_ptr<Primitive> make_box(const json& j) {
    if (!j.contains("lower") || !j.contains("upper"))
        throw std::runtime_error("box requires 'lower' and 'upper'");
    const Vec3 lo = as_vec3(j.at("lower")), hi = as_vec3(j.at("upper"));
    return place(std::make_shared<Box>(Point3{lo.x, lo.y, lo.z}, Point3{hi.x, hi.y, hi.z}), j);
}

// ---------- cap segments ----------

std::shared_ptr<Primitive> make_sphere_segment(const json& j) {
    return place(std::make_shared<SphereSegment>(require_number(j, "radius", "sphereSegment"),
                                                 require_number(j, "height", "sphereSegment")), j);
}

std::shared_ptr<Primitive> make_cylinder_segment(const json& j) {
    return place(std::make_shared<CylinderSegment>(require_number(j, "radius", "cylinderSegment"),
                                                   require_number(j, "height", "cylinderSegment"),
                                                   require_number(j, "length", "cylinderSegment")), j);
}

std::shared_ptr<Primitive> make_torus_segment(const json& j, const LoadContext& ctx) {
    return place(std::make_shared<TorusSegment>(require_number(j, "major", "torusSegment"),
                                                require_number(j, "minor", "torusSegment"),
                                                require_number(j, "height", "torusSegment"),
                                                std::string{},
                                                get_or<double>(j, "rootTolerance", ctx.root_tolerance)), j);
}

// ---------- lenses ----------

enum class LensKind { BiConvex, BiConcave, Meniscus, PlanoConvex, PlanoConcave };

/**
 * @brief Construct a lens of the given kind from JSON.
 * @param j Payload with family ("spherical" default, "cylindrical", "toric"), diameter,
 *          centerThickness and curvatures (front/back, or vertical/horizontal pairs for toric).
 * @param kind Lens variant selected by the node tag.
 * @param tag Node tag used in error messages.
 */
std::shared_ptr<Primitive> make_lens(const json& j, LensKind kind, const char* tag, const LoadContext& ctx) {
    const std::string family = get_or<std::string>(j, "family", "spherical");
    const double d  = require_number(j, "diameter", tag);
    const double ct = require_number(j, "centerThickness", tag);
    const bool plano = (kind == LensKind::PlanoConvex || kind == LensKind::PlanoConcave);

    std::shared_ptr<Lens> lens;
    if (family == "spherical" || family == "cylindrical") {
        const bool cyl = (family == "cylindrical");
        const bool horizontal = get_or<bool>(j, "horizontal", false);
        if (plano) {
            const double c = require_number(j, "curvature", tag);
            if (kind == LensKind::PlanoConvex) {
                if (cyl) lens = std::make_shared<CylindricalPlanoConvex>(d, ct, c, horizontal);
                else     lens = std::make_shared<PlanoConvex>(d, ct, c);
            } else {
                if (cyl) lens = std::make_shared<CylindricalPlanoConcave>(d, ct, c, horizontal);
                else     lens = std::make_shared<PlanoConcave>(d, ct, c);
            }
        } else {
            const double fc = require_number(j, "frontCurvature", tag);
            const double bc = require_number(j, "backCurvature", tag);
            switch (kind) {
                case LensKind::BiConvex:
                    if (cyl) lens = std::make_shared<CylindricalBiConvex>(d, ct, fc, bc, horizontal);
                    else     lens = std::make_shared<BiConvex>(d, ct, fc, bc);
                    break;
                case LensKind::BiConcave:
                    if (cyl) lens = std::make_shared<CylindricalBiConcave>(d, ct, fc, bc, horizontal);
                    else     lens = std::make_shared<BiConcave>(d, ct, fc, bc);
                    break;
                default:
                    if (cyl) lens = std::make_shared<CylindricalMeniscus>(d, ct, fc, bc, horizontal);
                    else     lens = std::make_shared<Meniscus>(d, ct, fc, bc);
                    break;
            }
        }
    } else if (family == "toric") {
        const double tol = get_or<double>(j, "rootTolerance", ctx.root_tolerance);
        if (plano) {
            const double v = require_number(j, "curvatureVertical", tag);
            const double h = require_number(j, "curvatureHorizontal", tag);
            if (kind == LensKind::PlanoConvex) lens = std::make_shared<ToricPlanoConvex>(d, ct, v, h, "", tol);
            else                               lens = std::make_shared<ToricPlanoConcave>(d, ct, v, h, "", tol);
        } else {
            const double fv = require_number(j, "frontCurvatureVertical", tag);
            const double fh = require_number(j, "frontCurvatureHorizontal", tag);
            const double bv = require_number(j, "backCurvatureVertical", tag);
            const double bh = require_number(j, "backCurvatureHorizontal", tag);
            switch (kind) {
                case LensKind::BiConvex:  lens = std::make_shared<ToricBiConvex>(d, ct, fv, fh, bv, bh, "", tol); break;
                case LensKind::BiConcave: lens = std::make_shared<ToricBiConcave>(d, ct, fv, fh, bv, bh, "", tol); break;
                default:                  lens = std::make_shared<ToricMeniscus>(d, ct, fv, fh, bv, bh, "", tol); break;
            }
        }
    } else {
        throw std::runtime_error(std::string(tag) + ".family must be spherical/cylindrical/toric");
    }
    return place(lens, j);
}

// ---------- mirrors ----------

/**
 * @brief Parse a mirror "frame" block.
 * @param jf Object with shape ("round" default, "rectangular"), diameter or width/height,
 *           optional aperture and decenter [dx, dy].
 */
MirrorFrame parse_frame(const json& jf) {
    if (!jf.is_object()) throw std::runtime_error("mirror frame must be an object");
    const std::string shape = get_or<std::string>(jf, "shape", "round");
    const double aperture = get_or<double>(jf, "aperture", 0.0);
    std::array<double, 2> dec{0.0, 0.0};
    if (jf.contains("decenter")) dec = as_pair(jf.at("decenter"));

    if (shape == "round") {
        return MirrorFrame::round(require_number(jf, "diameter", "round frame"), aperture, dec[0], dec[1]);
    }
    if (shape == "rectangular") {
        return MirrorFrame::rectangular(require_number(jf, "width", "rectangular frame"),
                                        require_number(jf, "height", "rectangular frame"),
                                        aperture, dec[0], dec[1]);
    }
    throw std::runtime_error("frame.shape must be round/rectangular");
}

MirrorFrame require_frame(const json& j, const char* tag) {
    if (!j.contains("frame")) throw std::runtime_error(std::string(tag) + " requires 'frame'");
    return parse_frame(j.at("frame"));
}

std::shared_ptr<Primitive> make_spherical_mirror(const json& j) {
    const MirrorFrame frame = require_frame(j, "sphericalMirror");
    return place(std::make_shared<SphericalMirror>(
                     require_number(j, "curvature", "sphericalMirror"), frame,
                     get_or<double>(j, "thickness", kDefaultMirrorThickness)), j);
}

std::shared_ptr<Primitive> make_cylindrical_mirror(const json& j) {
    const MirrorFrame frame = require_frame(j, "cylindricalMirror");
    return place(std::make_shared<CylindricalMirror>(
                     require_number(j, "curvature", "cylindricalMirror"), frame,
                     get_or<bool>(j, "horizontal", false),
                     get_or<double>(j, "thickness", kDefaultMirrorThickness)), j);
}

std::shared_ptr<Primitive> make_toric_mirror(const json& j, const LoadContext& ctx) {
    const MirrorFrame frame = require_frame(j, "toricMirror");
    return place(std::make_shared<ToricMirror>(
                     require_number(j, "curvatureVertical", "toricMirror"),
                     require_number(j, "curvatureHorizontal", "toricMirror"), frame,
                     get_or<double>(j, "thickness", kDefaultMirrorThickness), std::string{},
                     get_or<double>(j, "rootTolerance", ctx.root_tolerance)), j);
}

// ---------- prescription surfaces ----------

/**
 * @brief Parse a prescription surface.
 * @param js Object with type ("standard" default, "toroidal"), radius, radiusHorizontal,
 *           thickness, material, semiDiameter, aperture [a,b], apertureType, decenter [dx,dy].
 */
SurfaceDesc parse_surface(const json& js) {
    if (!js.is_object()) throw std::runtime_error("surface must be an object");
    SurfaceDesc s;
    const std::string type = get_or<std::string>(js, "type", "standard");
    if (type == "standard")      s.kind = SurfaceKind::Standard;
    else if (type == "toroidal") s.kind = SurfaceKind::Toroidal;
    else throw std::runtime_error("surface.type must be standard/toroidal");

    s.name              = get_or<std::string>(js, "name", "");
    s.radius            = get_or<double>(js, "radius", 0.0);
    s.radius_horizontal = get_or<double>(js, "radiusHorizontal", 0.0);
    s.thickness         = get_or<double>(js, "thickness", 0.0);
    s.material          = get_or<std::string>(js, "material", "");
    s.semi_diameter     = require_number(js, "semiDiameter", "surface");
    if (js.contains("aperture")) s.aperture = as_pair(js.at("aperture"));
    s.rectangular_aperture = (get_or<std::string>(js, "apertureType", "round") == "rectangular");
    if (js.contains("decenter")) s.aperture_decenter = as_pair(js.at("decenter"));
    return s;
}

std::shared_ptr<Primitive> make_surface_lens(const json& j, const LoadContext& ctx) {
    if (!j.contains("back") || !j.contains("front"))
        throw std::runtime_error("lens requires 'back' and 'front' surfaces");
    return place(create_lens(parse_surface(j.at("back")), parse_surface(j.at("front")),
                             get_or<int>(j, "direction", 1), ctx.root_tolerance), j);
}

std::shared_ptr<Primitive> make_surface_mirror(const json& j, const LoadContext& ctx) {
    if (!j.contains("surface")) throw std::runtime_error("mirror requires 'surface'");
    return place(create_mirror(parse_surface(j.at("surface")), get_or<int>(j, "direction", 1),
                               ctx.root_tolerance), j);
}

// ---------- transforms ----------

/**
 * @brief Move a child by a translation.
 * @param j Payload with factors [tx,ty,tz] and subject node.
 * @return The child with its placement updated.
 */
std::shared_ptr<Primitive> make_translation(const json& j, const LoadContext& ctx) {
    if (!j.contains("factors") || !j.contains("subject"))
        throw std::runtime_error("translation requires 'factors' and 'subject'");
    const Vec3 t = as_vec3(j.at("factors"));
    auto child   = parse_object_node(j.at("subject"), ctx);
    child->set_transform(xform::translate(t.x, t.y, t.z) * child->transform());
    return child;
}

/**
 * @brief Turn a child about a coordinate axis.
 * @param j Payload with angle (deg), direction axis index {0,1,2}, and subject node.
 * @return The child with its placement updated.
 */
std::shared_ptr<Primitive> make_rotation(const json& j, const LoadContext& ctx) {
    if (!j.contains("angle") || !j.contains("direction") || !j.contains("subject"))
        throw std::runtime_error("rotation requires 'angle', 'direction', and 'subject'");

    const double angle_deg = j.at("angle").get<double>();
    const int axis_i       = j.at("direction").get<int>();

    Matrix4 R;
    if (axis_i == 0)      R = xform::rotate_x(angle_deg);
    else if (axis_i == 1) R = xform::rotate_y(angle_deg);
    else if (axis_i == 2) R = xform::rotate_z(angle_deg);
    else throw std::runtime_error("rotation direction must be 0 (X), 1 (Y), or 2 (Z)");

    auto child = parse_object_node(j.at("subject"), ctx);
    child->set_transform(R * child->transform());
    return child;
}

// ---------- CSG operations ----------

/**
 * @brief Construct a binary CSG node from JSON.
 * @param j Payload with operator ("union","intersection","difference"), left, right.
 * @return Composed CSG primitive.
 */
std::shared_ptr<Primitive> make_csg_binary(const json& j, const LoadContext& ctx) {
    if (!j.contains("operator") || !j.contains("left") || !j.contains("right"))
        throw std::runtime_error("csg requires 'operator', 'left', 'right'");
    const std::string op = j.at("operator").get<std::string>();
    CSGOp cop;
    if      (op == "union")        cop = CSGOp::Union;
    else if (op == "intersection") cop = CSGOp::Intersection;
    else if (op == "difference")   cop = CSGOp::Difference;
    else throw std::runtime_error("csg.operator must be union/intersection/difference");
    auto lhs = parse_object_node(j.at("left"), ctx);
    auto rhs = parse_object_node(j.at("right"), ctx);
    return std::make_shared<CSG>(cop, lhs, rhs);
}

/**
 * @brief Fold an array of nodes with a CSG op, left to right.
 * @param arr Array of nodes; at least one, or two for difference.
 * @param op Operation applied left-to-right.
 * @return Composed CSG primitive.
 */
std::shared_ptr<Primitive> fold_csg_array(const json& arr, CSGOp op, const LoadContext& ctx) {
    const size_t min_size = (op == CSGOp::Difference) ? 2 : 1;
    if (!arr.is_array() || arr.size() < min_size)
        throw std::runtime_error(op == CSGOp::Difference
                                     ? "difference array must have at least 2 elements"
                                     : "CSG array must be a non-empty array");
    std::shared_ptr<Primitive> acc = parse_object_node(arr.at(0), ctx);
    for (size_t i = 1; i < arr.size(); ++i) {
        auto rhs = parse_object_node(arr.at(i), ctx);
        acc = std::make_shared<CSG>(op, acc, rhs);
    }
    return acc;
}

/// Builder selected by a node tag.
std::shared_ptr<Primitive> dispatch(const std::string& kind, const json& val, const LoadContext& ctx) {
    // Flat surfaces and host solids
    if (kind == "circle")            return make_circle(val);
    if (kind == "rectangle")         return make_rectangle(val);
    if (kind == "triangle")          return make_triangle(val);
    if (kind == "sphere")            return make_sphere(val);
    if (kind == "cylinder")          return make_cylinder(val);
    if (kind == "box")               return make_box(val);

    // Cap segments
    if (kind == "sphereSegment")     return make_sphere_segment(val);
    if (kind == "cylinderSegment")   return make_cylinder_segment(val);
    if (kind == "torusSegment")      return make_torus_segment(val, ctx);

    // Lenses
    if (kind == "biConvex")          return make_lens(val, LensKind::BiConvex, "biConvex", ctx);
    if (kind == "biConcave")         return make_lens(val, LensKind::BiConcave, "biConcave", ctx);
    if (kind == "meniscus")          return make_lens(val, LensKind::Meniscus, "meniscus", ctx);
    if (kind == "planoConvex")       return make_lens(val, LensKind::PlanoConvex, "planoConvex", ctx);
    if (kind == "planoConcave")      return make_lens(val, LensKind::PlanoConcave, "planoConcave", ctx);

    // Mirrors
    if (kind == "sphericalMirror")   return make_spherical_mirror(val);
    if (kind == "cylindricalMirror") return make_cylindrical_mirror(val);
    if (kind == "toricMirror")       return make_toric_mirror(val, ctx);

    // Prescription surfaces
    if (kind == "lens")              return make_surface_lens(val, ctx);
    if (kind == "mirror")            return make_surface_mirror(val, ctx);

    // Transforms
    if (kind == "translation")       return make_translation(val, ctx);
    if (kind == "rotation")          return make_rotation(val, ctx);

    // Binary CSG
    if (kind == "csg")               return make_csg_binary(val, ctx);

    // Variadic CSG
    if (kind == "union")             return fold_csg_array(val, CSGOp::Union, ctx);
    if (kind == "intersection")      return fold_csg_array(val, CSGOp::Intersection, ctx);
    if (kind == "difference")        return fold_csg_array(val, CSGOp::Difference, ctx);

    throw std::runtime_error("unknown object kind: " + kind);
}

/**
 * @brief Dispatch an object node to its concrete builder.
 * Every payload may carry "name" and a "material" block.
 * @param jnode One-entry object: {kind: payload}.
 * @return Constructed primitive (possibly transformed/CSG).
 */
std::shared_ptr<Primitive> parse_object_node(const json& jnode, const LoadContext& ctx) {
    ensure_object_1key(jnode);
    const auto it = jnode.begin();
    const std::string kind = it.key();
    const json& val = it.value();

    auto prim = dispatch(kind, val, ctx);
    if (val.is_object()) {
        if (val.contains("name")) prim->set_name(val.at("name").get<std::string>());
        if (val.contains("material")) prim->set_material(parse_material_block(val.at("material")));
    }
    return prim;
}

} // anon

// ---------- public API ----------
namespace jsonio {

bool load_elements_from_json_text(const std::string& json_text, ElementSet& out) {
    try {
        json root = json::parse(json_text);

        ElementSet set;
        if (root.contains("settings")) {
            const json& js = root.at("settings");
            set.root_tolerance = get_or<double>(js, "rootTolerance", set.root_tolerance);
            if (!(set.root_tolerance > 0.0)) throw std::runtime_error("settings.rootTolerance must be positive");
        }

        LoadContext ctx;
        ctx.root_tolerance = set.root_tolerance;

        if (root.contains("objects")) {
            const json& arr = root.at("objects");
            if (!arr.is_array()) throw std::runtime_error("'objects' must be an array");
            for (const auto& node : arr) {
                set.elements.push_back(parse_object_node(node, ctx));
            }
        }
        out = std::move(set);
        return true;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("JSON processing error: ") + e.what());
    }
}

bool load_elements_from_json(const std::string& filename, ElementSet& out) {
    std::ifstream ifs(filename);
    if (!ifs) throw std::runtime_error("Cannot open JSON file: " + filename);
    std::ostringstream ss; ss << ifs.rdbuf();
    return load_elements_from_json_text(ss.str(), out);
}

} // namespace jsonio
