#include "hitmap.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

unsigned char HitMap::intensity(int x, int y) const {
    const double z = depth[static_cast<size_t>(y) * width + x];
    if (std::isnan(z)) return 0;
    const double ez = bounds.extent(2);
    const double u = (ez > 0.0) ? (z - bounds.lower.z) / ez : 1.0;
    const double c = std::min(1.0, std::max(0.0, u));
    return static_cast<unsigned char>(1 + std::lround(254.0 * c));
}

BoundingBox HitMapper::assembly_bounds() const {
    BoundingBox box;
    if (!elements) return box;
    for (const auto& e : *elements) {
        const BoundingBox b = e->bounding_box();
        if (!b.empty()) box = box.united(b);
    }
    return box;
}

void HitMapper::render(HitMap& out) const {
    out = HitMap();
    const BoundingBox box = assembly_bounds();
    if (box.empty() || size <= 0) return;

    const double ex = box.extent(0), ey = box.extent(1), ez = box.extent(2);
    const double pixel = std::max(ex, ey) / size;
    if (!(pixel > 0.0)) return;

    // the longer side divides exactly into size pixels
    const int nx = std::max(1, static_cast<int>(std::ceil(ex / pixel - 1e-9)));
    const int ny = std::max(1, static_cast<int>(std::ceil(ey / pixel - 1e-9)));
    out.width = nx;
    out.height = ny;
    out.bounds = box;
    out.depth.assign(static_cast<size_t>(nx) * ny, std::nan(""));
    out.crossings.assign(static_cast<size_t>(nx) * ny, 0);

    // rays start above the box so every element lies ahead of them
    const double z0 = box.upper.z + std::max(1e-3, ez);
    const auto start = std::chrono::steady_clock::now();
    auto seconds = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    ProbeProgress progress;
    progress.rows = ny;
    if (show_progress) std::cout << "Probing " << nx << "x" << ny << " rays\n";
    for (int y = 0; y < ny; ++y) {
        if (show_progress && y % 5 == 0) report_progress(std::cout, progress, seconds());
        const double wy = box.upper.y - (y + 0.5) * pixel;  // top row first
        for (int x = 0; x < nx; ++x) {
            const double wx = box.lower.x + (x + 0.5) * pixel;
            const Ray r(Point3(wx, wy, z0), Dir3(0, 0, -1));

            const size_t idx = static_cast<size_t>(y) * nx + x;
            double nearest = kINF;
            for (const auto& e : *elements) {
                const HitList hits = e->hit_all(r);
                out.crossings[idx] += static_cast<int>(hits.size());
                if (!hits.empty()) nearest = std::min(nearest, hits.front().t);
            }
            if (nearest < kINF) {
                out.depth[idx] = z0 - nearest;
                ++progress.covered;
            }
            progress.crossings += out.crossings[idx];
            ++progress.rays;
        }
        progress.rows_done = y + 1;
    }

    if (show_progress) {
        report_progress(std::cout, progress, seconds());
        std::cout << "\nProbing complete!\n";
    }
}

void HitMapper::report_progress(std::ostream& os, const ProbeProgress& p, double seconds) {
    os << "\rrow " << p.rows_done << '/' << p.rows
       << " | " << p.rays << " rays, " << p.covered << " covered, " << p.crossings << " crossings";
    if (seconds > 0.0 && p.rays > 0) {
        os << " | " << static_cast<long long>(p.rays / seconds) << " rays/s";
    }
    os << std::flush;
}
