#include <iostream>
#include <vector>
#include <string>
#include <opencv2/opencv.hpp>

#include "core.h"
#include "geometry.h"
#include "hitmap.h"
#include "json_loader.h"
#include "lens.h"
#include "mirror.h"

/**
 * @brief Convert a hit map to an 8-bit single-channel OpenCV image.
 * @param map Sampled assembly.
 * @return cv::Mat with type CV_8UC1; brighter pixels are hit higher along z.
 */
static cv::Mat hitmap_to_mat_gray8(const HitMap& map) {
    cv::Mat img(map.height, map.width, CV_8UC1);
    for (int y = 0; y < map.height; ++y) {
        auto* p = img.ptr<unsigned char>(y);
        for (int x = 0; x < map.width; ++x) {
            p[x] = map.intensity(x, y);
        }
    }
    return img;
}

/// Print one element summary line.
static void describe_element(const Primitive& e) {
    const BoundingBox b = e.bounding_box();
    std::cout << (e.name().empty() ? "<unnamed>" : e.name()) << " [" << e.kind() << "] box "
              << b.lower << " .. " << b.upper << "\n";
    if (const auto* lens = dynamic_cast<const Lens*>(&e)) {
        std::cout << "    " << lens->describe() << "\n";
    } else if (const auto* mirror = dynamic_cast<const Mirror*>(&e)) {
        std::cout << "    " << mirror->describe() << "\n";
    }
}

/**
 * @brief Program entry: load element JSON, print a summary and optionally write a hit map.
 * @param argc Argument count.
 * @param argv Arguments: <elements.json> [hitmap.png] [--size N].
 * @return Exit code: 0 on success; nonzero on usage, load, or I/O errors.
 */
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <elements.json> [hitmap.png] [--size N]\n";
        std::cerr << "  --size: pixels along the longer side of the hit map (default 256)\n";
        return 1;
    }
    const std::string json_path = argv[1];
    std::string out_path;
    int size = 256;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--size") {
            if (i + 1 >= argc) {
                std::cerr << "[error] --size needs a value\n";
                return 1;
            }
            try {
                size = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[error] --size must be an integer\n";
                return 1;
            }
            if (size <= 0) {
                std::cerr << "[error] --size must be positive\n";
                return 1;
            }
        } else {
            out_path = arg;
        }
    }

    ElementSet set;
    try {
        if (!jsonio::load_elements_from_json(json_path, set)) {
            std::cerr << "Failed to load elements from " << json_path << "\n";
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 3;
    }

    std::cout << "Loaded " << set.elements.size() << " element(s), root tolerance "
              << set.root_tolerance << "\n";
    for (const auto& e : set.elements) describe_element(*e);

    if (out_path.empty()) return 0;

    HitMapper mapper;
    mapper.elements = &set.elements;
    mapper.size = size;

    HitMap map;
    mapper.render(map);
    if (map.width == 0) {
        std::cerr << "[warn] nothing to probe; no hit map written\n";
        return 0;
    }

    cv::Mat img = hitmap_to_mat_gray8(map);
    if (!cv::imwrite(out_path, img)) {
        std::cerr << "Failed to write PNG: " << out_path << "\n";
        return 4;
    }

    std::cout << "Wrote " << out_path << " (" << map.width << "x" << map.height << ")\n";
    return 0;
}
