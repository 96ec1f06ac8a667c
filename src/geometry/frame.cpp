#include "geometry/frame.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace bmc_2d {

namespace {
    double signed_area(const std::vector<Vec2>& v) {
        double area = 0.0;
        for (size_t i = 0; i < v.size(); ++i) {
            const Vec2& a = v[i];
            const Vec2& b = v[(i + 1) % v.size()];
            area += a.cross(b);
        }
        return 0.5 * area;
    }

    double distance_to_segment(const Vec2& p, const Edge& e) {
        Vec2 d = e.direction();
        double len2 = d.norm2();
        double s = (p - e.p0()).dot(d) / len2;
        s = std::max(0.0, std::min(1.0, s));
        return (p - e.point_at(s)).norm();
    }
}

Frame::Frame(const std::vector<Vec2>& vertices, const std::vector<int>& layers)
    : vertices_(vertices)
{
    if (vertices_.size() >= 2 && vertices_.front() == vertices_.back()) {
        vertices_.pop_back();
    }
    if (vertices_.size() < 3) {
        throw std::invalid_argument("Frame: at least 3 vertices are required");
    }
    if (layers.size() != vertices_.size()) {
        throw std::invalid_argument("Frame: expected " + std::to_string(vertices_.size()) +
                                    " layers, got " + std::to_string(layers.size()));
    }

    const double area = signed_area(vertices_);
    if (area == 0.0) {
        throw std::invalid_argument("Frame: polygon has zero area");
    }

    edges_.reserve(vertices_.size());
    for (size_t i = 0; i < vertices_.size(); ++i) {
        Edge e(vertices_[i], vertices_[(i + 1) % vertices_.size()], layers[i]);
        // Left-hand normals point inward for counter-clockwise polygons
        if (area < 0.0) {
            e.flip_normal();
        }
        edges_.push_back(std::move(e));
    }

    table_ = SegmentTable(edges_);
}

Frame Frame::rectangle(double width, double height, const std::array<int, 4>& layers) {
    if (width <= 0.0 || height <= 0.0) {
        throw std::invalid_argument("Frame: rectangle dimensions must be positive");
    }
    std::vector<Vec2> v = {{0.0, 0.0}, {width, 0.0}, {width, height}, {0.0, height}};
    return Frame(v, std::vector<int>(layers.begin(), layers.end()));
}

int Frame::max_layer() const {
    int max_layer = 0;
    for (const auto& e : edges_) {
        max_layer = std::max(max_layer, e.layer());
    }
    return max_layer;
}

std::vector<std::size_t> Frame::edges_in_layer(int layer) const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < edges_.size(); ++i) {
        if (edges_[i].layer() == layer) {
            out.push_back(i);
        }
    }
    return out;
}

bool Frame::contains(const Vec2& p, double tolerance) const {
    bool inside = false;
    for (const auto& e : edges_) {
        if (distance_to_segment(p, e) <= tolerance) {
            return true;
        }
        const Vec2& a = e.p0();
        const Vec2& b = e.p1();
        if ((a.y > p.y) != (b.y > p.y)) {
            double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

void Frame::set_edge_in_prob(std::size_t i, std::vector<double> in_prob, std::vector<double> cum_prob) {
    edges_.at(i).set_in_prob(std::move(in_prob), std::move(cum_prob));
}

std::pair<Vec2, std::size_t> Frame::sample_injection(int layer, std::mt19937& rng) const {
    std::vector<std::size_t> candidates = edges_in_layer(layer);
    if (candidates.empty()) {
        throw std::invalid_argument("Frame: no edge in injection layer " + std::to_string(layer));
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::size_t chosen = candidates.front();
    if (candidates.size() > 1) {
        double total = 0.0;
        for (std::size_t i : candidates) {
            total += edges_[i].length();
        }
        double target = uniform(rng) * total;
        double acc = 0.0;
        chosen = candidates.back();
        for (std::size_t i : candidates) {
            acc += edges_[i].length();
            if (target < acc) {
                chosen = i;
                break;
            }
        }
    }

    double u = uniform(rng);
    return {edges_[chosen].point_at(u), chosen};
}

} // namespace bmc_2d
