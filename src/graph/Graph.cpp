#include "streamline_city/graph/Graph.h"
#include "streamline_city/geom/GeomUtils.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace streamline_city {
namespace graph {

using geom::GeomUtils;

namespace {

constexpr double SPLIT_EPSILON = 1e-6;

struct Segment {
    glm::vec2 a;
    glm::vec2 b;
    size_t line;   // Source polyline
    size_t index;  // Position within the polyline
};

struct SplitPoint {
    double t;
    glm::vec2 point;
};

int64_t cellKey(int x, int y) {
    return (static_cast<int64_t>(x) << 32) ^ static_cast<int64_t>(static_cast<uint32_t>(y));
}

bool interior(double t) {
    return t > SPLIT_EPSILON && t < 1.0 - SPLIT_EPSILON;
}

/**
 * Spatial hash that merges points closer than the tolerance into one node
 */
class NodeIndex {
public:
    NodeIndex(std::vector<Node>& nodes, float tolerance)
        : nodes_(nodes), tolerance_(tolerance) {}

    size_t findOrAdd(const glm::vec2& p) {
        int cx = static_cast<int>(std::floor(p.x / tolerance_));
        int cy = static_cast<int>(std::floor(p.y / tolerance_));

        for (int x = -1; x <= 1; x++) {
            for (int y = -1; y <= 1; y++) {
                auto it = cells_.find(cellKey(cx + x, cy + y));
                if (it == cells_.end()) continue;
                for (size_t id : it->second) {
                    if (glm::distance(nodes_[id].value, p) <= tolerance_) {
                        return id;
                    }
                }
            }
        }

        size_t id = nodes_.size();
        nodes_.push_back(Node{p, {}});
        cells_[cellKey(cx, cy)].push_back(id);
        return id;
    }

private:
    std::vector<Node>& nodes_;
    float tolerance_;
    std::unordered_map<int64_t, std::vector<size_t>> cells_;
};

} // anonymous namespace

bool Node::hasNeighbor(size_t other) const {
    return std::find(neighbors.begin(), neighbors.end(), other) != neighbors.end();
}

Graph Graph::build(const std::vector<Polyline>& streamlines, float snapTolerance, bool deleteDangling) {
    Graph g;
    const float tolerance = std::max(snapTolerance, 1e-4f);

    // Copy segments
    std::vector<Segment> segments;
    double totalLength = 0.0;
    for (size_t l = 0; l < streamlines.size(); ++l) {
        const auto& line = streamlines[l];
        for (size_t i = 0; i + 1 < line.size(); ++i) {
            float len = glm::distance(line[i], line[i + 1]);
            if (len <= 1e-6f) continue;
            segments.push_back(Segment{line[i], line[i + 1], l, i});
            totalLength += len;
        }
    }
    if (segments.empty()) {
        return g;
    }

    std::vector<std::vector<SplitPoint>> splits(segments.size());
    for (size_t s = 0; s < segments.size(); ++s) {
        splits[s].push_back(SplitPoint{0.0, segments[s].a});
        splits[s].push_back(SplitPoint{1.0, segments[s].b});
    }

    // Bucket segments by their bounding boxes, grown by the tolerance
    const float cellSize = std::max({static_cast<float>(totalLength / segments.size()),
                                     tolerance * 4.0f, 1.0f});
    std::unordered_map<int64_t, std::vector<size_t>> buckets;
    for (size_t s = 0; s < segments.size(); ++s) {
        glm::vec2 lo = glm::min(segments[s].a, segments[s].b) - tolerance;
        glm::vec2 hi = glm::max(segments[s].a, segments[s].b) + tolerance;
        int x0 = static_cast<int>(std::floor(lo.x / cellSize));
        int y0 = static_cast<int>(std::floor(lo.y / cellSize));
        int x1 = static_cast<int>(std::floor(hi.x / cellSize));
        int y1 = static_cast<int>(std::floor(hi.y / cellSize));
        for (int x = x0; x <= x1; ++x) {
            for (int y = y0; y <= y1; ++y) {
                buckets[cellKey(x, y)].push_back(s);
            }
        }
    }

    // Endpoint lying just off the interior of another segment
    auto snapEndpoint = [&](const glm::vec2& p, size_t target) {
        const Segment& seg = segments[target];
        double t = GeomUtils::closestParameter(p, seg.a, seg.b);
        if (!interior(t)) return;
        if (GeomUtils::distanceToSegment(p, seg.a, seg.b) <= tolerance) {
            splits[target].push_back(SplitPoint{t, p});
        }
    };

    std::vector<glm::vec2> crossings;
    std::unordered_set<uint64_t> tested;
    for (const auto& bucket : buckets) {
        const auto& list = bucket.second;
        for (size_t m = 0; m < list.size(); ++m) {
            for (size_t n = m + 1; n < list.size(); ++n) {
                size_t i = std::min(list[m], list[n]);
                size_t j = std::max(list[m], list[n]);
                uint64_t pairKey = (static_cast<uint64_t>(i) << 32) | static_cast<uint64_t>(j);
                if (!tested.insert(pairKey).second) continue;

                const Segment& si = segments[i];
                const Segment& sj = segments[j];
                bool consecutive = si.line == sj.line
                    && (si.index + 1 == sj.index || sj.index + 1 == si.index);

                auto hit = GeomUtils::intersectSegments(si.a, si.b, sj.a, sj.b);
                if (hit.has_value() && (interior(hit->x) || interior(hit->y))) {
                    glm::vec2 p = si.a + (si.b - si.a) * static_cast<float>(hit->x);
                    splits[i].push_back(SplitPoint{hit->x, p});
                    splits[j].push_back(SplitPoint{hit->y, p});
                    crossings.push_back(p);
                }

                if (!consecutive) {
                    snapEndpoint(si.a, j);
                    snapEndpoint(si.b, j);
                    snapEndpoint(sj.a, i);
                    snapEndpoint(sj.b, i);
                }
            }
        }
    }

    // Unify points and connect consecutive split points of every segment
    NodeIndex index(g.nodes_, tolerance);
    for (size_t s = 0; s < segments.size(); ++s) {
        auto& points = splits[s];
        std::sort(points.begin(), points.end(), [](const SplitPoint& p, const SplitPoint& q) {
            if (p.t != q.t) return p.t < q.t;
            if (p.point.x != q.point.x) return p.point.x < q.point.x;
            return p.point.y < q.point.y;
        });

        size_t previous = index.findOrAdd(points.front().point);
        for (size_t k = 1; k < points.size(); ++k) {
            size_t id = index.findOrAdd(points[k].point);
            if (id != previous) {
                g.addEdge(previous, id);
                previous = id;
            }
        }
    }

    std::vector<size_t> crossingIds;
    for (const auto& p : crossings) {
        crossingIds.push_back(index.findOrAdd(p));
    }

    if (deleteDangling) {
        g.deleteDanglingNodes();
    }
    std::vector<size_t> remap = g.removeIsolatedNodes();

    // Intersections as unified node positions
    std::unordered_set<size_t> seen;
    for (size_t id : crossingIds) {
        size_t mapped = remap[id];
        if (mapped != SIZE_MAX && seen.insert(mapped).second) {
            g.intersections_.push_back(g.nodes_[mapped].value);
        }
    }

    SDL_Log("Graph: %zu segments, %zu nodes, %zu edges, %zu intersections",
            segments.size(), g.nodes_.size(), g.edgeCount(), g.intersections_.size());
    return g;
}

size_t Graph::edgeCount() const {
    size_t degrees = 0;
    for (const auto& node : nodes_) {
        degrees += node.neighbors.size();
    }
    return degrees / 2;
}

void Graph::addEdge(size_t a, size_t b) {
    if (a == b || nodes_[a].hasNeighbor(b)) {
        return;
    }
    nodes_[a].neighbors.push_back(b);
    nodes_[b].neighbors.push_back(a);
}

void Graph::deleteDanglingNodes() {
    std::vector<size_t> stack;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].neighbors.size() == 1) {
            stack.push_back(i);
        }
    }

    while (!stack.empty()) {
        size_t n = stack.back();
        stack.pop_back();
        if (nodes_[n].neighbors.size() != 1) continue;

        size_t m = nodes_[n].neighbors.front();
        auto& other = nodes_[m].neighbors;
        other.erase(std::remove(other.begin(), other.end(), n), other.end());
        nodes_[n].neighbors.clear();

        if (other.size() == 1) {
            stack.push_back(m);
        }
    }
}

std::vector<size_t> Graph::removeIsolatedNodes() {
    std::vector<size_t> remap(nodes_.size(), SIZE_MAX);
    std::vector<Node> kept;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i].neighbors.empty()) {
            remap[i] = kept.size();
            kept.push_back(nodes_[i]);
        }
    }
    for (auto& node : kept) {
        for (auto& neighbor : node.neighbors) {
            neighbor = remap[neighbor];
        }
    }
    nodes_ = std::move(kept);
    return remap;
}

} // namespace graph
} // namespace streamline_city
