/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_SMOOTHER_HPP
#define PATH_SMOOTHER_HPP

#include <cstddef>
#include <vector>
#include "utils/Vector2D.hpp"

namespace TerraNav {

struct PathSmoother {
    /**
     * Greedy string pulling: from each kept waypoint jump to the furthest
     * later waypoint the predicate can see. Endpoints are always kept and a
     * smoothed path is a fixed point of this function.
     *
     * @param hasLineOfSight callable (const Vector2D&, const Vector2D&) -> bool
     */
    template <typename LineOfSight>
    static std::vector<Vector2D> smooth(const std::vector<Vector2D>& path, LineOfSight&& hasLineOfSight) {
        if (path.size() <= 2) return path;

        std::vector<Vector2D> out;
        out.reserve(path.size());
        out.push_back(path.front());

        size_t current = 0;
        while (current < path.size() - 1) {
            size_t furthest = current + 1;
            for (size_t j = current + 2; j < path.size(); ++j) {
                if (hasLineOfSight(path[current], path[j])) {
                    furthest = j;
                }
            }
            out.push_back(path[furthest]);
            current = furthest;
        }
        return out;
    }
};

} // namespace TerraNav

#endif // PATH_SMOOTHER_HPP
