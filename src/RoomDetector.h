#pragma once

#include <string>
#include <vector>

namespace Planform {

class Model;

/**
 * Extracts closed corner cycles from the wall graph.
 *
 * Corners are nodes and walls undirected edges. A depth-first search from
 * each unvisited corner reports the first simple cycle it closes; the
 * cycle's corners are then excluded from later searches. This yields at
 * most one cycle per region, so two rooms sharing a wall are not both
 * reported.
 */
class RoomDetector {
public:
    /**
     * Find candidate rooms.
     * @param model Document whose corners/walls are searched
     * @return Corner id cycles in traversal order, each at least 3 long
     */
    static std::vector<std::vector<std::string>> FindCycles(
        const Model& model
    );
};

} // namespace Planform
