#include "RoomDetector.h"
#include "Model.h"
#include <algorithm>
#include <set>

namespace Planform {

namespace {

// State for one depth-first search rooted at a single corner
struct CycleSearch {
    const Model& model;
    const std::set<std::string>& excluded;
    std::vector<std::string> path;
    std::set<std::string> onPath;
    std::set<std::string> explored;

    CycleSearch(const Model& model, const std::set<std::string>& excluded)
        : model(model), excluded(excluded) {}

    bool Visit(
        const std::string& cornerId,
        const std::string& viaWall,
        std::vector<std::string>& outCycle
    ) {
        const Corner* corner = model.FindCorner(cornerId);
        if (!corner) {
            return false;
        }

        explored.insert(cornerId);
        path.push_back(cornerId);
        onPath.insert(cornerId);

        for (const auto& wallId : corner->adjacentWalls) {
            // Walking straight back along the wall we came in on is not
            // a cycle
            if (wallId == viaWall) {
                continue;
            }

            const Wall* wall = model.FindWall(wallId);
            if (!wall) {
                continue;
            }

            const std::string& next = (wall->startCorner == cornerId)
                ? wall->endCorner : wall->startCorner;
            if (next == cornerId || excluded.count(next) > 0) {
                continue;
            }

            if (onPath.count(next) > 0) {
                auto start = std::find(path.begin(), path.end(), next);
                if (std::distance(start, path.end()) >= 3) {
                    outCycle.assign(start, path.end());
                    return true;
                }
                // Two parallel walls between the same pair of corners
                continue;
            }

            if (explored.count(next) > 0) {
                continue;
            }

            if (Visit(next, wallId, outCycle)) {
                return true;
            }
        }

        path.pop_back();
        onPath.erase(cornerId);
        return false;
    }
};

} // namespace

std::vector<std::vector<std::string>> RoomDetector::FindCycles(
    const Model& model
) {
    std::vector<std::vector<std::string>> cycles;
    std::set<std::string> inRoom;
    std::set<std::string> acyclic;

    for (const auto& [cornerId, corner] : model.GetCorners()) {
        if (inRoom.count(cornerId) > 0 || acyclic.count(cornerId) > 0) {
            continue;
        }

        CycleSearch search(model, inRoom);
        std::vector<std::string> cycle;
        if (search.Visit(cornerId, std::string(), cycle)) {
            inRoom.insert(cycle.begin(), cycle.end());
            cycles.push_back(std::move(cycle));
        } else {
            // Nothing reachable from here closes a loop
            acyclic.insert(search.explored.begin(), search.explored.end());
        }
    }

    return cycles;
}

} // namespace Planform
