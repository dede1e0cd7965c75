#ifndef PATH_HPP
#define PATH_HPP

#include "types.hpp"
#include <unordered_map>
#include <vector>

using PredecessorMap = std::unordered_map<NodeID, NodeID>;

// Walks predecessors back from goal to start and returns start..goal.
// Returns [start] when start == goal, and an empty path when the chain is
// broken (goal unreached) or cycles before reaching start.
std::vector<NodeID> reconstructPath(const PredecessorMap &parent,
                                    NodeID start, NodeID goal);

#endif // PATH_HPP
