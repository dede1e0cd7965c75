#include "path.hpp"
#include <algorithm>
#include <unordered_set>

std::vector<NodeID> reconstructPath(const PredecessorMap &parent,
                                    NodeID start, NodeID goal) {
  if (start == goal)
    return {start};

  std::vector<NodeID> path;
  std::unordered_set<NodeID> seen;
  NodeID curr = goal;
  while (curr != start) {
    auto it = parent.find(curr);
    if (it == parent.end() || !seen.insert(curr).second)
      return {};
    path.push_back(curr);
    curr = it->second;
  }
  path.push_back(start);
  std::reverse(path.begin(), path.end());
  return path;
}
