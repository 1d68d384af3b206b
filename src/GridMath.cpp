#include "GridMath.hpp"
#include <set>

namespace FlowPairs {

int HitTest(const std::vector<Rect> &rects, const Point &point) {
  for (size_t i = 0; i < rects.size(); ++i) {
    if (rects[i].contains(point)) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool AllCellsDistinct(const EndpointList &pairs) {
  std::set<Cell> seen;
  for (const EndpointPair &pair : pairs) {
    if (!seen.insert(pair.first).second || !seen.insert(pair.second).second) {
      return false;
    }
  }
  return true;
}

} // namespace FlowPairs
