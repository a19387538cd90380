#pragma once

#include <string>
#include "Detection.hpp"
#include "Geometry.hpp"

namespace ppeAI {
namespace test {

inline Detection makeDetection(const std::string& label, int x1, int y1, int x2, int y2,
                               float confidence = 0.9f) {
    Detection det;
    det.bbox = rectFromCorners(x1, y1, x2, y2);
    det.confidence = confidence;
    det.className = label;
    return det;
}

} // namespace test
} // namespace ppeAI
