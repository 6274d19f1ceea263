#pragma once

#include "core/shared/types.h"

namespace aq {
namespace geo {

// Mean Earth radius in nautical miles.
constexpr double kEarthRadiusNm = 3440.065;

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);

// Great-circle distance (haversine).
double distanceNm(const Coordinate& a, const Coordinate& b);

// Initial true bearing from a to b, in degrees [0, 360).
double initialBearingDeg(const Coordinate& a, const Coordinate& b);

// Signed distance of point from the great circle through start -> end.
// Positive to the right of the track.
double crossTrackNm(const Coordinate& start, const Coordinate& end, const Coordinate& point);

// Distance from start to the foot of the perpendicular from point, measured
// along the track. Negative when the foot lies behind start.
double alongTrackNm(const Coordinate& start, const Coordinate& end, const Coordinate& point);

struct SegmentProjection {
    double segmentDistanceNm = 0.0;   // distance to the closest point of the segment
    double alongTrackDistanceNm = 0.0;  // clamped to [0, segment length]
};

// Projection of point onto the great-circle segment start -> end. When the
// perpendicular foot falls outside the segment the nearer endpoint is used.
SegmentProjection projectOntoSegment(const Coordinate& start,
                                     const Coordinate& end,
                                     const Coordinate& point);

} // namespace geo
} // namespace aq
