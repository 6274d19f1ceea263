#include "core/geo/geodesy.h"

#include <algorithm>
#include <cmath>

namespace aq {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Angular distance in radians.
double angularDistance(const Coordinate& a, const Coordinate& b)
{
    const double lat1 = degreesToRadians(a.latitude);
    const double lat2 = degreesToRadians(b.latitude);
    const double dLat = lat2 - lat1;
    const double dLon = degreesToRadians(b.longitude - a.longitude);

    const double h = std::sin(dLat / 2.0) * std::sin(dLat / 2.0)
                   + std::cos(lat1) * std::cos(lat2)
                     * std::sin(dLon / 2.0) * std::sin(dLon / 2.0);
    return 2.0 * std::atan2(std::sqrt(h), std::sqrt(std::max(0.0, 1.0 - h)));
}

double initialBearingRad(const Coordinate& a, const Coordinate& b)
{
    const double lat1 = degreesToRadians(a.latitude);
    const double lat2 = degreesToRadians(b.latitude);
    const double dLon = degreesToRadians(b.longitude - a.longitude);

    const double y = std::sin(dLon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2)
                   - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);
    return std::atan2(y, x);
}

} // namespace

double degreesToRadians(double degrees)
{
    return degrees * kPi / 180.0;
}

double radiansToDegrees(double radians)
{
    return radians * 180.0 / kPi;
}

double distanceNm(const Coordinate& a, const Coordinate& b)
{
    return angularDistance(a, b) * kEarthRadiusNm;
}

double initialBearingDeg(const Coordinate& a, const Coordinate& b)
{
    const double deg = radiansToDegrees(initialBearingRad(a, b));
    return std::fmod(deg + 360.0, 360.0);
}

double crossTrackNm(const Coordinate& start, const Coordinate& end, const Coordinate& point)
{
    const double d13 = angularDistance(start, point);
    const double theta13 = initialBearingRad(start, point);
    const double theta12 = initialBearingRad(start, end);
    const double xt = std::asin(std::clamp(std::sin(d13) * std::sin(theta13 - theta12), -1.0, 1.0));
    return xt * kEarthRadiusNm;
}

double alongTrackNm(const Coordinate& start, const Coordinate& end, const Coordinate& point)
{
    const double d13 = angularDistance(start, point);
    const double theta13 = initialBearingRad(start, point);
    const double theta12 = initialBearingRad(start, end);
    const double xt = std::asin(std::clamp(std::sin(d13) * std::sin(theta13 - theta12), -1.0, 1.0));

    const double cosXt = std::cos(xt);
    if (cosXt <= 0.0) {
        return 0.0;
    }
    const double at = std::acos(std::clamp(std::cos(d13) / cosXt, -1.0, 1.0));
    // Foot behind the start when the point bears more than 90 degrees off track
    const double sign = std::cos(theta13 - theta12) < 0.0 ? -1.0 : 1.0;
    return sign * at * kEarthRadiusNm;
}

SegmentProjection projectOntoSegment(const Coordinate& start,
                                     const Coordinate& end,
                                     const Coordinate& point)
{
    SegmentProjection projection;
    const double length = distanceNm(start, end);

    // Degenerate route: both endpoints coincide
    if (length < 1e-9) {
        projection.segmentDistanceNm = distanceNm(start, point);
        projection.alongTrackDistanceNm = 0.0;
        return projection;
    }

    const double along = alongTrackNm(start, end, point);
    if (along < 0.0) {
        projection.segmentDistanceNm = distanceNm(start, point);
        projection.alongTrackDistanceNm = 0.0;
    } else if (along > length) {
        projection.segmentDistanceNm = distanceNm(end, point);
        projection.alongTrackDistanceNm = length;
    } else {
        projection.segmentDistanceNm = std::fabs(crossTrackNm(start, end, point));
        projection.alongTrackDistanceNm = along;
    }
    return projection;
}

} // namespace geo
} // namespace aq
