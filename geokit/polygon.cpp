/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <cmath>
#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "./polygon.hpp"
#include "./csconvertor.hpp"

namespace geokit {

namespace {

/** Returns boundary expressed in given coordinate system.
 */
CoordinatePoints inSystem(const CoordinatePoints &points
                          , CoordinateSystem system)
{
    CoordinatePoints out;
    out.reserve(points.size());
    std::transform(points.begin(), points.end(), std::back_inserter(out)
                   , [system](const CoordinatePoint &p) {
                       return convert(p, system);
                   });
    return out;
}

inline bool inside(const math::Extents2 &e, double x, double y)
{
    return ((x >= e.ll(0)) && (x <= e.ur(0))
            && (y >= e.ll(1)) && (y <= e.ur(1)));
}

CoordinatePoint corner(const CoordinatePoints &points, bool sw
                       , const char *what)
{
    if (points.empty()) {
        LOGTHROW(err1, std::invalid_argument)
            << "Cannot compute " << what << " corner of no points.";
    }

    const auto system(points.front().system());
    const auto e(extents(inSystem(points, system)));
    return sw
        ? CoordinatePoint::of(e.ll(0), e.ll(1), system)
        : CoordinatePoint::of(e.ur(0), e.ur(1), system);
}

} // namespace

math::Extents2 extents(const CoordinatePoints &points)
{
    math::Extents2 e(math::InvalidExtents{});
    for (const auto &p : points) {
        math::update(e, p.lonlat());
    }
    return e;
}

CoordinatePoint southWest(const CoordinatePoints &points)
{
    return corner(points, true, "south-west");
}

CoordinatePoint northEast(const CoordinatePoints &points)
{
    return corner(points, false, "north-east");
}

bool isInExtents(const CoordinatePoint &point
                 , const CoordinatePoints &points)
{
    if (points.empty()) { return false; }
    return inside(extents(inSystem(points, point.system()))
                  , point.longitude(), point.latitude());
}

bool isInRectangle(const CoordinatePoint &point
                   , const CoordinatePoint &corner1
                   , const CoordinatePoint &corner2)
{
    return isInExtents(point, { corner1, corner2 });
}

bool isOnSegment(const CoordinatePoint &point, const CoordinatePoint &p1
                 , const CoordinatePoint &p2, double tolerance)
{
    const double x(point.longitude()), y(point.latitude());
    const double x1(p1.longitude()), y1(p1.latitude());
    const double x2(p2.longitude()), y2(p2.latitude());

    // segment's bounding box grown by tolerance
    if ((x < std::min(x1, x2) - tolerance)
        || (x > std::max(x1, x2) + tolerance)
        || (y < std::min(y1, y2) - tolerance)
        || (y > std::max(y1, y2) + tolerance))
    {
        return false;
    }

    // collinearity
    const double cross((x - x1) * (y2 - y1) - (y - y1) * (x2 - x1));
    return std::abs(cross) < tolerance;
}

bool isInPolygon(const CoordinatePoint &point
                 , const CoordinatePoints &boundary
                 , const GeometryOptions &options)
{
    if (boundary.size() < 3) {
        LOG(debug) << "Degenerate polygon (" << boundary.size()
                   << " vertices) contains nothing.";
        return false;
    }

    auto ring(inSystem(boundary, point.system()));

    // closing vertex is not an extra edge; a closed two-vertex ring still
    // has its edge walked (twice), so only points on it are contained
    if (ring.front() == ring.back()) { ring.pop_back(); }

    const double x(point.longitude()), y(point.latitude());

    // every polygon lies inside its bounding box
    if (!inside(extents(ring), x, y)) { return false; }

    bool result(false);
    for (std::size_t i(0), j(ring.size() - 1); i < ring.size(); j = i++) {
        const auto &p1(ring[i]);
        const auto &p2(ring[j]);

        if (isOnSegment(point, p1, p2, options.segmentTolerance)) {
            return true;
        }

        const double y1(p1.latitude()), y2(p2.latitude());

        // half-open crossing rule: shared vertices are counted once,
        // horizontal edges never cross
        if (((y1 < y) && (y2 >= y)) || ((y2 < y) && (y1 >= y))) {
            const double x1(p1.longitude()), x2(p2.longitude());
            const double ix(x1 + (y - y1) * (x2 - x1) / (y2 - y1));
            if (x < ix) { result = !result; }
        }
    }

    return result;
}

} // namespace geokit
