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
#ifndef geokit_polygon_hpp_included_
#define geokit_polygon_hpp_included_

#include "math/geometry_core.hpp"

#include "./point.hpp"
#include "./options.hpp"

namespace geokit {

/** Point-in-polygon test.
 *
 *  Boundary is an ordered ring of vertices; the ring is implicitly closed,
 *  a last vertex equal to the first one is ignored. Boundary vertices are
 *  converted into the point's coordinate system before any comparison.
 *
 *  Boundary is inclusive: a point lying on an edge (within
 *  options.segmentTolerance) or on a vertex is inside. Less than 3 vertices
 *  never contain anything.
 */
bool isInPolygon(const CoordinatePoint &point
                 , const CoordinatePoints &boundary
                 , const GeometryOptions &options = GeometryOptions());

/** Tests whether point lies on segment p1-p2 within given tolerance
 *  (degrees). Raw longitude/latitude values are compared, all three points
 *  are expected to be in the same coordinate system.
 */
bool isOnSegment(const CoordinatePoint &point, const CoordinatePoint &p1
                 , const CoordinatePoint &p2
                 , double tolerance = GeometryOptions().segmentTolerance);

/** Longitude/latitude extents of given points (raw values, no conversion).
 *  Returns invalid extents for empty input.
 */
math::Extents2 extents(const CoordinatePoints &points);

/** South-west corner of the points' bounding rectangle, in the coordinate
 *  system of the first point. Throws std::invalid_argument on empty input.
 */
CoordinatePoint southWest(const CoordinatePoints &points);

/** North-east corner of the points' bounding rectangle, in the coordinate
 *  system of the first point. Throws std::invalid_argument on empty input.
 */
CoordinatePoint northEast(const CoordinatePoints &points);

/** Point lies inside (or on) the bounding rectangle of given points.
 */
bool isInExtents(const CoordinatePoint &point
                 , const CoordinatePoints &points);

/** Point lies inside (or on) the rectangle with diagonal corner1-corner2.
 */
bool isInRectangle(const CoordinatePoint &point
                   , const CoordinatePoint &corner1
                   , const CoordinatePoint &corner2);

} // namespace geokit

#endif // geokit_polygon_hpp_included_
