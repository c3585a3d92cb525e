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
#include <stdexcept>

#include <gtest/gtest.h>

#include "geokit/polygon.hpp"
#include "geokit/csconvertor.hpp"

using geokit::CoordinatePoint;
using geokit::CoordinatePoints;
using geokit::CoordinateSystem;

namespace {

CoordinatePoint pt(double lon, double lat
                   , CoordinateSystem system = CoordinateSystem::wgs84)
{
    return CoordinatePoint::of(lon, lat, system);
}

CoordinatePoints unitSquare()
{
    return { pt(0, 0), pt(0, 1), pt(1, 1), pt(1, 0) };
}

} // namespace

TEST(PolygonTest, UnitSquare)
{
    const auto square(unitSquare());
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 0.5), square));
    EXPECT_FALSE(geokit::isInPolygon(pt(2, 2), square));
    EXPECT_FALSE(geokit::isInPolygon(pt(-0.5, 0.5), square));
    EXPECT_FALSE(geokit::isInPolygon(pt(0.5, 1.5), square));
}

TEST(PolygonTest, EdgesAreInside)
{
    const auto square(unitSquare());
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 0), square));
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 1), square));
    EXPECT_TRUE(geokit::isInPolygon(pt(0, 0.5), square));
    EXPECT_TRUE(geokit::isInPolygon(pt(1, 0.5), square));
}

TEST(PolygonTest, VerticesAreInside)
{
    const auto square(unitSquare());
    for (const auto &v : square) {
        EXPECT_TRUE(geokit::isInPolygon(v, square)) << v;
    }
}

TEST(PolygonTest, EdgeTolerance)
{
    const auto square(unitSquare());

    // within 1e-7 degrees of the right edge, outside the bounding box
    // is still rejected by the fast path
    EXPECT_TRUE(geokit::isInPolygon(pt(1 - 5e-8, 0.5), square));
    EXPECT_FALSE(geokit::isInPolygon(pt(1 + 5e-8, 0.5), square));

    // coarser tolerance catches points near a diagonal edge
    const CoordinatePoints triangle { pt(0, 0), pt(2, 2), pt(2, 0) };
    const auto near(pt(1.0 - 1e-4, 1.0));
    EXPECT_FALSE(geokit::isInPolygon(near, triangle));
    EXPECT_TRUE(geokit::isInPolygon
                (near, triangle, geokit::GeometryOptions().tolerance(1e-3)));
}

TEST(PolygonTest, DegeneratePolygonContainsNothing)
{
    const CoordinatePoints none;
    const CoordinatePoints one { pt(0, 0) };
    const CoordinatePoints two { pt(0, 0), pt(1, 1) };

    EXPECT_FALSE(geokit::isInPolygon(pt(0, 0), none));
    EXPECT_FALSE(geokit::isInPolygon(pt(0, 0), one));
    EXPECT_FALSE(geokit::isInPolygon(pt(0, 0), two));
    EXPECT_FALSE(geokit::isInPolygon(pt(0.5, 0.5), two));
}

TEST(PolygonTest, ClosedRing)
{
    auto ring(unitSquare());
    ring.push_back(ring.front());

    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 0.5), ring));
    EXPECT_TRUE(geokit::isInPolygon(pt(0, 0), ring));
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 0), ring));
    EXPECT_FALSE(geokit::isInPolygon(pt(1.5, 0.5), ring));

    // ray through the closing vertex
    const CoordinatePoints diamond {
        pt(1, 0), pt(2, 1), pt(1, 2), pt(0, 1), pt(1, 0)
    };
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 1), diamond));
    EXPECT_TRUE(geokit::isInPolygon(pt(1, 0.5), diamond));
    EXPECT_FALSE(geokit::isInPolygon(pt(0.2, 0.2), diamond));

}

TEST(PolygonTest, ClosedSegmentContainsItsEdge)
{
    // closing the ring must not change the answer
    const CoordinatePoints closedSegment { pt(0, 0), pt(1, 1), pt(0, 0) };
    const CoordinatePoints collinear { pt(0, 0), pt(1, 1), pt(0.5, 0.5) };

    EXPECT_TRUE(geokit::isInPolygon(pt(0.25, 0.25), closedSegment));
    EXPECT_TRUE(geokit::isInPolygon(pt(0.25, 0.25), collinear));
    EXPECT_TRUE(geokit::isInPolygon(pt(1, 1), closedSegment));

    EXPECT_FALSE(geokit::isInPolygon(pt(0.5, 0.25), closedSegment));
    EXPECT_FALSE(geokit::isInPolygon(pt(0.5, 0.25), collinear));
    EXPECT_FALSE(geokit::isInPolygon(pt(2, 2), closedSegment));
}

TEST(PolygonTest, RayThroughVertex)
{
    // ray from the point passes exactly through vertex (2, 1)
    const CoordinatePoints diamond { pt(1, 0), pt(2, 1), pt(1, 2), pt(0, 1) };
    EXPECT_TRUE(geokit::isInPolygon(pt(1, 1), diamond));
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 1), diamond));

    // both bottom vertices of the notch share the point's latitude
    const CoordinatePoints notched {
        pt(0, 0), pt(4, 0), pt(4, 2), pt(3, 1), pt(2, 2), pt(1, 1), pt(0, 2)
    };
    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 1), notched));
    EXPECT_TRUE(geokit::isInPolygon(pt(2, 1), notched));
    EXPECT_FALSE(geokit::isInPolygon(pt(1, 1.5), notched));
    EXPECT_TRUE(geokit::isInPolygon(pt(2, 1.5), notched));
}

TEST(PolygonTest, HorizontalAndVerticalEdges)
{
    const CoordinatePoints rect { pt(10, 20), pt(10, 25), pt(15, 25)
                                  , pt(15, 20) };

    // latitude equal to the horizontal edges
    EXPECT_TRUE(geokit::isInPolygon(pt(12, 20), rect));
    EXPECT_TRUE(geokit::isInPolygon(pt(12, 25), rect));

    // on vertical edges
    EXPECT_TRUE(geokit::isInPolygon(pt(10, 22), rect));
    EXPECT_TRUE(geokit::isInPolygon(pt(15, 22), rect));

    EXPECT_TRUE(geokit::isInPolygon(pt(12.5, 22.5), rect));
    EXPECT_FALSE(geokit::isInPolygon(pt(16, 22.5), rect));
}

TEST(PolygonTest, Concave)
{
    // U shape opened to the north
    const CoordinatePoints u {
        pt(0, 0), pt(3, 0), pt(3, 3), pt(2, 3), pt(2, 1), pt(1, 1)
        , pt(1, 3), pt(0, 3)
    };

    EXPECT_TRUE(geokit::isInPolygon(pt(0.5, 2), u));
    EXPECT_TRUE(geokit::isInPolygon(pt(2.5, 2), u));
    EXPECT_TRUE(geokit::isInPolygon(pt(1.5, 0.5), u));
    EXPECT_FALSE(geokit::isInPolygon(pt(1.5, 2), u));
    EXPECT_TRUE(geokit::isInPolygon(pt(1.5, 1), u));
}

TEST(PolygonTest, MixedCoordinateSystems)
{
    // ~1 km square around Tian'anmen in WGS84
    const CoordinatePoints wgs {
        pt(116.39, 39.90), pt(116.40, 39.90), pt(116.40, 39.91)
        , pt(116.39, 39.91)
    };

    CoordinatePoints bd;
    for (const auto &p : wgs) { bd.push_back(p.to(CoordinateSystem::bd09)); }

    const auto centre(pt(116.395, 39.905));
    EXPECT_TRUE(geokit::isInPolygon(centre, wgs));
    EXPECT_TRUE(geokit::isInPolygon(centre, bd));
    EXPECT_TRUE(geokit::isInPolygon(centre.to(CoordinateSystem::gcj02), bd));

    // inside the raw BD09 numbers but not the actual area
    const auto shifted(pt(116.4105, 39.912));
    EXPECT_FALSE(geokit::isInPolygon(shifted, bd));
}

TEST(PolygonTest, ExtentsAndCorners)
{
    const CoordinatePoints points { pt(3, -1), pt(-2, 4), pt(1, 1) };

    const auto e(geokit::extents(points));
    EXPECT_EQ(-2.0, e.ll(0));
    EXPECT_EQ(-1.0, e.ll(1));
    EXPECT_EQ(3.0, e.ur(0));
    EXPECT_EQ(4.0, e.ur(1));

    EXPECT_EQ(pt(-2, -1), geokit::southWest(points));
    EXPECT_EQ(pt(3, 4), geokit::northEast(points));

    EXPECT_THROW(geokit::southWest(CoordinatePoints()), std::invalid_argument);
    EXPECT_THROW(geokit::northEast(CoordinatePoints()), std::invalid_argument);

    EXPECT_TRUE(geokit::isInExtents(pt(3, 4), points));
    EXPECT_TRUE(geokit::isInExtents(pt(0, 0), points));
    EXPECT_FALSE(geokit::isInExtents(pt(3.1, 0), points));
    EXPECT_FALSE(geokit::isInExtents(pt(0, 0), CoordinatePoints()));
}

TEST(PolygonTest, Rectangle)
{
    EXPECT_TRUE(geokit::isInRectangle(pt(1, 1), pt(2, 0), pt(0, 2)));
    EXPECT_TRUE(geokit::isInRectangle(pt(2, 2), pt(2, 0), pt(0, 2)));
    EXPECT_FALSE(geokit::isInRectangle(pt(1, 2.5), pt(2, 0), pt(0, 2)));
}

TEST(PolygonTest, OnSegment)
{
    EXPECT_TRUE(geokit::isOnSegment(pt(0.5, 0.5), pt(0, 0), pt(1, 1)));
    EXPECT_TRUE(geokit::isOnSegment(pt(0, 0), pt(0, 0), pt(1, 1)));
    EXPECT_FALSE(geokit::isOnSegment(pt(1.5, 1.5), pt(0, 0), pt(1, 1)));
    EXPECT_FALSE(geokit::isOnSegment(pt(0.5, 0.6), pt(0, 0), pt(1, 1)));
    EXPECT_TRUE(geokit::isOnSegment(pt(0.5, 0.6), pt(0, 0), pt(1, 1), 0.2));
}
