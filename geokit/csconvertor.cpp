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
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "./csconvertor.hpp"

namespace geokit {

namespace {

constexpr double PI(3.1415926535897932384626);
constexpr double X_PI(3.14159265358979324 * 3000.0 / 180.0);

// Krasovsky 1940 ellipsoid
constexpr double KRASOVSKY_A(6378245.0);
constexpr double KRASOVSKY_EE(0.00669342162296594323);

constexpr double BD09_LNG_SHIFT(0.0065);
constexpr double BD09_LAT_SHIFT(0.006);

double deltaLat(double x, double y)
{
    double ret(-100.0 + 2.0 * x + 3.0 * y + 0.2 * y * y + 0.1 * x * y
               + 0.2 * std::sqrt(std::abs(x)));
    ret += (20.0 * std::sin(6.0 * x * PI) + 20.0 * std::sin(2.0 * x * PI))
        * 2.0 / 3.0;
    ret += (20.0 * std::sin(y * PI) + 40.0 * std::sin(y / 3.0 * PI))
        * 2.0 / 3.0;
    ret += (160.0 * std::sin(y / 12.0 * PI) + 320 * std::sin(y * PI / 30.0))
        * 2.0 / 3.0;
    return ret;
}

double deltaLng(double x, double y)
{
    double ret(300.0 + x + 2.0 * y + 0.1 * x * x + 0.1 * x * y
               + 0.1 * std::sqrt(std::abs(x)));
    ret += (20.0 * std::sin(6.0 * x * PI) + 20.0 * std::sin(2.0 * x * PI))
        * 2.0 / 3.0;
    ret += (20.0 * std::sin(x * PI) + 40.0 * std::sin(x / 3.0 * PI))
        * 2.0 / 3.0;
    ret += (150.0 * std::sin(x / 12.0 * PI) + 300.0 * std::sin(x / 30.0 * PI))
        * 2.0 / 3.0;
    return ret;
}

/** GCJ02 offset (in degrees) of given location, scaled by the ellipsoid
 *  at its latitude.
 */
math::Point2 offset(double lng, double lat)
{
    double dLat(deltaLat(lng - 105.0, lat - 35.0));
    double dLng(deltaLng(lng - 105.0, lat - 35.0));
    const double radLat(lat / 180.0 * PI);
    double magic(std::sin(radLat));
    magic = 1 - KRASOVSKY_EE * magic * magic;
    const double sqrtMagic(std::sqrt(magic));
    dLat = (dLat * 180.0)
        / ((KRASOVSKY_A * (1 - KRASOVSKY_EE)) / (magic * sqrtMagic) * PI);
    dLng = (dLng * 180.0) / (KRASOVSKY_A / sqrtMagic * std::cos(radLat) * PI);
    return { dLng, dLat };
}

math::Point2 transform(const math::Point2 &p, CoordinateSystem from
                       , CoordinateSystem to)
{
    switch (from) {
    case CoordinateSystem::wgs84:
        switch (to) {
        case CoordinateSystem::wgs84: return p;
        case CoordinateSystem::gcj02: return wgs84ToGcj02(p);
        case CoordinateSystem::bd09: return gcj02ToBd09(wgs84ToGcj02(p));
        }
        break;

    case CoordinateSystem::gcj02:
        switch (to) {
        case CoordinateSystem::wgs84: return gcj02ToWgs84(p);
        case CoordinateSystem::gcj02: return p;
        case CoordinateSystem::bd09: return gcj02ToBd09(p);
        }
        break;

    case CoordinateSystem::bd09:
        switch (to) {
        case CoordinateSystem::wgs84: return gcj02ToWgs84(bd09ToGcj02(p));
        case CoordinateSystem::gcj02: return bd09ToGcj02(p);
        case CoordinateSystem::bd09: return p;
        }
        break;
    }

    LOGTHROW(err1, std::logic_error)
        << "Unsupported coordinate system transformation ("
        << from << " -> " << to << ").";
    throw;
}

math::Point2 normalize(const math::Point2 &p)
{
    return { wrapLongitude(p(0)), clampLatitude(p(1)) };
}

} // namespace

bool outOfRegion(double longitude, double latitude)
{
    return ((longitude < 72.004) || (longitude > 137.8347)
            || (latitude < 0.8293) || (latitude > 55.8271));
}

math::Point2 wgs84ToGcj02(const math::Point2 &p)
{
    const double lng(p(0)), lat(p(1));
    if (outOfRegion(lng, lat)) { return p; }

    const auto d(offset(lng, lat));
    const double mgLat(lat + d(1));
    const double mgLng(lng + d(0));
    return { mgLng, mgLat };
}

math::Point2 gcj02ToWgs84(const math::Point2 &p)
{
    const double lng(p(0)), lat(p(1));
    if (outOfRegion(lng, lat)) { return p; }

    // treat GCJ02 input as if it were WGS84 and reflect the shifted point
    // across the input point
    const auto d(offset(lng, lat));
    const double mgLat(lat + d(1));
    const double mgLng(lng + d(0));
    return { lng * 2 - mgLng, lat * 2 - mgLat };
}

math::Point2 gcj02ToBd09(const math::Point2 &p)
{
    const double x(p(0)), y(p(1));
    const double z(std::sqrt(x * x + y * y)
                   + 0.00002 * std::sin(y * X_PI));
    const double theta(std::atan2(y, x) + 0.000003 * std::cos(x * X_PI));
    return { z * std::cos(theta) + BD09_LNG_SHIFT
            , z * std::sin(theta) + BD09_LAT_SHIFT };
}

math::Point2 bd09ToGcj02(const math::Point2 &p)
{
    const double x(p(0) - BD09_LNG_SHIFT);
    const double y(p(1) - BD09_LAT_SHIFT);
    const double z(std::sqrt(x * x + y * y)
                   - 0.00002 * std::sin(y * X_PI));
    const double theta(std::atan2(y, x) - 0.000003 * std::cos(x * X_PI));
    return { z * std::cos(theta), z * std::sin(theta) };
}

CsConvertor::CsConvertor(CoordinateSystem from, CoordinateSystem to)
    : from_(from), to_(to)
{
    LOG(info1) << "Coordinate system transformation ("
               << from_ << " -> " << to_ << ").";
}

CsConvertor::CsConvertor()
    : from_(CoordinateSystem::wgs84), to_(CoordinateSystem::wgs84)
{
    LOG(info1) << "Coordinate system transformation: no-op.";
}

math::Point2 CsConvertor::operator()(const math::Point2 &p) const
{
    if (from_ == to_) { return p; }
    return normalize(transform(p, from_, to_));
}

CoordinatePoint CsConvertor::operator()(const CoordinatePoint &p) const
{
    if (p.system() != from_) {
        LOGTHROW(err1, std::logic_error)
            << "Point " << p << " is not in source coordinate system "
            << from_ << ".";
    }
    if (from_ == to_) { return p; }
    return CoordinatePoint::normalized(transform(p.lonlat(), from_, to_)
                                       , to_);
}

CoordinatePoint convert(const CoordinatePoint &point
                        , CoordinateSystem target)
{
    if (point.system() == target) { return point; }
    return CoordinatePoint::normalized
        (transform(point.lonlat(), point.system(), target), target);
}

} // namespace geokit
