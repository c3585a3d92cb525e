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

#include "math/math.hpp"

#include "./distance.hpp"
#include "./csconvertor.hpp"

namespace geokit {

namespace {

constexpr double DEG2RAD(M_PI / 180.);

} // namespace

double distanceMeters(const CoordinatePoint &a, const CoordinatePoint &b
                      , const GeometryOptions &options)
{
    const auto wa(convert(a, CoordinateSystem::wgs84));
    const auto wb(convert(b, CoordinateSystem::wgs84));

    const double lat1(wa.latitude() * DEG2RAD);
    const double lat2(wb.latitude() * DEG2RAD);

    // abs keeps the formula commutative down to the last bit
    const double dLat(std::abs(lat1 - lat2));
    const double dLon(std::abs(wa.longitude() * DEG2RAD
                               - wb.longitude() * DEG2RAD));

    const double h(math::sqr(std::sin(dLat / 2))
                   + std::cos(lat1) * std::cos(lat2)
                   * math::sqr(std::sin(dLon / 2)));

    // clamp rounding noise for antipodal points
    return 2 * std::asin(std::sqrt(std::min(h, 1.0))) * options.earthRadius;
}

double distanceKilometers(const CoordinatePoint &a, const CoordinatePoint &b
                          , const GeometryOptions &options)
{
    return distanceMeters(a, b, options) / 1000;
}

double distanceMeters(double lon1, double lat1, double lon2, double lat2
                      , const GeometryOptions &options)
{
    return distanceMeters(CoordinatePoint::of(lon1, lat1)
                          , CoordinatePoint::of(lon2, lat2), options);
}

double distanceMeters(const std::string &lon1, const std::string &lat1
                      , const std::string &lon2, const std::string &lat2
                      , const GeometryOptions &options)
{
    return distanceMeters(CoordinatePoint::of(lon1, lat1)
                          , CoordinatePoint::of(lon2, lat2), options);
}

double distanceMeters(const Decimal &lon1, const Decimal &lat1
                      , const Decimal &lon2, const Decimal &lat2
                      , const GeometryOptions &options)
{
    return distanceMeters(CoordinatePoint::of(lon1, lat1)
                          , CoordinatePoint::of(lon2, lat2), options);
}

double distanceKilometers(double lon1, double lat1, double lon2, double lat2
                          , const GeometryOptions &options)
{
    return distanceMeters(lon1, lat1, lon2, lat2, options) / 1000;
}

double distanceKilometers(const std::string &lon1, const std::string &lat1
                          , const std::string &lon2, const std::string &lat2
                          , const GeometryOptions &options)
{
    return distanceMeters(lon1, lat1, lon2, lat2, options) / 1000;
}

double distanceKilometers(const Decimal &lon1, const Decimal &lat1
                          , const Decimal &lon2, const Decimal &lat2
                          , const GeometryOptions &options)
{
    return distanceMeters(lon1, lat1, lon2, lat2, options) / 1000;
}

bool isInCircle(const CoordinatePoint &point, const CoordinatePoint &center
                , double radiusMeters, const GeometryOptions &options)
{
    return distanceMeters(point, center, options) <= radiusMeters;
}

} // namespace geokit
