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
#ifndef geokit_distance_hpp_included_
#define geokit_distance_hpp_included_

#include <string>

#include "./point.hpp"
#include "./options.hpp"

namespace geokit {

/** Great-circle (haversine) distance in meters.
 *
 *  Both points are converted to WGS84 first. Symmetric: distance(a, b) is
 *  bitwise equal to distance(b, a).
 */
double distanceMeters(const CoordinatePoint &a, const CoordinatePoint &b
                      , const GeometryOptions &options = GeometryOptions());

double distanceKilometers(const CoordinatePoint &a, const CoordinatePoint &b
                          , const GeometryOptions &options
                          = GeometryOptions());

/** WGS84 longitude/latitude pairs. Throws InvalidCoordinate on invalid
 *  input.
 */
double distanceMeters(double lon1, double lat1, double lon2, double lat2
                      , const GeometryOptions &options = GeometryOptions());

double distanceMeters(const std::string &lon1, const std::string &lat1
                      , const std::string &lon2, const std::string &lat2
                      , const GeometryOptions &options = GeometryOptions());

/** Exact decimal input, range checked before rounding to double.
 */
double distanceMeters(const Decimal &lon1, const Decimal &lat1
                      , const Decimal &lon2, const Decimal &lat2
                      , const GeometryOptions &options = GeometryOptions());

double distanceKilometers(double lon1, double lat1, double lon2, double lat2
                          , const GeometryOptions &options
                          = GeometryOptions());

double distanceKilometers(const std::string &lon1, const std::string &lat1
                          , const std::string &lon2, const std::string &lat2
                          , const GeometryOptions &options
                          = GeometryOptions());

double distanceKilometers(const Decimal &lon1, const Decimal &lat1
                          , const Decimal &lon2, const Decimal &lat2
                          , const GeometryOptions &options
                          = GeometryOptions());

/** Point lies in circle iff its distance from center is at most radius
 *  (meters). Boundary is inclusive.
 */
bool isInCircle(const CoordinatePoint &point, const CoordinatePoint &center
                , double radiusMeters
                , const GeometryOptions &options = GeometryOptions());

} // namespace geokit

#endif // geokit_distance_hpp_included_
