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
#ifndef geokit_point_hpp_included_
#define geokit_point_hpp_included_

#include <string>
#include <vector>
#include <stdexcept>
#include <iostream>
#include <iomanip>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "math/geometry_core.hpp"

#include "./coordinatesystem.hpp"

namespace geokit {

struct InvalidCoordinate : public std::runtime_error {
    InvalidCoordinate(const std::string &msg) : std::runtime_error(msg) {}
};

/** Exact decimal input type.
 */
typedef boost::multiprecision::cpp_dec_float_50 Decimal;

/** Immutable geographic point: longitude and latitude in degrees tagged with
 *  coordinate system they are expressed in.
 *
 *  Longitude is always in [-180, 180] and latitude in [-90, 90]; factory
 *  functions throw InvalidCoordinate otherwise.
 */
class CoordinatePoint {
public:
    static CoordinatePoint of(double longitude, double latitude
                              , CoordinateSystem system
                              = CoordinateSystem::wgs84);

    /** Parses both values as decimal numbers.
     */
    static CoordinatePoint of(const std::string &longitude
                              , const std::string &latitude
                              , CoordinateSystem system
                              = CoordinateSystem::wgs84);

    /** Range check is done on exact decimal value before rounding to double.
     */
    static CoordinatePoint of(const Decimal &longitude
                              , const Decimal &latitude
                              , CoordinateSystem system
                              = CoordinateSystem::wgs84);

    double longitude() const { return longitude_; }
    double latitude() const { return latitude_; }
    CoordinateSystem system() const { return system_; }

    /** Longitude/latitude pair as a 2D point.
     */
    math::Point2 lonlat() const { return { longitude_, latitude_ }; }

    /** Same location expressed in another coordinate system.
     */
    CoordinatePoint to(CoordinateSystem system) const;

    bool operator==(const CoordinatePoint &o) const {
        return ((longitude_ == o.longitude_) && (latitude_ == o.latitude_)
                && (system_ == o.system_));
    }

    bool operator!=(const CoordinatePoint &o) const {
        return !operator==(o);
    }

    /** Builds point from transform output. Longitude is wrapped into
     *  [-180, 180] and latitude clamped into [-90, 90]; no validation.
     */
    static CoordinatePoint normalized(const math::Point2 &lonlat
                                      , CoordinateSystem system);

private:
    CoordinatePoint(double longitude, double latitude
                    , CoordinateSystem system)
        : longitude_(longitude), latitude_(latitude), system_(system)
    {}

    double longitude_;
    double latitude_;
    CoordinateSystem system_;
};

typedef std::vector<CoordinatePoint> CoordinatePoints;

inline CoordinatePoint makePoint(double longitude, double latitude
                                 , CoordinateSystem system
                                 = CoordinateSystem::wgs84)
{
    return CoordinatePoint::of(longitude, latitude, system);
}

/** Wraps longitude into [-180, 180].
 */
double wrapLongitude(double longitude);

/** Clamps latitude into [-90, 90].
 */
double clampLatitude(double latitude);

template<typename CharT, typename Traits>
inline std::basic_ostream<CharT, Traits>&
operator<<(std::basic_ostream<CharT, Traits> &os, const CoordinatePoint &p)
{
    const auto flags(os.flags());
    const auto precision(os.precision());
    os << std::fixed << std::setprecision(12)
       << p.longitude() << " " << p.latitude();
    os.flags(flags);
    os.precision(precision);
    return os << " (" << p.system() << ")";
}

} // namespace geokit

#endif // geokit_point_hpp_included_
