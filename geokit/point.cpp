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

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "dbglog/dbglog.hpp"

#include "./point.hpp"
#include "./csconvertor.hpp"

namespace geokit {

namespace {

template <typename T>
void checkLongitude(const T &value)
{
    if (!((value >= -180) && (value <= 180))) {
        LOGTHROW(err1, InvalidCoordinate)
            << "Invalid longitude <" << value
            << ">: expected value in [-180, 180].";
    }
}

template <typename T>
void checkLatitude(const T &value)
{
    if (!((value >= -90) && (value <= 90))) {
        LOGTHROW(err1, InvalidCoordinate)
            << "Invalid latitude <" << value
            << ">: expected value in [-90, 90].";
    }
}

double parse(const std::string &value, const char *field)
{
    double result(.0);
    if (!boost::conversion::try_lexical_convert
        (boost::algorithm::trim_copy(value), result))
    {
        LOGTHROW(err1, InvalidCoordinate)
            << "Invalid " << field << " <" << value
            << ">: not a number.";
    }
    return result;
}

} // namespace

CoordinatePoint CoordinatePoint::of(double longitude, double latitude
                                    , CoordinateSystem system)
{
    checkLongitude(longitude);
    checkLatitude(latitude);
    return { longitude, latitude, system };
}

CoordinatePoint CoordinatePoint::of(const std::string &longitude
                                    , const std::string &latitude
                                    , CoordinateSystem system)
{
    return of(parse(longitude, "longitude"), parse(latitude, "latitude")
              , system);
}

CoordinatePoint CoordinatePoint::of(const Decimal &longitude
                                    , const Decimal &latitude
                                    , CoordinateSystem system)
{
    checkLongitude(longitude);
    checkLatitude(latitude);
    return { longitude.convert_to<double>(), latitude.convert_to<double>()
            , system };
}

CoordinatePoint CoordinatePoint::to(CoordinateSystem system) const
{
    return convert(*this, system);
}

CoordinatePoint CoordinatePoint::normalized(const math::Point2 &lonlat
                                            , CoordinateSystem system)
{
    return { wrapLongitude(lonlat(0)), clampLatitude(lonlat(1)), system };
}

double wrapLongitude(double longitude)
{
    if ((longitude >= -180.0) && (longitude <= 180.0)) { return longitude; }

    auto wrapped(std::fmod(longitude + 180.0, 360.0));
    if (wrapped < 0.0) { wrapped += 360.0; }
    return wrapped - 180.0;
}

double clampLatitude(double latitude)
{
    if (latitude < -90.0) { return -90.0; }
    if (latitude > 90.0) { return 90.0; }
    return latitude;
}

} // namespace geokit
