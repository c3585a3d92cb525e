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
#include <cstdlib>
#include <string>
#include <vector>
#include <iostream>

#include <boost/optional.hpp>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"
#include "utility/gccversion.hpp"
#include "utility/buildsys.hpp"

#include "geokit/distance.hpp"
#include "geokit/polygon.hpp"
#include "geokit/io.hpp"
#include "geokit/po.hpp"

namespace po = boost::program_options;

namespace {

class Region : public service::Cmdline
{
public:
    Region()
        : Cmdline("geokit-region", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
        , system_(geokit::CoordinateSystem::wgs84), radius_()
    {
    }

private:
    virtual void configuration(po::options_description &cmdline
                               , po::options_description &config
                               , po::positional_options_description &pd)
        UTILITY_OVERRIDE;

    virtual void configure(const po::variables_map &vars)
        UTILITY_OVERRIDE;

    virtual bool help(std::ostream &out, const std::string &what) const
        UTILITY_OVERRIDE;

    virtual int run() UTILITY_OVERRIDE;

    bool contains(const geokit::CoordinatePoint &p) const;

    geokit::CoordinateSystem system_;
    geokit::CoordinatePoints polygon_;
    boost::optional<geokit::CoordinatePoint> center_;
    double radius_;
    geokit::GeometryOptions options_;
};

void Region::configuration(po::options_description &cmdline
                           , po::options_description &config
                           , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("system", po::value(&system_)->default_value(system_)
         , "Coordinate system of input points (WGS84, GCJ02, BD09).")
        ("polygon", po::value(&polygon_)->multitoken()
         , "Polygon boundary, list of lon,lat[,SYSTEM] vertices.")
        ("center", po::value<geokit::CoordinatePoint>()
         , "Circle center, lon,lat[,SYSTEM].")
        ("radius", po::value(&radius_)
         , "Circle radius in meters.")
        ;

    config.add_options()
        ("tolerance", po::value(&options_.segmentTolerance)
         ->default_value(options_.segmentTolerance)
         , "Point-on-edge tolerance in degrees.")
        ("earthRadius", po::value(&options_.earthRadius)
         ->default_value(options_.earthRadius)
         , "Earth radius used for distance computation (meters).")
        ;

    (void) pd;
}

void Region::configure(const po::variables_map &vars)
{
    if (vars.count("center")) {
        center_ = vars["center"].as<geokit::CoordinatePoint>();
        if (!vars.count("radius")) {
            throw po::required_option("radius");
        }
    }

    if (bool(center_) == !polygon_.empty()) {
        LOGTHROW(err4, std::runtime_error)
            << "Exactly one of --polygon or --center must be given.";
    }
}

bool Region::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(geokit-region: point in region test

Reads "longitude latitude" lines from standard input and writes 1 for each
point inside given polygon or circle and 0 otherwise.

Polygon vertices are separate arguments:
    geokit-region --polygon 116.3,39.8 116.5,39.8 116.5,40.0,GCJ02
)RAW";
    }
    return false;
}

bool Region::contains(const geokit::CoordinatePoint &p) const
{
    if (center_) {
        return geokit::isInCircle(p, *center_, radius_, options_);
    }
    return geokit::isInPolygon(p, polygon_, options_);
}

int Region::run()
{
    std::string line;
    while (std::getline(std::cin, line)) {
        try {
            if (const auto p = geokit::readPoint(line, system_)) {
                std::cout << (contains(*p) ? 1 : 0) << std::endl;
            }
        } catch (const geokit::InvalidCoordinate &e) {
            LOG(warn2) << "Skipping input line: " << e.what();
        }
    }

    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    return Region()(argc, argv);
}
