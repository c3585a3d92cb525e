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
#include <iostream>
#include <iomanip>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"
#include "utility/gccversion.hpp"
#include "utility/buildsys.hpp"

#include "geokit/csconvertor.hpp"
#include "geokit/io.hpp"
#include "geokit/po.hpp"

namespace po = boost::program_options;

namespace {

class Cs2Cs : public service::Cmdline
{
public:
    Cs2Cs()
        : Cmdline("geokit-cs2cs", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
        , src_(geokit::CoordinateSystem::wgs84)
        , dst_(geokit::CoordinateSystem::gcj02)
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

    geokit::CoordinateSystem src_;
    geokit::CoordinateSystem dst_;
};

void Cs2Cs::configuration(po::options_description &cmdline
                          , po::options_description &config
                          , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("src", po::value(&src_)->required()
         , "Source coordinate system (WGS84, GCJ02, BD09).")
        ("dst", po::value(&dst_)->required()
         , "Destination coordinate system (WGS84, GCJ02, BD09).")
    ;

    pd
        .add("src", 1)
        .add("dst", 1)
        ;

    (void) config;
}

void Cs2Cs::configure(const po::variables_map &vars)
{
    (void) vars;
}

bool Cs2Cs::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(geokit-cs2cs: coordinate system convertor

Reads "longitude latitude" lines from standard input and writes them
converted into destination coordinate system.
)RAW";
    }
    return false;
}

int Cs2Cs::run()
{
    const geokit::CsConvertor conv(src_, dst_);

    std::cout << std::fixed << std::setprecision(12);

    std::string line;
    while (std::getline(std::cin, line)) {
        try {
            if (const auto p = geokit::readPoint(line, src_)) {
                const auto res(conv(*p));
                std::cout << res.longitude() << " " << res.latitude()
                          << std::endl;
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
    return Cs2Cs()(argc, argv);
}
