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
#ifndef geokit_po_hpp_included_
#define geokit_po_hpp_included_

#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "./point.hpp"

namespace geokit {

/** Parses "lon,lat" or "lon,lat,SYSTEM" (WGS84 when system is omitted).
 */
inline void validate(boost::any &v
                     , const std::vector<std::string> &values
                     , CoordinatePoint*, int)
{
    namespace po = boost::program_options;
    namespace ba = boost::algorithm;

    po::validators::check_first_occurrence(v);
    const auto &value(po::validators::get_single_string(values));

    std::vector<std::string> parts;
    ba::split(parts, value, ba::is_any_of(","));
    if ((parts.size() < 2) || (parts.size() > 3)) {
        throw po::validation_error
            (po::validation_error::invalid_option_value);
    }

    auto system(CoordinateSystem::wgs84);
    try {
        if (parts.size() == 3) {
            system = boost::lexical_cast<CoordinateSystem>(parts[2]);
        }
        v = boost::any(CoordinatePoint::of(parts[0], parts[1], system));
    } catch (const boost::bad_lexical_cast&) {
        throw po::validation_error
            (po::validation_error::invalid_option_value);
    } catch (const InvalidCoordinate&) {
        throw po::validation_error
            (po::validation_error::invalid_option_value);
    }
}

} // namespace geokit

#endif // geokit_po_hpp_included_
