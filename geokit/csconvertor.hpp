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
#ifndef geokit_csconvertor_hpp_included_
#define geokit_csconvertor_hpp_included_

#include <algorithm>
#include <iterator>

#include "math/geometry_core.hpp"

#include "./coordinatesystem.hpp"
#include "./point.hpp"

namespace geokit {

/** Converts points between two coordinate systems.
 *
 *  WGS84 <-> GCJ02 and GCJ02 <-> BD09 are direct transforms, WGS84 <-> BD09
 *  goes through GCJ02. GCJ02 -> WGS84 and BD09 -> GCJ02 are the customary
 *  approximate inverses, not exact ones.
 */
class CsConvertor {
public:
    CsConvertor(CoordinateSystem from, CoordinateSystem to);

    /** Creates no-op CS convertor. No conversion takes place.
     */
    CsConvertor();

    /** Raw longitude/latitude pair in source system. Result is normalized
     *  into valid longitude/latitude domain.
     */
    math::Point2 operator()(const math::Point2 &p) const;

    /** Point must be in the source system, throws std::logic_error
     *  otherwise.
     */
    CoordinatePoint operator()(const CoordinatePoint &p) const;

    CoordinatePoints operator()(const CoordinatePoints &p) const;

    CsConvertor inverse() const { return { to_, from_ }; }

    CoordinateSystem from() const { return from_; }
    CoordinateSystem to() const { return to_; }

private:
    CoordinateSystem from_;
    CoordinateSystem to_;
};

/** Converts point into given coordinate system. Identity when point is
 *  already there.
 */
CoordinatePoint convert(const CoordinatePoint &point
                        , CoordinateSystem target);

/** Returns true if given location is outside the region where GCJ02
 *  obfuscation applies (coarse bounding rectangle).
 */
bool outOfRegion(double longitude, double latitude);

// direct transforms on raw longitude/latitude pairs, no normalization

math::Point2 wgs84ToGcj02(const math::Point2 &p);
math::Point2 gcj02ToWgs84(const math::Point2 &p);
math::Point2 gcj02ToBd09(const math::Point2 &p);
math::Point2 bd09ToGcj02(const math::Point2 &p);

// inline method implementation

inline CoordinatePoints CsConvertor::operator()(const CoordinatePoints &p)
    const
{
    CoordinatePoints out;
    out.reserve(p.size());
    std::transform(p.begin(), p.end(), std::back_inserter(out)
                   , [this](const CoordinatePoint &cp) {
                       return (*this)(cp);
                   });
    return out;
}

} // namespace geokit

#endif // geokit_csconvertor_hpp_included_
