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
#ifndef geokit_options_hpp_included_
#define geokit_options_hpp_included_

namespace geokit {

/** Earth radius constants for haversine distance (meters).
 */
struct EarthRadius {
    /** WGS84 semi-major axis.
     */
    static constexpr double equatorial = 6378137.0;

    /** IUGG mean radius.
     */
    static constexpr double mean = 6371008.8;
};

/** Geometry predicate settings. Passed explicitly to every geometry
 *  operation, there is no global configuration.
 */
struct GeometryOptions {
    /** Tolerance (degrees) of the point-on-segment test; 1e-7 deg is
     *  roughly 1.1 cm.
     */
    double segmentTolerance;

    /** Sphere radius used by distance computation.
     */
    double earthRadius;

    GeometryOptions()
        : segmentTolerance(1e-7), earthRadius(EarthRadius::equatorial)
    {}

    GeometryOptions& tolerance(double value) {
        segmentTolerance = value;
        return *this;
    }

    GeometryOptions& radius(double value) {
        earthRadius = value;
        return *this;
    }
};

} // namespace geokit

#endif // geokit_options_hpp_included_
