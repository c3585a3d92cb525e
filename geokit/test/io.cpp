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
#include <gtest/gtest.h>

#include "geokit/io.hpp"

using geokit::CoordinateSystem;
using geokit::InvalidCoordinate;

TEST(ReadPointTest, ParsesWhitespaceSeparatedPair)
{
    const auto p(geokit::readPoint("  116.397428\t 39.90923 "
                                   , CoordinateSystem::gcj02));
    ASSERT_TRUE(bool(p));
    EXPECT_DOUBLE_EQ(116.397428, p->longitude());
    EXPECT_DOUBLE_EQ(39.90923, p->latitude());
    EXPECT_EQ(CoordinateSystem::gcj02, p->system());
}

TEST(ReadPointTest, BlankLineYieldsNothing)
{
    EXPECT_FALSE(bool(geokit::readPoint("", CoordinateSystem::wgs84)));
    EXPECT_FALSE(bool(geokit::readPoint(" \t ", CoordinateSystem::wgs84)));
}

TEST(ReadPointTest, MalformedLineThrows)
{
    // bad line must not stop reading of following lines
    EXPECT_THROW(geokit::readPoint("abc 10", CoordinateSystem::wgs84)
                 , InvalidCoordinate);
    EXPECT_THROW(geokit::readPoint("10", CoordinateSystem::wgs84)
                 , InvalidCoordinate);
    EXPECT_THROW(geokit::readPoint("10 20 30", CoordinateSystem::wgs84)
                 , InvalidCoordinate);
    EXPECT_THROW(geokit::readPoint("10 95", CoordinateSystem::wgs84)
                 , InvalidCoordinate);

    const auto next(geokit::readPoint("10 20", CoordinateSystem::wgs84));
    ASSERT_TRUE(bool(next));
    EXPECT_EQ(geokit::makePoint(10.0, 20.0), *next);
}
