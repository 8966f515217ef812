#include "core/RouteLineUtils.hpp"
#include "support/route_fixtures.hpp"
#include <gtest/gtest.h>

using fixtures::eq;

TEST(Projection, XMapsLongitudeOntoUnitInterval) {
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectX(0.0), 0.5);
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectX(180.0), 1.0);
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectX(-180.0), 0.0);
}

TEST(Projection, YIsHalfAtEquatorAndDecreasesNorthwards) {
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectY(0.0), 0.5);
  EXPECT_LT(RouteLineUtils::projectY(45.0), 0.5);
  EXPECT_GT(RouteLineUtils::projectY(-45.0), 0.5);
}

TEST(Projection, YClampsAtThePoles) {
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectY(90.0), 0.0);
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectY(-90.0), 1.0);
  EXPECT_DOUBLE_EQ(RouteLineUtils::projectY(-90.0, true), 1.1);
}

TEST(Projection, DistanceIsSymmetricAndZeroForSamePoint) {
  const Coordinate a{37.77, -122.42}, b{37.80, -122.27};
  EXPECT_DOUBLE_EQ(RouteLineUtils::distance(a, a), 0.0);
  EXPECT_DOUBLE_EQ(RouteLineUtils::distance(a, b),
                   RouteLineUtils::distance(b, a));
  EXPECT_GT(RouteLineUtils::distance(a, b), 0.0);
}

TEST(Projection, EquatorialNeighboursAreEquallySpaced) {
  const double d01 = RouteLineUtils::distance(eq(0), eq(1));
  const double d12 = RouteLineUtils::distance(eq(1), eq(2));
  EXPECT_NEAR(d01, d12, 1e-15);
  EXPECT_NEAR(d01, 0.001 / 360.0, 1e-15);
}

TEST(Haversine, OneThousandthOfADegreeOnTheEquator) {
  EXPECT_NEAR(RouteLineUtils::haversine(eq(0), eq(1)), 111.195, 0.01);
  EXPECT_NEAR(RouteLineUtils::line_length_m({eq(0), eq(1), eq(2)}), 222.39,
              0.01);
}

TEST(SliceAlong, WholeLineKeepsEveryVertex) {
  const std::vector<Coordinate> line{eq(0), eq(1), eq(2), eq(3)};
  const auto s =
      RouteLineUtils::slice_along(line, 0.0, RouteLineUtils::line_length_m(line));
  ASSERT_EQ(s.size(), 4u);
  EXPECT_NEAR(s.front().lon, 0.0, 1e-12);
  EXPECT_NEAR(s.back().lon, 0.003, 1e-12);
}

TEST(SliceAlong, CutPointsAreInterpolatedOnTheirEdges) {
  const std::vector<Coordinate> line{eq(0), eq(1), eq(2), eq(3)};
  // 150 m lies on edge 1-2, 250 m on edge 2-3
  const auto s = RouteLineUtils::slice_along(line, 150.0, 250.0);
  ASSERT_EQ(s.size(), 3u);
  EXPECT_GT(s[0].lon, 0.001);
  EXPECT_LT(s[0].lon, 0.002);
  EXPECT_EQ(s[1], eq(2));
  EXPECT_GT(s[2].lon, 0.002);
  EXPECT_LT(s[2].lon, 0.003);
}

TEST(SliceAlong, BoundsAreClampedToTheLine) {
  const std::vector<Coordinate> line{eq(0), eq(1), eq(2)};
  const auto s = RouteLineUtils::slice_along(line, -50.0, 1e6);
  EXPECT_EQ(s.size(), 3u);
}

TEST(SliceAlong, EmptyWhenNothingLiesBetweenTheBounds) {
  const std::vector<Coordinate> line{eq(0), eq(1), eq(2)};
  EXPECT_TRUE(RouteLineUtils::slice_along(line, 300.0, 100.0).empty());
  EXPECT_TRUE(RouteLineUtils::slice_along(line, 500.0, 600.0).empty());
  EXPECT_TRUE(RouteLineUtils::slice_along({eq(0)}, 0.0, 10.0).empty());
  EXPECT_TRUE(RouteLineUtils::slice_along({}, 0.0, 10.0).empty());
}

TEST(RouteIdentity, FingerprintMaterialIsCanonical) {
  EXPECT_EQ(RouteLineUtils::fingerprint_material({{1.0, 2.0}, {3.5, 4.25}}),
            "v1|EPSG:4326|1.000000,2.000000;3.500000,4.250000");
}

TEST(RouteIdentity, LayerIdsAreStableAndGeometryDependent) {
  const std::vector<Coordinate> a{eq(0), eq(1)}, b{eq(0), eq(2)};
  const auto ia = RouteLineUtils::layer_ids(a);
  EXPECT_EQ(ia.main, RouteLineUtils::layer_ids(a).main);
  EXPECT_NE(ia.main, RouteLineUtils::layer_ids(b).main);

  const std::string uid = RouteLineUtils::route_uid_hex(a);
  EXPECT_EQ(uid.size(), 64u);
  EXPECT_EQ(ia.main, uid.substr(0, 16) + ".mainRoute");
  EXPECT_EQ(ia.casing, uid.substr(0, 16) + ".mainRouteCasing");
}

TEST(RouteIdentity, BoundingBox) {
  const auto bb =
      RouteLineUtils::compute_bbox({{1.0, 5.0}, {-2.0, 7.0}, {0.5, 6.0}});
  EXPECT_DOUBLE_EQ(bb.min_lat, -2.0);
  EXPECT_DOUBLE_EQ(bb.max_lat, 1.0);
  EXPECT_DOUBLE_EQ(bb.min_lon, 5.0);
  EXPECT_DOUBLE_EQ(bb.max_lon, 7.0);
}

TEST(ColorTest, ParsesHexWithAndWithoutAlpha) {
  const Color c = Color::from_hex("#FF9500");
  EXPECT_EQ(c.r, 255);
  EXPECT_EQ(c.g, 149);
  EXPECT_EQ(c.b, 0);
  EXPECT_DOUBLE_EQ(c.a, 1.0);
  EXPECT_EQ(c.to_string(), "rgba(255, 149, 0, 1)");
  EXPECT_EQ(Color::from_hex("#00000000").to_string(), "rgba(0, 0, 0, 0)");
}

TEST(ColorTest, RejectsMalformedHex) {
  EXPECT_THROW(Color::from_hex("FF9500"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex("#FF95"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex("#GG9500"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex("#-19500"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex(""), std::invalid_argument);
  // stoi alone would take a sign or blank as the start of a byte
  EXPECT_THROW(Color::from_hex("#+f+f+f"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex("# f00ff"), std::invalid_argument);
  EXPECT_THROW(Color::from_hex("#FF9500+1"), std::invalid_argument);
  EXPECT_EQ(Color::from_hex("#ff9500"), Color::from_hex("#FF9500"));
}
