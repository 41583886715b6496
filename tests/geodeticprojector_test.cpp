#include <gtest/gtest.h>

#include "geo/geodeticprojector.h"

#include <ogr_spatialref.h>
#include <cmath>
#include <memory>

namespace {

struct OgrTransformDeleter {
    void operator()(OGRCoordinateTransformation* ct) const
    {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using OgrTransformPtr = std::unique_ptr<OGRCoordinateTransformation, OgrTransformDeleter>;

OgrTransformPtr makeKorea2000ToUnified()
{
    OGRSpatialReference source;
    OGRSpatialReference target;
    if (source.importFromEPSG(4737) != OGRERR_NONE) return nullptr;
    if (target.importFromEPSG(5179) != OGRERR_NONE) return nullptr;
    source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return OgrTransformPtr(OGRCreateCoordinateTransformation(&source, &target));
}

} // namespace

TEST(GeodeticProjectorTest, ProjectionOriginMapsToFalseOrigin) {
    const QPointF p = GeodeticProjector::project(127.5, 38.0);
    EXPECT_NEAR(p.x(), 1000000.0, 1e-6);
    EXPECT_NEAR(p.y(), 2000000.0, 1e-6);
}

TEST(GeodeticProjectorTest, SameInputGivesIdenticalOutput) {
    const QPointF a = GeodeticProjector::project(126.9780, 37.5665);
    const QPointF b = GeodeticProjector::project(126.9780, 37.5665);
    EXPECT_EQ(a.x(), b.x());
    EXPECT_EQ(a.y(), b.y());
}

TEST(GeodeticProjectorTest, SmallInputChangeGivesSmallOutputChange) {
    const QPointF base = GeodeticProjector::project(128.0, 36.0);
    const QPointF east = GeodeticProjector::project(128.0 + 1e-6, 36.0);
    const QPointF north = GeodeticProjector::project(128.0, 36.0 + 1e-6);

    // 1e-6 degree is about 0.1 m on the ground
    EXPECT_GT(east.x(), base.x());
    EXPECT_LT(std::abs(east.x() - base.x()), 0.2);
    EXPECT_LT(std::abs(east.y() - base.y()), 0.01);
    EXPECT_GT(north.y(), base.y());
    EXPECT_LT(std::abs(north.y() - base.y()), 0.2);
}

TEST(GeodeticProjectorTest, CentralMeridianHasFalseEasting) {
    const QPointF p = GeodeticProjector::project(127.5, 35.0);
    EXPECT_NEAR(p.x(), 1000000.0, 1e-6);
    EXPECT_LT(p.y(), 2000000.0);
}

TEST(GeodeticProjectorTest, NaNInputPropagates) {
    const QPointF p = GeodeticProjector::project(std::nan(""), 37.0);
    EXPECT_TRUE(std::isnan(p.x()));
}

TEST(GeodeticProjectorTest, EccentricityMatchesGrs80) {
    EXPECT_NEAR(GeodeticProjector::eccentricitySquared(), 0.00669438002290, 1e-12);
    EXPECT_NEAR(GeodeticProjector::meridionalArc(0.0), 0.0, 1e-9);
}

TEST(GeodeticProjectorTest, AgreesWithGdalAcrossKorea) {
    OgrTransformPtr ct = makeKorea2000ToUnified();
    ASSERT_NE(ct, nullptr) << "EPSG:4737 -> EPSG:5179 transformation unavailable";

    const double samples[][2] = {
        {126.9780, 37.5665},    // Seoul
        {129.0756, 35.1796},    // Busan
        {126.5312, 33.4996},    // Jeju
        {128.5911, 38.2070},    // Sokcho
        {125.9000, 34.7000},
        {127.5000, 36.0000},
    };

    for (const auto& sample : samples) {
        double x = sample[0];
        double y = sample[1];
        ASSERT_TRUE(ct->Transform(1, &x, &y));

        const QPointF p = GeodeticProjector::project(sample[0], sample[1]);
        EXPECT_NEAR(p.x(), x, 0.05) << "lon " << sample[0] << " lat " << sample[1];
        EXPECT_NEAR(p.y(), y, 0.05) << "lon " << sample[0] << " lat " << sample[1];
    }
}
