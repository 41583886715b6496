#include <gtest/gtest.h>

#include "geo/geodeticprojector.h"
#include "io/gpxreader.h"
#include "tests/test_support.h"

#include <QFile>
#include <QTemporaryDir>

using namespace trail_test;

namespace {

void expectPoint(const QPointF& actual, double lon, double lat)
{
    const QPointF expected = GeodeticProjector::project(lon, lat);
    EXPECT_DOUBLE_EQ(actual.x(), expected.x());
    EXPECT_DOUBLE_EQ(actual.y(), expected.y());
}

} // namespace

TEST(GpxReaderTest, SingleSegmentKeepsInputOrder) {
    const QByteArray gpx = gpxDocument(
        "<trk><name>Ridge</name><trkseg>"
        "<trkpt lat=\"37.6500\" lon=\"126.9800\"><ele>120</ele></trkpt>"
        "<trkpt lat=\"37.6520\" lon=\"126.9830\"><ele>180</ele></trkpt>"
        "<trkpt lat=\"37.6550\" lon=\"126.9870\"><ele>240</ele></trkpt>"
        "</trkseg></trk>");

    const auto lines = GpxReader::parseTrack(gpx);
    ASSERT_EQ(lines.size(), 1);
    ASSERT_EQ(lines[0].size(), 3);
    expectPoint(lines[0][0], 126.9800, 37.6500);
    expectPoint(lines[0][1], 126.9830, 37.6520);
    expectPoint(lines[0][2], 126.9870, 37.6550);
}

TEST(GpxReaderTest, SegmentWithOnePointAndNoRouteFails) {
    const QByteArray gpx = gpxDocument(
        "<trk><trkseg>"
        "<trkpt lat=\"37.65\" lon=\"126.98\"/>"
        "<trkpt lat=\"abc\" lon=\"126.99\"/>"
        "</trkseg></trk>");

    EXPECT_THROW(GpxReader::parseTrack(gpx), MalformedTrackError);
}

TEST(GpxReaderTest, EverySegmentWithTwoPointsBecomesAPolyline) {
    const QByteArray gpx = gpxDocument(
        "<trk>"
        "<trkseg><trkpt lat=\"37.0\" lon=\"127.0\"/><trkpt lat=\"37.1\" lon=\"127.1\"/></trkseg>"
        "<trkseg><trkpt lat=\"37.2\" lon=\"127.2\"/></trkseg>"
        "<trkseg><trkpt lat=\"37.3\" lon=\"127.3\"/><trkpt lat=\"37.4\" lon=\"127.4\"/>"
        "<trkpt lat=\"37.5\" lon=\"127.5\"/></trkseg>"
        "</trk>");

    const auto lines = GpxReader::parseTrack(gpx);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[0].size(), 2);
    EXPECT_EQ(lines[1].size(), 3);
}

TEST(GpxReaderTest, RoutePointsAreUsedWithoutTrackSegments) {
    const QByteArray gpx = gpxDocument(
        "<rte><name>Plan</name>"
        "<rtept lat=\"35.10\" lon=\"129.00\"/>"
        "<rtept lat=\"35.11\" lon=\"129.02\"/>"
        "<rtept lat=\"35.12\" lon=\"129.04\"/>"
        "</rte>");

    const auto lines = GpxReader::parseTrack(gpx);
    ASSERT_EQ(lines.size(), 1);
    ASSERT_EQ(lines[0].size(), 3);
    expectPoint(lines[0][2], 129.04, 35.12);
}

TEST(GpxReaderTest, TrackSegmentsWinOverRoutePoints) {
    const QByteArray gpx = gpxDocument(
        "<rte><rtept lat=\"35.0\" lon=\"129.0\"/><rtept lat=\"35.1\" lon=\"129.1\"/></rte>"
        "<trk><trkseg><trkpt lat=\"36.0\" lon=\"128.0\"/><trkpt lat=\"36.1\" lon=\"128.1\"/></trkseg></trk>");

    const auto lines = GpxReader::parseTrack(gpx);
    ASSERT_EQ(lines.size(), 1);
    expectPoint(lines[0][0], 128.0, 36.0);
}

TEST(GpxReaderTest, PrefixedAndUnqualifiedElementsAreAccepted) {
    const QByteArray prefixed =
        "<g:gpx xmlns:g=\"http://www.topografix.com/GPX/1/0\"><g:trk><g:trkseg>"
        "<g:trkpt lat=\"37.0\" lon=\"127.0\"/><g:trkpt lat=\"37.01\" lon=\"127.01\"/>"
        "</g:trkseg></g:trk></g:gpx>";
    const QByteArray bare =
        "<gpx><trk><trkseg>"
        "<trkpt lat=\"37.0\" lon=\"127.0\"/><trkpt lat=\"37.01\" lon=\"127.01\"/>"
        "</trkseg></trk></gpx>";

    EXPECT_EQ(GpxReader::parseTrack(prefixed).size(), 1);
    EXPECT_EQ(GpxReader::parseTrack(bare).size(), 1);
}

TEST(GpxReaderTest, InvalidCoordinatesAreSkipped) {
    const QByteArray gpx = gpxDocument(
        "<trk><trkseg>"
        "<trkpt lat=\"37.0\" lon=\"127.0\"/>"
        "<trkpt lon=\"127.005\"/>"
        "<trkpt lat=\"inf\" lon=\"127.006\"/>"
        "<trkpt lat=\"nan\" lon=\"127.007\"/>"
        "<trkpt lat=\" 37.01 \" lon=\"127.01\"/>"
        "</trkseg></trk>");

    const auto lines = GpxReader::parseTrack(gpx);
    ASSERT_EQ(lines.size(), 1);
    ASSERT_EQ(lines[0].size(), 2);
    expectPoint(lines[0][1], 127.01, 37.01);
}

TEST(GpxReaderTest, BrokenXmlFails) {
    EXPECT_THROW(GpxReader::parseTrack("<gpx><trk><trkseg><trkpt lat=\"37\""), MalformedTrackError);
    EXPECT_THROW(GpxReader::parseTrack(QByteArray()), MalformedTrackError);
}

TEST(GpxReaderTest, ReadFileParsesDiskContent) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("walk.gpx");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(gpxDocument("<trk><trkseg><trkpt lat=\"37.0\" lon=\"127.0\"/>"
                           "<trkpt lat=\"37.1\" lon=\"127.1\"/></trkseg></trk>"));
    file.close();

    EXPECT_EQ(GpxReader::readFile(path).size(), 1);
    EXPECT_THROW(GpxReader::readFile(dir.filePath("missing.gpx")), MalformedTrackError);
}
