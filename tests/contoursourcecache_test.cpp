#include <gtest/gtest.h>

#include "io/contoursourcecache.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>
#include <atomic>
#include <memory>
#include <vector>

namespace {

void writeFile(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(content);
}

const QByteArray kManifest =
    "[\n"
    "  {\"id\": \"north\", \"name\": \"North Ridge\", \"asset\": \"assets/data/north.json\"},\n"
    "  {\"id\": \"broken\", \"name\": \"Broken\", \"asset\": \"assets/data/broken.json\"},\n"
    "  {\"name\": \"No id\", \"asset\": \"assets/data/none.json\"}\n"
    "]\n";

// Two clusters far apart: one near the origin and one around (10000, 10000)
const QByteArray kNorthDataset =
    "{\n"
    "  \"bounds\": [0, 0, 10100, 10100],\n"
    "  \"contours\": [\n"
    "    {\"elev\": 100, \"major\": true,  \"line\": [[0, 0], [50, 20], [100, 100]]},\n"
    "    {\"elev\": 120, \"major\": false, \"line\": [[10, 10], [60, 40], [90, 90]]},\n"
    "    {\"elev\": 140, \"major\": false, \"line\": []},\n"
    "    {\"elev\": 200, \"major\": true,  \"line\": [[10000, 10000], [10100, 10100]]}\n"
    "  ]\n"
    "}\n";

class ContourSourceCacheTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        writeFile(m_dir.filePath(ContourSourceCache::defaultManifestPath()), kManifest);
        writeFile(m_dir.filePath("assets/data/north.json"), kNorthDataset);
        writeFile(m_dir.filePath("assets/data/broken.json"), "{ not json");
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(ContourSourceCacheTest, ListsValidManifestEntries) {
    ContourSourceCache cache(m_dir.path());
    const auto sources = cache.listSources();
    ASSERT_EQ(sources.size(), 2);
    EXPECT_EQ(sources[0].id, "north");
    EXPECT_EQ(sources[0].name, "North Ridge");
    EXPECT_EQ(sources[0].assetPath, "assets/data/north.json");
}

TEST(ContourSourceCacheManifestTest, MissingOrInvalidManifestGivesEmptyList) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ContourSourceCache missing(dir.path());
    EXPECT_TRUE(missing.listSources().isEmpty());

    writeFile(dir.filePath("manifest.json"), "{\"id\": \"not-an-array\"}");
    ContourSourceCache notArray(dir.path(), "manifest.json");
    EXPECT_TRUE(notArray.listSources().isEmpty());
}

TEST_F(ContourSourceCacheTest, FullLoadDropsEmptyLines) {
    ContourSourceCache cache(m_dir.path());
    const ContourLoadResult result = cache.loadSourceById("north");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines.size(), 3);
    EXPECT_EQ(result.bounds, QRectF(QPointF(0, 0), QPointF(10100, 10100)));
    EXPECT_TRUE(result.lines[0].isMajor);
    EXPECT_EQ(result.lines[1].elevation, 120);
}

TEST_F(ContourSourceCacheTest, ClippedLoadKeepsOverlappingLines) {
    ContourSourceCache cache(m_dir.path());
    const ContourLoadResult result = cache.loadSourceById("north", QRectF(QPointF(-50, -50), QPointF(200, 200)));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.lines.size(), 2);
    EXPECT_EQ(result.bounds, QRectF(QPointF(0, 0), QPointF(100, 100)));
}

TEST_F(ContourSourceCacheTest, ClipOutsideEveryLineGivesEmptyResult) {
    ContourSourceCache cache(m_dir.path());
    const ContourLoadResult result = cache.loadSourceById("north", QRectF(QPointF(5000, 5000), QPointF(6000, 6000)));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.lines.isEmpty());
    EXPECT_EQ(result.bounds, QRectF(0, 0, 1, 1));
}

TEST_F(ContourSourceCacheTest, DatasetIsReadOnce) {
    ContourSourceCache cache(m_dir.path());
    EXPECT_FALSE(cache.isCached("north"));
    ASSERT_TRUE(cache.loadSourceById("north").success);
    ASSERT_TRUE(cache.loadSourceById("north", QRectF(0, 0, 10, 10)).success);
    ASSERT_TRUE(cache.loadSourceById("north").success);
    EXPECT_TRUE(cache.isCached("north"));
    EXPECT_EQ(cache.datasetReadCount(), 1);

    cache.clear();
    EXPECT_FALSE(cache.isCached("north"));
    ASSERT_TRUE(cache.loadSourceById("north").success);
    EXPECT_EQ(cache.datasetReadCount(), 1);
}

TEST_F(ContourSourceCacheTest, ConcurrentLoadsShareOneRead) {
    ContourSourceCache cache(m_dir.path());
    std::atomic<int> succeeded{0};
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back(QThread::create([&cache, &succeeded]() {
            if (cache.loadSourceById("north").success) ++succeeded;
        }));
        threads.back()->start();
    }
    for (auto& thread : threads) {
        ASSERT_TRUE(thread->wait(10000));
    }
    EXPECT_EQ(succeeded.load(), 8);
    EXPECT_EQ(cache.datasetReadCount(), 1);
}

TEST_F(ContourSourceCacheTest, InvalidDatasetReportsError) {
    ContourSourceCache cache(m_dir.path());
    const ContourLoadResult result = cache.loadSourceById("broken");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_FALSE(cache.isCached("broken"));
}

TEST_F(ContourSourceCacheTest, UnknownSourceReportsError) {
    ContourSourceCache cache(m_dir.path());
    const ContourLoadResult result = cache.loadSourceById("missing");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.errorMessage.contains("missing"));
}

TEST(ContourSourceCacheBoundsTest, MissingBoundsAreRecomputed) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    writeFile(dir.filePath("m.json"), "[{\"id\": \"a\", \"name\": \"A\", \"asset\": \"a.json\"}]");
    writeFile(dir.filePath("a.json"),
              "{\"bounds\": [10, 10, 0, 0], \"contours\": [{\"elev\": 20, \"line\": [[3, 4], [7, 9]]}]}");

    ContourSourceCache cache(dir.path(), "m.json");
    const ContourLoadResult result = cache.loadSourceById("a");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.bounds, QRectF(QPointF(3, 4), QPointF(7, 9)));
    EXPECT_FALSE(result.lines[0].isMajor);
}

TEST(ContourSourceCacheSampleTest, BundledSampleDataLoads) {
    ContourSourceCache cache(QStringLiteral(TRAILCONTOUR_SAMPLE_DATA_DIR));
    const auto sources = cache.listSources();
    ASSERT_FALSE(sources.isEmpty());
    const ContourLoadResult result = cache.loadSource(sources.first());
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.lines.isEmpty());
}
