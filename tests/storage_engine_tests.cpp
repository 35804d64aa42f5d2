#include <gtest/gtest.h>
#include "engine/storage_engine.hpp"
#include "test_helpers.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <streambuf>
#include <unordered_set>

using namespace dits;
using test::randomBytes;
using test::toBytes;
using namespace std::chrono_literals;

namespace {

// Readable but not seekable.
class ForwardOnlyBuf : public std::streambuf {
public:
    explicit ForwardOnlyBuf(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

private:
    std::string data_;
};

EngineConfig memoryConfig() {
    EngineConfig cfg;
    cfg.backend = "memory";
    cfg.store.gc_grace = 0s;
    return cfg;
}

size_t sharedChunks(const Asset &a, const Asset &b) {
    std::unordered_set<ContentHash> hashes;
    for (const auto &c : a.chunks)
        hashes.insert(c.hash);
    size_t shared = 0;
    for (const auto &c : b.chunks)
        shared += hashes.count(c.hash);
    return shared;
}

} // namespace

class StorageEngineTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        engine_ = std::make_unique<StorageEngine>(memoryConfig());
    }

    Asset add(const std::string &path, const std::vector<std::byte> &data,
              std::vector<std::byte> metadata = {}) {
        auto in = test::toStream(data);
        return engine_->chunkAndStore(path, in, std::move(metadata));
    }

    std::vector<std::byte> materialize(const Asset &asset) {
        std::vector<std::byte> out;
        engine_->materialize(asset, [&](std::span<const std::byte> bytes) {
            out.insert(out.end(), bytes.begin(), bytes.end());
        });
        return out;
    }

    void writeFile(const std::string &p, const std::vector<std::byte> &data) {
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }

    uint64_t totalReferences() {
        return engine_->chunkStore().stats().totalReferences;
    }

    std::unique_ptr<StorageEngine> engine_;
};

TEST_F(StorageEngineTest, RepeatedContentIsStoredOnce) {
    std::vector<std::byte> zeros(10 * 1024 * 1024, std::byte{0});
    Asset first = add("zeros-1.bin", zeros);
    Asset second = add("zeros-2.bin", zeros);

    EXPECT_EQ(first.chunks.size(), 40u);
    EXPECT_EQ(first.id, second.id);
    const ContentHash chunk = first.chunks[0].hash;
    EXPECT_EQ(engine_->chunkStore().refCount(chunk), 2u);
    auto stats = engine_->chunkStore().stats();
    EXPECT_EQ(stats.chunks, 1u);
    EXPECT_EQ(stats.logicalBytes, 256u * 1024);
    EXPECT_EQ(materialize(second), zeros);
}

TEST_F(StorageEngineTest, SmallEditReusesMostChunks) {
    auto data = randomBytes(1 << 20, 42);
    Asset before = add("take.mov", data);
    data[data.size() - 100] ^= std::byte{0x5a};
    Asset after = add("take.mov", data);

    ASSERT_EQ(before.chunks.size(), 13u);
    ASSERT_EQ(after.chunks.size(), 13u);
    EXPECT_EQ(sharedChunks(before, after), 12u);
    EXPECT_EQ(engine_->chunkStore().stats().chunks, 14u);

    DiffResult diff = engine_->diffAssets(before, after);
    EXPECT_EQ(diff.stats.chunks_kept, 12u);
    EXPECT_EQ(diff.stats.chunks_added, 1u);
    EXPECT_EQ(diff.stats.chunks_removed, 1u);
    EXPECT_EQ(materialize(after), data);
}

TEST_F(StorageEngineTest, ManifestsHoldReferences) {
    auto data = randomBytes(300 * 1024, 8);
    Asset asset = add("clip.mov", data);
    const ContentHash chunk = asset.chunks[0].hash;
    ASSERT_EQ(engine_->chunkStore().refCount(chunk), 1u);

    std::vector<ContentHash> manifests;
    for (int v = 1; v <= 3; ++v) {
        Manifest m;
        m.set("v" + std::to_string(v) + "/clip.mov", asset.id);
        manifests.push_back(engine_->commitManifest(m));
    }
    EXPECT_EQ(engine_->chunkStore().refCount(chunk), 4u);

    engine_->releaseAsset(asset);
    EXPECT_EQ(engine_->chunkStore().refCount(chunk), 3u);
    EXPECT_EQ(engine_->gc().chunksRemoved, 0u);

    engine_->dropManifest(manifests[0]);
    engine_->dropManifest(manifests[1]);
    EXPECT_EQ(engine_->gc().chunksRemoved, 0u);
    EXPECT_EQ(materialize(asset), data);

    engine_->dropManifest(manifests[2]);
    EXPECT_EQ(engine_->chunkStore().refCount(chunk), 0u);
    auto gc = engine_->gc();
    EXPECT_EQ(gc.chunksRemoved, asset.chunks.size());
    EXPECT_EQ(engine_->chunkStore().stats().chunks, 0u);
    EXPECT_THROW(materialize(asset), NotFoundError);
    EXPECT_THROW(engine_->loadManifest(manifests[2]), NotFoundError);
}

TEST_F(StorageEngineTest, IdenticalFilesAtTwoPathsKeepTheirPaths) {
    auto data = randomBytes(64 * 1024, 9);
    Asset first = add("docs/a.bin", data);
    Asset second = add("backup/a.bin", data);
    ASSERT_EQ(first.id, second.id);

    Manifest m;
    m.set(first.path, first.id);
    m.set(second.path, second.id);
    const ContentHash id = engine_->commitManifest(m);

    const std::vector<Asset> assets = engine_->loadManifestAssets(id);
    ASSERT_EQ(assets.size(), 2u);
    // Manifest entries are ordered by path.
    EXPECT_EQ(assets[0].path, "backup/a.bin");
    EXPECT_EQ(assets[1].path, "docs/a.bin");
    EXPECT_EQ(assets[0].id, assets[1].id);
    EXPECT_EQ(materialize(assets[1]), data);
    EXPECT_TRUE(engine_->loadAsset(first.id).path.empty());
}

TEST_F(StorageEngineTest, CommitIsIdempotent) {
    Asset asset = add("a", randomBytes(1000, 1));
    Manifest m;
    m.set("a", asset.id);
    ContentHash first = engine_->commitManifest(m);
    ContentHash second = engine_->commitManifest(m);
    EXPECT_EQ(first, second);
    EXPECT_EQ(engine_->chunkStore().refCount(asset.chunks[0].hash), 2u);
    EXPECT_EQ(engine_->loadManifest(first), m);
}

TEST_F(StorageEngineTest, FailedCommitReleasesReferences) {
    Asset asset = add("a", randomBytes(1000, 2));
    Manifest m;
    m.set("a", asset.id);
    m.set("b", BlockIO::hash(toBytes("never stored")));
    EXPECT_THROW(engine_->commitManifest(m), NotFoundError);
    EXPECT_EQ(engine_->chunkStore().refCount(asset.chunks[0].hash), 1u);
    EXPECT_FALSE(engine_->assetStore().hasManifest(m.id()));
    EXPECT_THROW(engine_->dropManifest(m.id()), NotFoundError);
}

TEST_F(StorageEngineTest, MetadataUpdateKeepsChunks) {
    auto data = randomBytes(100 * 1024, 3);
    Asset asset = add("a.wav", data, toBytes("{\"take\":1}"));
    const uint64_t refsBefore = totalReferences();

    Asset updated = engine_->updateMetadata(asset, toBytes("{\"take\":2}"));
    EXPECT_NE(updated.id, asset.id);
    EXPECT_EQ(updated.sequence_hash, asset.sequence_hash);
    EXPECT_EQ(totalReferences(), refsBefore + asset.chunks.size());

    Asset loaded = engine_->loadAsset(updated.id);
    EXPECT_EQ(loaded.metadata_blob, toBytes("{\"take\":2}"));
    EXPECT_EQ(engine_->loadAsset(asset.id).metadata_blob,
              toBytes("{\"take\":1}"));
    EXPECT_TRUE(engine_->diffAssets(asset, updated).metadata_changed);
    EXPECT_EQ(materialize(loaded), data);
}

TEST_F(StorageEngineTest, AddFilesKeepsInputOrder) {
    std::vector<std::string> paths;
    std::vector<std::vector<std::byte>> contents;
    for (uint32_t i = 0; i < 6; ++i) {
        paths.push_back(path("file" + std::to_string(i)));
        contents.push_back(randomBytes(50 * 1024 + i * 1000, 100 + i));
        writeFile(paths.back(), contents.back());
    }

    auto assets = engine_->addFiles(paths);
    ASSERT_EQ(assets.size(), paths.size());
    for (size_t i = 0; i < assets.size(); ++i) {
        EXPECT_EQ(assets[i].path, paths[i]);
        EXPECT_EQ(materialize(assets[i]), contents[i]);
    }
}

TEST_F(StorageEngineTest, AddFilesReleasesEverythingOnFailure) {
    std::vector<std::string> paths;
    for (uint32_t i = 0; i < 4; ++i) {
        paths.push_back(path("ok" + std::to_string(i)));
        writeFile(paths.back(), randomBytes(20 * 1024, 200 + i));
    }
    paths.insert(paths.begin() + 2, path("missing"));

    EXPECT_THROW(engine_->addFiles(paths), IoError);
    EXPECT_EQ(totalReferences(), 0u);
}

TEST_F(StorageEngineTest, AddFileUsesLogicalPath) {
    writeFile(path("raw"), toBytes("payload"));
    Asset asset = engine_->addFile(path("raw"), "project/raw.bin");
    EXPECT_EQ(asset.path, "project/raw.bin");
    EXPECT_THROW(engine_->addFile(path("absent")), IoError);
}

TEST_F(StorageEngineTest, HintsSnapBoundaries) {
    EngineConfig cfg = memoryConfig();
    cfg.chunker = ChunkerConfig::small();
    StorageEngine engine(cfg);

    std::vector<std::byte> zeros(40000, std::byte{0});
    auto in = test::toStream(zeros);
    Asset asset =
        engine.chunkAndStore("a", in, {}, staticHints({15900, 16000}));
    ASSERT_FALSE(asset.chunks.empty());
    EXPECT_EQ(asset.chunks[0].length, 16000u);
    EXPECT_TRUE(asset.chunks[0].is_boundary_hint);
    EXPECT_EQ(asset.size, zeros.size());
}

TEST_F(StorageEngineTest, HintsNeedSeekableStream) {
    ForwardOnlyBuf buf(std::string(1000, 'x'));
    std::istream in(&buf);
    EXPECT_THROW(engine_->chunkAndStore("a", in, {}, staticHints({500})),
                 IoError);
    EXPECT_EQ(totalReferences(), 0u);

    ForwardOnlyBuf plain(std::string(1000, 'x'));
    std::istream noHints(&plain);
    EXPECT_EQ(engine_->chunkAndStore("a", noHints).size, 1000u);
}

TEST_F(StorageEngineTest, CancelledIngestLeavesNoReferences) {
    auto data = randomBytes(1 << 20, 9);
    auto in = test::toStream(data);
    std::stop_source stop;
    stop.request_stop();
    EXPECT_THROW(engine_->chunkAndStore("a", in, {}, {}, stop.get_token()),
                 CancelledError);
    EXPECT_EQ(totalReferences(), 0u);
}

TEST_F(StorageEngineTest, RangeAndExport) {
    auto data = randomBytes(500 * 1024, 10);
    Asset asset = add("a", data);

    std::vector<std::byte> range;
    uint64_t n = engine_->materializeRange(
        asset, 1000, 70000, [&](std::span<const std::byte> bytes) {
            range.insert(range.end(), bytes.begin(), bytes.end());
        });
    EXPECT_EQ(n, 70000u);
    EXPECT_EQ(range, std::vector<std::byte>(data.begin() + 1000,
                                            data.begin() + 71000));

    engine_->exportAsset(asset, path("exported"));
    std::ifstream in(path("exported"), std::ios::binary);
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    EXPECT_EQ(toBytes(text), data);
    EXPECT_TRUE(engine_->verifyStore().ok());
}

TEST_F(StorageEngineTest, FreshChunksStayStandard) {
    add("a", randomBytes(100 * 1024, 11));
    EXPECT_TRUE(engine_->applyLifecyclePolicy().empty());
}

TEST_F(StorageEngineTest, RejectsInvalidConfig) {
    EngineConfig cfg = memoryConfig();
    cfg.backend = "tape";
    EXPECT_THROW({ StorageEngine engine(cfg); }, ConfigError);
    cfg = memoryConfig();
    cfg.chunker.min_size = cfg.chunker.max_size + 1;
    EXPECT_THROW({ StorageEngine engine(cfg); }, ConfigError);
}

class FilesystemEngineTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        previousVarDir_ = getVarDir();
    }

    void TearDown() override {
        setVarDir(previousVarDir_);
        test::TempDirTest::TearDown();
    }

    EngineConfig config() {
        EngineConfig cfg;
        cfg.var_dir = path("repo");
        return cfg;
    }

    std::string previousVarDir_;
};

TEST_F(FilesystemEngineTest, StateSurvivesReopen) {
    auto data = randomBytes(600 * 1024, 12);
    ContentHash manifestId;
    Asset asset;
    {
        StorageEngine engine(config());
        auto in = test::toStream(data);
        asset = engine.chunkAndStore("clip.mov", in, toBytes("meta"));
        Manifest m;
        m.set("clip.mov", asset.id);
        manifestId = engine.commitManifest(m);
    }
    EXPECT_TRUE(std::filesystem::exists(refLogPath()));
    EXPECT_TRUE(std::filesystem::is_directory(chunksDir()));

    {
        StorageEngine engine(config());
        Manifest m = engine.loadManifest(manifestId);
        ASSERT_EQ(m.find("clip.mov"), asset.id);
        Asset loaded = engine.loadAsset(asset.id);
        EXPECT_EQ(loaded.metadata_blob, toBytes("meta"));
        EXPECT_EQ(engine.chunkStore().refCount(loaded.chunks[0].hash), 2u);

        std::vector<std::byte> out;
        engine.materialize(loaded, [&](std::span<const std::byte> bytes) {
            out.insert(out.end(), bytes.begin(), bytes.end());
        });
        EXPECT_EQ(out, data);
        engine.checkpoint();
        EXPECT_TRUE(std::filesystem::exists(indexSnapshotPath()));
    }
    {
        StorageEngine engine(config());
        EXPECT_EQ(engine.chunkStore().refCount(asset.chunks[0].hash), 2u);
        EXPECT_TRUE(engine.verifyStore().ok());
    }
}
