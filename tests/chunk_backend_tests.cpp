#include <gtest/gtest.h>
#include "storage/chunk_backend.hpp"
#include "storage/ref_log.hpp"
#include "test_helpers.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace dits;
using test::toBytes;

namespace {

const std::string kKeyA =
    "ab00000000000000000000000000000000000000000000000000000000000001";
const std::string kKeyB =
    "cd00000000000000000000000000000000000000000000000000000000000002";

// Exercise the ChunkBackend contract against any implementation.
void checkContract(ChunkBackend &backend) {
    EXPECT_FALSE(backend.exists(kKeyA));
    EXPECT_THROW(backend.read(kKeyA), NotFoundError);

    backend.write(kKeyA, toBytes("alpha"));
    backend.write(kKeyB, {});
    EXPECT_TRUE(backend.exists(kKeyA));
    EXPECT_EQ(backend.read(kKeyA), toBytes("alpha"));
    EXPECT_TRUE(backend.read(kKeyB).empty());

    backend.write(kKeyA, toBytes("replaced"));
    EXPECT_EQ(backend.read(kKeyA), toBytes("replaced"));

    auto keys = backend.list();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{kKeyA, kKeyB}));

    backend.remove(kKeyA);
    EXPECT_FALSE(backend.exists(kKeyA));
    EXPECT_NO_THROW(backend.remove(kKeyA));
    EXPECT_EQ(backend.list(), std::vector<std::string>{kKeyB});
}

} // namespace

TEST(MemoryChunkBackendTest, Contract) {
    MemoryChunkBackend backend;
    checkContract(backend);
}

class FilesystemChunkBackendTest : public test::TempDirTest {};

TEST_F(FilesystemChunkBackendTest, Contract) {
    FilesystemChunkBackend backend(path("chunks"));
    checkContract(backend);
}

TEST_F(FilesystemChunkBackendTest, ShardsByHexPrefix) {
    FilesystemChunkBackend backend(path("chunks"));
    backend.write(kKeyA, toBytes("x"));
    const std::filesystem::path expected =
        std::filesystem::path(path("chunks")) / "ab" / kKeyA.substr(2);
    EXPECT_EQ(backend.objectPath(kKeyA), expected.string());
    EXPECT_TRUE(std::filesystem::is_regular_file(expected));
}

TEST_F(FilesystemChunkBackendTest, SuffixIsHiddenFromKeys) {
    FilesystemChunkBackend backend(path("records"), ".json");
    backend.write(kKeyA, toBytes("{}"));
    EXPECT_TRUE(std::filesystem::exists(backend.objectPath(kKeyA)));
    EXPECT_EQ(backend.objectPath(kKeyA).substr(
                  backend.objectPath(kKeyA).size() - 5),
              ".json");
    EXPECT_EQ(backend.list(), std::vector<std::string>{kKeyA});
}

TEST_F(FilesystemChunkBackendTest, ListSkipsTemporaryFiles) {
    FilesystemChunkBackend backend(path("chunks"));
    backend.write(kKeyA, toBytes("x"));
    // Leftover from an interrupted write.
    std::filesystem::create_directories(
        std::filesystem::path(backend.objectPath(kKeyB)).parent_path());
    std::ofstream(backend.objectPath(kKeyB) + ".tmp.1.0").put('y');
    EXPECT_EQ(backend.list(), std::vector<std::string>{kKeyA});
}

TEST_F(FilesystemChunkBackendTest, UnwritableRootIsIoError) {
    const std::string file = path("plain_file");
    std::ofstream(file).put('x');
    EXPECT_THROW(FilesystemChunkBackend backend(file + "/chunks"), IoError);
}

class RefLogTest : public test::TempDirTest {};

TEST_F(RefLogTest, AppendAndReplay) {
    const std::string log = path("wal/refs.wal");
    {
        RefLog refLog(log);
        refLog.append({{"op", "set"}, {"n", 1}});
        refLog.append({{"op", "set"}, {"n", 2}});
    }
    std::vector<int> seen;
    size_t applied = RefLog::replay(log, [&](const nlohmann::json &r) {
        seen.push_back(r.at("n").get<int>());
    });
    EXPECT_EQ(applied, 2u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST_F(RefLogTest, MissingLogIsEmpty) {
    size_t applied =
        RefLog::replay(path("absent.wal"), [](const nlohmann::json &) {
            FAIL() << "nothing to replay";
        });
    EXPECT_EQ(applied, 0u);
}

TEST_F(RefLogTest, TornFinalRecordIsSkipped) {
    const std::string log = path("refs.wal");
    {
        std::ofstream out(log);
        out << "{\"n\":1}\n{\"n\":2}\n{\"n\":";
    }
    size_t applied = RefLog::replay(log, [](const nlohmann::json &) {});
    EXPECT_EQ(applied, 2u);
}

TEST_F(RefLogTest, CorruptMiddleRecordIsIntegrityError) {
    const std::string log = path("refs.wal");
    {
        std::ofstream out(log);
        out << "{\"n\":1}\ngarbage\n{\"n\":3}\n";
    }
    EXPECT_THROW(RefLog::replay(log, [](const nlohmann::json &) {}),
                 IntegrityError);
}

TEST_F(RefLogTest, TruncateDiscardsRecords) {
    const std::string log = path("refs.wal");
    RefLog refLog(log);
    refLog.append({{"n", 1}});
    refLog.truncate();
    refLog.append({{"n", 2}});
    std::vector<int> seen;
    RefLog::replay(log, [&](const nlohmann::json &r) {
        seen.push_back(r.at("n").get<int>());
    });
    EXPECT_EQ(seen, std::vector<int>{2});
}

TEST_F(RefLogTest, JsonFileRoundTrip) {
    const std::string file = path("nested/index.json");
    writeJsonFile(file, {{"version", 1}, {"entries", nlohmann::json::array()}});
    nlohmann::json doc = readJsonFile(file);
    EXPECT_EQ(doc["version"], 1);
    EXPECT_FALSE(std::filesystem::exists(file + ".tmp"));

    EXPECT_THROW(readJsonFile(path("missing.json")), NotFoundError);
    std::ofstream(path("bad.json")) << "{not json";
    EXPECT_THROW(readJsonFile(path("bad.json")), IntegrityError);
}
