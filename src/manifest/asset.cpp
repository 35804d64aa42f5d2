#include "manifest/asset.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"

#include <array>

namespace dits {

ContentHash ManifestBuilder::sequenceHash(const std::vector<Chunk> &chunks) const {
  BlockIO bio(1, algo_);
  bio.enable_buffering(false);
  for (const auto &c : chunks)
    bio.ingest(reinterpret_cast<const std::byte *>(c.hash.bytes.data()),
               c.hash.bytes.size());
  return bio.finalize_hashed().hash;
}

ContentHash ManifestBuilder::assetId(std::span<const std::byte> metadataBlob,
                                     const ContentHash &sequence) const {
  BlockIO bio(1, algo_);
  bio.enable_buffering(false);
  std::array<std::byte, 8> len{};
  uint64_t n = metadataBlob.size();
  for (auto &b : len) {
    b = static_cast<std::byte>(n & 0xff);
    n >>= 8;
  }
  bio.ingest(len);
  bio.ingest(metadataBlob);
  bio.ingest(reinterpret_cast<const std::byte *>(sequence.bytes.data()),
             sequence.bytes.size());
  return bio.finalize_hashed().hash;
}

Asset ManifestBuilder::build(const std::string &path,
                             std::vector<std::byte> metadataBlob,
                             std::vector<Chunk> chunks) const {
  Asset asset;
  asset.path = path;
  asset.hash_algorithm = algo_;
  uint64_t offset = 0;
  for (auto &c : chunks) {
    c.offset = offset;
    offset += c.length;
  }
  asset.size = offset;
  asset.chunks = std::move(chunks);
  asset.sequence_hash = sequenceHash(asset.chunks);
  asset.metadata_hash = BlockIO::hash(metadataBlob, algo_);
  asset.id = assetId(metadataBlob, asset.sequence_hash);
  asset.metadata_blob = std::move(metadataBlob);
  return asset;
}

Asset ManifestBuilder::withMetadata(const Asset &asset,
                                    std::vector<std::byte> metadataBlob) const {
  Asset updated = asset;
  updated.metadata_hash = BlockIO::hash(metadataBlob, algo_);
  updated.id = assetId(metadataBlob, updated.sequence_hash);
  updated.metadata_blob = std::move(metadataBlob);
  return updated;
}

nlohmann::json assetToJson(const Asset &asset) {
  nlohmann::json chunks = nlohmann::json::array();
  for (const auto &c : asset.chunks) {
    nlohmann::json entry = {{"hash", c.hash.toHex()}, {"length", c.length}};
    if (c.is_boundary_hint)
      entry["hint"] = true;
    chunks.push_back(std::move(entry));
  }
  return {{"id", asset.id.toHex()},
          {"size", asset.size},
          {"hash_algorithm", utils::hashAlgorithmName(asset.hash_algorithm)},
          {"metadata", asset.metadata_hash.toHex()},
          {"sequence_hash", asset.sequence_hash.toHex()},
          {"chunks", std::move(chunks)}};
}

Asset assetFromJson(const nlohmann::json &record,
                    std::vector<std::byte> metadataBlob,
                    const std::string &path) {
  std::string recordId;
  std::vector<Chunk> chunks;
  utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3;
  try {
    recordId = record.at("id").get<std::string>();
    algo = utils::parseHashAlgorithm(
        record.at("hash_algorithm").get<std::string>());
    for (const auto &entry : record.at("chunks")) {
      Chunk c;
      c.hash = ContentHash::fromHex(entry.at("hash").get<std::string>());
      c.length = entry.at("length").get<uint32_t>();
      c.is_boundary_hint = entry.value("hint", false);
      chunks.push_back(c);
    }
  } catch (const nlohmann::json::exception &e) {
    throwIntegrityError(std::string("malformed asset record: ") + e.what());
  } catch (const ConfigError &e) {
    throwIntegrityError(std::string("malformed asset record: ") + e.what());
  }

  Asset asset =
      ManifestBuilder(algo).build(path, std::move(metadataBlob),
                                  std::move(chunks));
  if (asset.id.toHex() != recordId)
    throwIntegrityError("asset record " + recordId +
                        " does not match its content (computed " +
                        asset.id.toHex() + ")");
  return asset;
}

} // namespace dits
