#include "reconstruct/reconstructor.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace dits {

std::vector<std::byte> Reconstructor::fetch(const Asset &asset, size_t index,
                                            uint64_t offset) const {
  const Chunk &c = asset.chunks[index];
  std::vector<std::byte> data;
  try {
    data = store_.get(c.hash);
  } catch (const IntegrityError &) {
    // Already logged by the store; attach the position within the asset.
    throw IntegrityError("chunk failed verification", c.hash.toHex(), index,
                         offset);
  }
  if (data.size() != c.length)
    throwIntegrityError("chunk is " + std::to_string(data.size()) +
                            " bytes, asset expects " +
                            std::to_string(c.length),
                        c.hash.toHex(), index, offset);
  return data;
}

void Reconstructor::reconstruct(const Asset &asset, const ByteSink &sink,
                                std::stop_token stop) const {
  uint64_t offset = 0;
  for (size_t i = 0; i < asset.chunks.size(); ++i) {
    if (stop.stop_requested())
      throw CancelledError("reconstruction of asset " + asset.id.shortHex());
    const std::vector<std::byte> data = fetch(asset, i, offset);
    sink(data);
    offset += data.size();
  }
}

void Reconstructor::reconstruct(const Asset &asset, std::ostream &out,
                                std::stop_token stop) const {
  reconstruct(
      asset,
      [&out](std::span<const std::byte> bytes) {
        out.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out)
          throwIoError("output stream write failed");
      },
      stop);
}

std::vector<std::byte>
Reconstructor::reconstructToBytes(const Asset &asset) const {
  std::vector<std::byte> out;
  out.reserve(static_cast<size_t>(asset.size));
  reconstruct(asset, [&out](std::span<const std::byte> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
  });
  return out;
}

uint64_t Reconstructor::reconstructRange(const Asset &asset, uint64_t offset,
                                         uint64_t length, const ByteSink &sink,
                                         std::stop_token stop) const {
  if (offset >= asset.size || length == 0)
    return 0;
  const uint64_t end = offset + std::min(length, asset.size - offset);

  // First chunk whose end lies past offset.
  auto first = std::upper_bound(
      asset.chunks.begin(), asset.chunks.end(), offset,
      [](uint64_t pos, const Chunk &c) { return pos < c.offset + c.length; });

  uint64_t written = 0;
  for (auto it = first; it != asset.chunks.end() && it->offset < end; ++it) {
    if (stop.stop_requested())
      throw CancelledError("range read of asset " + asset.id.shortHex());
    const size_t index = static_cast<size_t>(it - asset.chunks.begin());
    const std::vector<std::byte> data = fetch(asset, index, it->offset);
    const uint64_t from = std::max(offset, it->offset) - it->offset;
    const uint64_t to = std::min<uint64_t>(end, it->offset + it->length) -
                        it->offset;
    sink(std::span<const std::byte>(data).subspan(
        static_cast<size_t>(from), static_cast<size_t>(to - from)));
    written += to - from;
  }
  return written;
}

void Reconstructor::exportToFile(const Asset &asset, const std::string &path,
                                 std::stop_token stop) const {
  const std::string tmp = path + ".dits-tmp";
  auto discard = [&tmp] {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
  };

  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    throwIoError("cannot open for writing", tmp);
  try {
    reconstruct(asset, out, stop);
    out.flush();
    if (!out)
      throwIoError("short write", tmp);
    out.close();
  } catch (const IntegrityError &e) {
    out.close();
    discard();
    throw IntegrityError("cannot export " + path, e.chunkHash(),
                         e.chunkIndex(), e.byteOffset());
  } catch (...) {
    out.close();
    discard();
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    discard();
    throwIoError("rename failed: " + ec.message(), path);
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Exported " + std::to_string(asset.size) +
                                " bytes to " + path);
}

} // namespace dits
