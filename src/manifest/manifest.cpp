#include "manifest/manifest.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"

namespace dits {

void Manifest::set(const std::string &path, const ContentHash &assetId) {
  entries_[path] = assetId;
}

bool Manifest::remove(const std::string &path) {
  return entries_.erase(path) > 0;
}

std::optional<ContentHash> Manifest::find(const std::string &path) const {
  auto it = entries_.find(path);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

ContentHash Manifest::id(utils::HashAlgorithm algo) const {
  BlockIO bio(1, algo);
  bio.enable_buffering(false);
  for (const auto &e : entries_) {
    const uint32_t nlen = static_cast<uint32_t>(e.first.size());
    const std::byte lenBytes[4] = {
        static_cast<std::byte>(nlen & 0xff),
        static_cast<std::byte>((nlen >> 8) & 0xff),
        static_cast<std::byte>((nlen >> 16) & 0xff),
        static_cast<std::byte>((nlen >> 24) & 0xff)};
    bio.ingest(lenBytes, sizeof(lenBytes));
    bio.ingest(reinterpret_cast<const std::byte *>(e.first.data()), nlen);
    bio.ingest(reinterpret_cast<const std::byte *>(e.second.bytes.data()),
               e.second.bytes.size());
  }
  return bio.finalize_hashed().hash;
}

nlohmann::json Manifest::toJson() const {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto &e : entries_)
    entries.push_back({{"path", e.first}, {"asset", e.second.toHex()}});
  return {{"version", 1}, {"entries", std::move(entries)}};
}

Manifest Manifest::fromJson(const nlohmann::json &doc) {
  Manifest m;
  try {
    for (const auto &e : doc.at("entries"))
      m.set(e.at("path").get<std::string>(),
            ContentHash::fromHex(e.at("asset").get<std::string>()));
  } catch (const nlohmann::json::exception &e) {
    throwIntegrityError(std::string("malformed manifest: ") + e.what());
  }
  return m;
}

} // namespace dits
