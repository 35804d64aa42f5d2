#ifndef DITS_MANIFEST_HPP
#define DITS_MANIFEST_HPP

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "utilities/digest.hpp"

namespace dits {

/**
 * @brief Path to asset id mapping for one commit.
 *
 * Entries are kept sorted by path, so the id does not depend on insertion
 * order.
 */
class Manifest {
public:
  void set(const std::string &path, const ContentHash &assetId);
  /// @return false if @p path was not present.
  bool remove(const std::string &path);
  std::optional<ContentHash> find(const std::string &path) const;

  const std::map<std::string, ContentHash> &entries() const {
    return entries_;
  }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  /**
   * @brief Hash of the sorted entries.
   *
   * Each entry contributes a 4 byte path length, the path and the 32 byte
   * asset id.
   */
  ContentHash id(utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3) const;

  nlohmann::json toJson() const;
  /// @throw IntegrityError on a malformed document.
  static Manifest fromJson(const nlohmann::json &doc);

  bool operator==(const Manifest &other) const {
    return entries_ == other.entries_;
  }

private:
  std::map<std::string, ContentHash> entries_;
};

} // namespace dits

#endif // DITS_MANIFEST_HPP
