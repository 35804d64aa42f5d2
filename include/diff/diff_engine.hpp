#ifndef DITS_DIFF_ENGINE_HPP
#define DITS_DIFF_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunking/chunker.hpp"
#include "manifest/asset.hpp"

namespace dits {

enum class DiffOpType { Keep, Insert, Delete, Replace };

const char *diffOpName(DiffOpType type);

/// One edit step. Indices refer to positions in the old and new sequences.
struct DiffOp {
  DiffOpType type;
  std::optional<size_t> old_index; ///< Keep, Delete, Replace
  std::optional<size_t> new_index; ///< Keep, Insert, Replace
  std::optional<Chunk> old_chunk;
  std::optional<Chunk> new_chunk;
};

struct DiffStats {
  size_t chunks_kept{0};
  size_t chunks_added{0};
  size_t chunks_removed{0};
  /// Inserted or replacing chunks whose hash also occurs in the old sequence.
  size_t chunks_reused{0};
  uint64_t bytes_kept{0};
  uint64_t bytes_added{0};
  uint64_t bytes_removed{0};
  double similarity{1.0};
};

struct DiffResult {
  std::vector<DiffOp> ops;
  DiffStats stats;
  bool metadata_changed{false};
};

/**
 * @brief Linear-time chunk sequence diff.
 *
 * Aligned cursors walk both sequences. Equal hashes are kept. On a
 * mismatch the old chunk is deleted if its hash does not occur in the
 * unconsumed part of the new sequence, otherwise the new chunk is inserted
 * if its hash does not occur in the unconsumed part of the old sequence,
 * otherwise the two are paired as a Replace. This is not a minimal edit
 * script; moved content shows up as Replace and is reported through
 * DiffStats::chunks_reused.
 *
 * Keep, Insert and Replace ops follow the new order, Delete ops the old.
 */
class DiffEngine {
public:
  static DiffResult diff(const std::vector<Chunk> &oldChunks,
                         const std::vector<Chunk> &newChunks);

  static DiffResult diffAssets(const Asset &oldAsset, const Asset &newAsset);

  /// One line per op, for the CLI.
  static std::string format(const DiffResult &result);
};

} // namespace dits

#endif // DITS_DIFF_ENGINE_HPP
