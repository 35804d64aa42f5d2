#include "diff/diff_engine.hpp"

#include <deque>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace dits {

namespace {

// Positions of each hash that a cursor has not yet passed.
class PositionIndex {
public:
  explicit PositionIndex(const std::vector<Chunk> &chunks) {
    for (size_t i = 0; i < chunks.size(); ++i)
      positions_[chunks[i].hash].push_back(i);
  }

  bool occursFrom(const ContentHash &hash, size_t cursor) {
    auto it = positions_.find(hash);
    if (it == positions_.end())
      return false;
    auto &queue = it->second;
    while (!queue.empty() && queue.front() < cursor)
      queue.pop_front();
    return !queue.empty();
  }

private:
  std::unordered_map<ContentHash, std::deque<size_t>> positions_;
};

} // namespace

const char *diffOpName(DiffOpType type) {
  switch (type) {
  case DiffOpType::Keep:
    return "keep";
  case DiffOpType::Insert:
    return "insert";
  case DiffOpType::Delete:
    return "delete";
  case DiffOpType::Replace:
    return "replace";
  }
  return "keep";
}

DiffResult DiffEngine::diff(const std::vector<Chunk> &oldChunks,
                            const std::vector<Chunk> &newChunks) {
  DiffResult result;
  DiffStats &s = result.stats;
  PositionIndex oldIndex(oldChunks);
  PositionIndex newIndex(newChunks);
  std::unordered_set<ContentHash> oldHashes;
  for (const auto &c : oldChunks)
    oldHashes.insert(c.hash);

  auto keep = [&](size_t i, size_t j) {
    result.ops.push_back(
        {DiffOpType::Keep, i, j, oldChunks[i], newChunks[j]});
    ++s.chunks_kept;
    s.bytes_kept += newChunks[j].length;
  };
  auto insert = [&](size_t j) {
    result.ops.push_back(
        {DiffOpType::Insert, std::nullopt, j, std::nullopt, newChunks[j]});
    ++s.chunks_added;
    s.bytes_added += newChunks[j].length;
    if (oldHashes.count(newChunks[j].hash))
      ++s.chunks_reused;
  };
  auto remove = [&](size_t i) {
    result.ops.push_back(
        {DiffOpType::Delete, i, std::nullopt, oldChunks[i], std::nullopt});
    ++s.chunks_removed;
    s.bytes_removed += oldChunks[i].length;
  };
  auto replace = [&](size_t i, size_t j) {
    result.ops.push_back(
        {DiffOpType::Replace, i, j, oldChunks[i], newChunks[j]});
    ++s.chunks_added;
    ++s.chunks_removed;
    s.bytes_added += newChunks[j].length;
    s.bytes_removed += oldChunks[i].length;
    if (oldHashes.count(newChunks[j].hash))
      ++s.chunks_reused;
  };

  size_t i = 0;
  size_t j = 0;
  while (i < oldChunks.size() && j < newChunks.size()) {
    if (oldChunks[i].hash == newChunks[j].hash) {
      keep(i++, j++);
    } else if (!newIndex.occursFrom(oldChunks[i].hash, j)) {
      remove(i++);
    } else if (!oldIndex.occursFrom(newChunks[j].hash, i)) {
      insert(j++);
    } else {
      replace(i++, j++);
    }
  }
  while (i < oldChunks.size())
    remove(i++);
  while (j < newChunks.size())
    insert(j++);

  const size_t total = s.chunks_kept + s.chunks_added + s.chunks_removed;
  s.similarity =
      total == 0 ? 1.0 : static_cast<double>(s.chunks_kept) / total;
  return result;
}

DiffResult DiffEngine::diffAssets(const Asset &oldAsset,
                                  const Asset &newAsset) {
  DiffResult result = diff(oldAsset.chunks, newAsset.chunks);
  result.metadata_changed = oldAsset.metadata_hash != newAsset.metadata_hash;
  return result;
}

std::string DiffEngine::format(const DiffResult &result) {
  std::ostringstream out;
  for (const auto &op : result.ops) {
    out << std::left << std::setw(8) << diffOpName(op.type);
    if (op.type == DiffOpType::Keep) {
      out << "  " << op.new_chunk->hash.shortHex() << " ("
          << op.new_chunk->length << ")\n";
      continue;
    }
    if (op.old_chunk)
      out << " -" << op.old_chunk->hash.shortHex() << " ("
          << op.old_chunk->length << ")";
    if (op.new_chunk)
      out << " +" << op.new_chunk->hash.shortHex() << " ("
          << op.new_chunk->length << ")";
    out << '\n';
  }
  const DiffStats &s = result.stats;
  out << "kept " << s.chunks_kept << ", added " << s.chunks_added
      << " (+" << s.bytes_added << " bytes), removed " << s.chunks_removed
      << " (-" << s.bytes_removed << " bytes), reused " << s.chunks_reused
      << ", similarity " << std::fixed << std::setprecision(3)
      << s.similarity;
  if (result.metadata_changed)
    out << ", metadata changed";
  out << '\n';
  return out.str();
}

} // namespace dits
