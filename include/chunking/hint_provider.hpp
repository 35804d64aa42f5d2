#ifndef DITS_HINT_PROVIDER_HPP
#define DITS_HINT_PROVIDER_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <vector>

namespace dits {

/**
 * @brief Format-aware boundary hint capability.
 *
 * Reads the stream and returns preferred cut offsets. The chunker only ever
 * sees the returned offsets, never the parser behind them. A provider may
 * leave the stream at any position; callers rewind before chunking.
 */
using HintProvider = std::function<std::vector<uint64_t>(std::istream &)>;

/// Sort and deduplicate a hint list, dropping offset 0.
std::vector<uint64_t> normalizeHints(std::vector<uint64_t> hints);

/// Provider that ignores the stream and returns a fixed list.
HintProvider staticHints(std::vector<uint64_t> offsets);

/**
 * @brief Keyframe offsets of an H.264 Annex-B elementary stream.
 *
 * Reports the start-code offset of every IDR slice NAL unit (type 5). The
 * scan is streaming and keeps only a three byte carry between reads.
 */
HintProvider h264KeyframeHints();

} // namespace dits

#endif // DITS_HINT_PROVIDER_HPP
