#include "chunking/hint_provider.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <array>

namespace dits {

std::vector<uint64_t> normalizeHints(std::vector<uint64_t> hints) {
  std::sort(hints.begin(), hints.end());
  hints.erase(std::unique(hints.begin(), hints.end()), hints.end());
  if (!hints.empty() && hints.front() == 0)
    hints.erase(hints.begin());
  return hints;
}

HintProvider staticHints(std::vector<uint64_t> offsets) {
  auto sorted = normalizeHints(std::move(offsets));
  return [sorted](std::istream &) { return sorted; };
}

HintProvider h264KeyframeHints() {
  return [](std::istream &in) {
    constexpr size_t kBlock = 64 * 1024;
    constexpr uint8_t kNalTypeIdr = 5;

    std::vector<uint64_t> hints;
    std::vector<uint8_t> window; // carry + current block
    std::array<char, kBlock> block;
    uint64_t windowOffset = 0;   // stream offset of window[0]
    bool carried = false;        // window[0] was scanned in the last pass

    while (true) {
      in.read(block.data(), block.size());
      std::streamsize got = in.gcount();
      if (in.bad())
        throwIoError("failed to read stream while scanning for keyframes");
      if (got <= 0)
        break;
      window.insert(window.end(), block.begin(), block.begin() + got);

      // A start code is 00 00 01 followed by the NAL header byte. The four
      // byte form 00 00 00 01 is reported at its leading zero.
      size_t i = carried ? 1 : 0;
      for (; i + 3 < window.size(); ++i) {
        if (window[i] != 0 || window[i + 1] != 0 || window[i + 2] != 1)
          continue;
        if ((window[i + 3] & 0x1F) != kNalTypeIdr)
          continue;
        uint64_t at = windowOffset + i;
        if (i > 0 && window[i - 1] == 0)
          at -= 1;
        hints.push_back(at);
      }
      // Keep the last three unscanned bytes plus one byte of look-behind
      // for the four byte start code form.
      if (window.size() < 4)
        continue;
      windowOffset += window.size() - 4;
      window.erase(window.begin(), window.end() - 4);
      carried = true;
    }
    return normalizeHints(std::move(hints));
  };
}

} // namespace dits
