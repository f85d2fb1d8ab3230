#include "input_scanner.hpp"
#include "core/logger.hpp"
#include "matcher/stream_scanner.hpp"

#include <fstream>
#include <string_view>
#include <vector>

namespace IO {

std::optional<ScanSummary> scan_stream(std::istream &input,
                                       const Matcher::AhoCorasick &automaton,
                                       size_t chunk_size,
                                       const HitCallback &on_hit) {
  if (chunk_size == 0) {
    LOG(LogLevel::ERROR, LogComponent::IO_INPUT,
        "Read chunk size must be at least 1 byte");
    return std::nullopt;
  }

  Matcher::StreamScanner scanner(automaton);
  ScanSummary summary;
  std::vector<char> buffer(chunk_size);

  auto visitor = [&](const Matcher::MatchHit &hit) {
    ++summary.match_count;
    return on_hit(hit);
  };

  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = input.gcount();
    if (n <= 0)
      break;

    LOG(LogLevel::TRACE, LogComponent::MATCHER_SCAN,
        "Scanning chunk of " << n << " bytes at offset " << scanner.offset());
    if (!scanner.feed(std::string_view(buffer.data(), static_cast<size_t>(n)),
                      visitor)) {
      summary.stopped_early = true;
      break;
    }
  }

  if (input.bad()) {
    LOG(LogLevel::ERROR, LogComponent::IO_INPUT,
        "Read error after " << scanner.offset() << " bytes");
    return std::nullopt;
  }

  summary.bytes_scanned = scanner.offset();
  return summary;
}

std::optional<ScanSummary> scan_file(const std::string &filepath,
                                     const Matcher::AhoCorasick &automaton,
                                     size_t chunk_size,
                                     const HitCallback &on_hit) {
  std::ifstream file(filepath, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_INPUT,
        "Cannot open input file: " << filepath);
    return std::nullopt;
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_INPUT, "Scanning " << filepath);
  return scan_stream(file, automaton, chunk_size, on_hit);
}

} // namespace IO
