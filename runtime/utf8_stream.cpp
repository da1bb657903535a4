#include "runtime/utf8_stream.h"

namespace parley {

namespace {

// Expected sequence length for a lead byte; 0 for a continuation byte.
std::size_t SequenceLength(unsigned char c) {
  if (c < 0x80) {
    return 1;
  }
  if ((c & 0xC0) == 0x80) {
    return 0;
  }
  if ((c & 0xE0) == 0xC0) {
    return 2;
  }
  if ((c & 0xF0) == 0xE0) {
    return 3;
  }
  if ((c & 0xF8) == 0xF0) {
    return 4;
  }
  // Invalid lead byte: pass through as a single unit.
  return 1;
}

} // namespace

std::size_t Utf8StreamBuffer::CompletePrefixLength(const std::string &bytes) {
  std::size_t size = bytes.size();
  // A sequence is at most 4 bytes, so only the last 3 can start an
  // unfinished one.
  std::size_t scan = size < 4 ? size : 4;
  for (std::size_t back = 1; back <= scan; ++back) {
    std::size_t pos = size - back;
    std::size_t need = SequenceLength(static_cast<unsigned char>(bytes[pos]));
    if (need == 0) {
      continue;
    }
    return need > back ? pos : size;
  }
  return size;
}

std::string Utf8StreamBuffer::Push(const std::string &bytes) {
  pending_ += bytes;
  std::size_t complete = CompletePrefixLength(pending_);
  std::string out = pending_.substr(0, complete);
  pending_.erase(0, complete);
  return out;
}

std::size_t Utf8StreamBuffer::Flush() {
  std::size_t dropped = pending_.size();
  pending_.clear();
  return dropped;
}

} // namespace parley
