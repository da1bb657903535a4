#pragma once

#include <cstddef>
#include <string>

namespace parley {

// Re-chunks a byte stream so every emitted piece ends on a UTF-8 code point
// boundary. Token pieces from the model can split a multi-byte character;
// the partial bytes are held until the rest arrives.
class Utf8StreamBuffer {
public:
  // Appends `bytes` and returns the longest complete prefix of everything
  // buffered so far. May return an empty string.
  std::string Push(const std::string &bytes);

  // Drops whatever incomplete sequence is still held and returns how many
  // bytes were dropped.
  std::size_t Flush();

  std::size_t pending() const { return pending_.size(); }

  // Length of the longest prefix of `bytes` that does not end inside a
  // multi-byte sequence.
  static std::size_t CompletePrefixLength(const std::string &bytes);

private:
  std::string pending_;
};

} // namespace parley
