#include <catch2/catch_all.hpp>

#include "runtime/utf8_stream.h"

#include <string>

// "é" is C3 A9, "€" is E2 82 AC, "😀" is F0 9F 98 80.

TEST_CASE("ASCII passes straight through", "[utf8]") {
  parley::Utf8StreamBuffer buffer;
  REQUIRE(buffer.Push("hello") == "hello");
  REQUIRE(buffer.pending() == 0);
  REQUIRE(buffer.Flush() == 0);
}

TEST_CASE("Split multi-byte characters are held until complete", "[utf8]") {
  parley::Utf8StreamBuffer buffer;
  REQUIRE(buffer.Push("caf\xC3") == "caf");
  REQUIRE(buffer.pending() == 1);
  REQUIRE(buffer.Push("\xA9!") == "\xC3\xA9!");
  REQUIRE(buffer.pending() == 0);

  REQUIRE(buffer.Push("\xF0\x9F").empty());
  REQUIRE(buffer.Push("\x98").empty());
  REQUIRE(buffer.Push("\x80") == "\xF0\x9F\x98\x80");
}

TEST_CASE("Flush drops an unfinished tail", "[utf8]") {
  parley::Utf8StreamBuffer buffer;
  REQUIRE(buffer.Push("price: \xE2\x82") == "price: ");
  REQUIRE(buffer.Flush() == 2);
  REQUIRE(buffer.pending() == 0);
}

TEST_CASE("CompletePrefixLength", "[utf8]") {
  using parley::Utf8StreamBuffer;
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("") == 0);
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("abc") == 3);
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("\xE2\x82\xAC") == 3);
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("a\xE2\x82") == 1);
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("a\xF0") == 1);
  // Stray continuation bytes are not held back forever.
  REQUIRE(Utf8StreamBuffer::CompletePrefixLength("\x80\x80\x80\x80\x80") == 5);
}
