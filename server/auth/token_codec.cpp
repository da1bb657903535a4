#include "server/auth/token_codec.h"

#include <nlohmann/json.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace parley {

TokenCodec::TokenCodec(std::string secret, Clock clock)
    : secret_(std::move(secret)), clock_(std::move(clock)) {
  if (secret_.empty()) {
    throw std::invalid_argument("token signing secret must not be empty");
  }
}

std::int64_t TokenCodec::Now() const {
  if (clock_) {
    return clock_();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string TokenCodec::Base64UrlEncode(const std::string& input) {
  static const char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
  std::string output;
  output.reserve((input.size() + 2) / 3 * 4);
  std::size_t i = 0;
  while (i + 2 < input.size()) {
    auto b0 = static_cast<unsigned char>(input[i]);
    auto b1 = static_cast<unsigned char>(input[i + 1]);
    auto b2 = static_cast<unsigned char>(input[i + 2]);
    output.push_back(kAlphabet[b0 >> 2]);
    output.push_back(kAlphabet[((b0 & 0x3) << 4) | (b1 >> 4)]);
    output.push_back(kAlphabet[((b1 & 0xF) << 2) | (b2 >> 6)]);
    output.push_back(kAlphabet[b2 & 0x3F]);
    i += 3;
  }
  std::size_t rest = input.size() - i;
  if (rest == 1) {
    auto b0 = static_cast<unsigned char>(input[i]);
    output.push_back(kAlphabet[b0 >> 2]);
    output.push_back(kAlphabet[(b0 & 0x3) << 4]);
  } else if (rest == 2) {
    auto b0 = static_cast<unsigned char>(input[i]);
    auto b1 = static_cast<unsigned char>(input[i + 1]);
    output.push_back(kAlphabet[b0 >> 2]);
    output.push_back(kAlphabet[((b0 & 0x3) << 4) | (b1 >> 4)]);
    output.push_back(kAlphabet[(b1 & 0xF) << 2]);
  }
  return output;
}

std::string TokenCodec::Base64UrlDecode(const std::string& input) {
  std::string normalized = input;
  for (char& c : normalized) {
    if (c == '-') c = '+';
    if (c == '_') c = '/';
  }
  while (normalized.size() % 4 != 0) {
    normalized.push_back('=');
  }
  std::string output;
  output.reserve(normalized.size() * 3 / 4);
  auto decode_char = [](char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  };
  for (std::size_t i = 0; i < normalized.size(); i += 4) {
    int b0 = decode_char(normalized[i]);
    int b1 = decode_char(normalized[i + 1]);
    int b2 = normalized[i + 2] == '=' ? -1 : decode_char(normalized[i + 2]);
    int b3 = normalized[i + 3] == '=' ? -1 : decode_char(normalized[i + 3]);
    if (b0 < 0 || b1 < 0 || (normalized[i + 2] != '=' && b2 < 0) ||
        (normalized[i + 3] != '=' && b3 < 0)) {
      return {};
    }
    output.push_back(static_cast<char>((b0 << 2) | (b1 >> 4)));
    if (b2 >= 0) {
      output.push_back(static_cast<char>(((b1 & 0xF) << 4) | (b2 >> 2)));
    }
    if (b3 >= 0) {
      output.push_back(static_cast<char>(((b2 & 0x3) << 6) | b3));
    }
  }
  return output;
}

std::string TokenCodec::Sign(const std::string& header_payload) const {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;
  if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(header_payload.data()), header_payload.size(),
            mac, &mac_len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return Base64UrlEncode(std::string(reinterpret_cast<const char*>(mac), mac_len));
}

std::string TokenCodec::Encode(const std::string& subject, std::int64_t expires_at) const {
  json header = {{"alg", "HS256"}, {"typ", "JWT"}};
  json payload = {{"sub", subject}, {"exp", expires_at}};
  std::string header_payload =
      Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
  return header_payload + "." + Sign(header_payload);
}

bool TokenCodec::Verify(const std::string& token, std::string* subject_out) const {
  auto first_dot = token.find('.');
  auto second_dot = token.find('.', first_dot == std::string::npos ? 0 : first_dot + 1);
  if (first_dot == std::string::npos || second_dot == std::string::npos ||
      token.find('.', second_dot + 1) != std::string::npos) {
    return false;
  }
  std::string header_str = Base64UrlDecode(token.substr(0, first_dot));
  std::string payload_str = Base64UrlDecode(token.substr(first_dot + 1, second_dot - first_dot - 1));
  if (header_str.empty() || payload_str.empty()) {
    return false;
  }

  json header;
  json payload;
  try {
    header = json::parse(header_str);
    payload = json::parse(payload_str);
  } catch (const json::exception&) {
    return false;
  }
  if (!header.is_object() || !payload.is_object()) {
    return false;
  }

  if (header.value("alg", "") != "HS256") {
    return false;
  }

  std::string header_payload = token.substr(0, second_dot);
  std::string signature = token.substr(second_dot + 1);
  std::string expected = Sign(header_payload);
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    return false;
  }

  // A token without exp never expires in the wire format; we refuse it.
  if (!payload.contains("exp") || !payload["exp"].is_number()) {
    return false;
  }
  if (Now() >= payload["exp"].get<std::int64_t>()) {
    return false;
  }

  if (!payload.contains("sub") || !payload["sub"].is_string()) {
    return false;
  }
  std::string sub = payload["sub"].get<std::string>();
  if (sub.empty()) {
    return false;
  }
  if (subject_out) {
    *subject_out = sub;
  }
  return true;
}

}  // namespace parley
