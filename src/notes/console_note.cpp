#include "annolog/console_note.hpp"
#include "annolog/json_escape.hpp"
#include <openssl/evp.h>
#include <vector>

namespace al {

bool is_base64_char(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
      || c == '+' || c == '/' || c == '=';
}

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) return {};
  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), n > 0 ? static_cast<std::size_t>(n) : 0);
}

std::optional<std::string> base64_decode(std::string_view text) {
  if (text.empty()) return std::string{};
  if (text.size() % 4 != 0) return std::nullopt;
  // EVP_DecodeBlock keeps the zero bytes that padding stands for.
  std::size_t pad = 0;
  if (text.back() == '=') ++pad;
  if (text.size() >= 2 && text[text.size() - 2] == '=') ++pad;
  for (std::size_t i = 0; i + pad < text.size(); ++i) if (text[i] == '=') return std::nullopt;

  std::vector<unsigned char> out(3 * (text.size() / 4));
  const int n = EVP_DecodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0 || static_cast<std::size_t>(n) < pad) return std::nullopt;
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n) - pad);
}

std::string encode_note(std::string_view payload) {
  const auto sz = static_cast<std::uint32_t>(payload.size());
  std::string body;
  body.reserve(4 + payload.size());
  body += static_cast<char>((sz >> 24) & 0xff);
  body += static_cast<char>((sz >> 16) & 0xff);
  body += static_cast<char>((sz >> 8) & 0xff);
  body += static_cast<char>(sz & 0xff);
  body.append(payload.data(), payload.size());

  std::string out(kNotePreamble);
  out += base64_encode(body);
  out += kNotePostamble;
  return out;
}

std::string encode_timestamp_note(std::int64_t millis_since_epoch,
                                  std::optional<std::int64_t> elapsed_millis) {
  std::string p = "{\"type\":\"timestamp\",\"millis\":" + std::to_string(millis_since_epoch);
  if (elapsed_millis) p += ",\"elapsed\":" + std::to_string(*elapsed_millis);
  p += "}";
  return encode_note(p);
}

std::string encode_hyperlink_note(std::string_view url, std::int64_t length) {
  std::string p = "{\"type\":\"hyperlink\",\"url\":";
  append_json_string(p, url);
  p += ",\"length\":" + std::to_string(length) + "}";
  return encode_note(p);
}

std::string remove_notes(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  std::size_t from = 0;
  while (true) {
    const std::size_t idx = line.find(kNotePreamble, from);
    if (idx == std::string_view::npos) break;
    const std::size_t e = line.find(kNotePostamble, idx + kNotePreamble.size());
    if (e == std::string_view::npos) break;
    out.append(line.substr(from, idx - from));
    from = e + kNotePostamble.size();
  }
  out.append(line.substr(from));
  return out;
}

}
