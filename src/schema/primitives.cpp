#include <proofline/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace proofline::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const identifier_t& identifier) {
  return bytes_view_t{identifier.data(), identifier.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const identifier_t& identifier) {
  return make_string(make_bytes_view(identifier));
}

std::optional<identifier_t> try_make_identifier(const bytes_view_t& bytes) {
  auto identifier = identifier_t{};
  if (bytes.size() != identifier.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(identifier));
  return identifier;
}

std::optional<identifier_t> try_make_identifier(const std::string& bytes) {
  return try_make_identifier(make_bytes_view(bytes));
}

std::optional<identifier_t> try_parse_identifier(std::string_view hex) {
  hex = normalize_hex(hex);
  if (hex.empty() || hex.size() > kIdentifierHexLength) {
    return std::nullopt;
  }

  auto padded = std::string(kIdentifierHexLength - hex.size(), '0');
  padded.append(hex);

  auto decoded = try_from_hex_internal(padded);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_identifier(make_bytes_view(*decoded));
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const identifier_t& identifier) {
  return to_hex(make_bytes_view(identifier));
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

}  // namespace proofline::schema
