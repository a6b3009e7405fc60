#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace proofline::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

/// 32-byte billing account handle tracked by the proof network.
using identifier_t = std::array<uint8_t, 32>;
using proof_payload_t = std::string;
using job_id_t = std::string;
using balance_t = double;

inline constexpr auto kIdentifierHexLength = std::size_t{64};

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const identifier_t& identifier);
bytes_view_t make_bytes_view(const std::string& bytes);

std::string make_string(const bytes_view_t& bytes);
std::string make_string(const identifier_t& identifier);

/// Copy exactly 32 raw bytes into an identifier.
std::optional<identifier_t> try_make_identifier(const bytes_view_t& bytes);
std::optional<identifier_t> try_make_identifier(const std::string& bytes);

/// Parse a hex identifier. A leading 0x/0X marker is stripped and the
/// remainder is left-padded with '0' to 64 characters. Empty, overlong or
/// non-hex input yields std::nullopt.
std::optional<identifier_t> try_parse_identifier(std::string_view hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const identifier_t& identifier);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace proofline::schema
