#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace onionsite {

// v3 onion address: 56 characters of base32 (a-z, 2-7) followed by ".onion".
constexpr std::size_t ONION_ID_LENGTH = 56;

bool is_onion_address(const std::string& s);

// First line of text that, once trimmed, is exactly an onion address.
// Lines that merely contain one, or are close but malformed, are skipped.
std::optional<std::string> find_onion_address(const std::string& text);

std::string trim(const std::string& s);

} // namespace onionsite
