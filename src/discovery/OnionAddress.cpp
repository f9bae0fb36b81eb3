#include "discovery/OnionAddress.hpp"

#include <cctype>
#include <sstream>

using namespace onionsite;

namespace {

constexpr const char* SUFFIX = ".onion";
constexpr std::size_t SUFFIX_LENGTH = 6;

bool is_base32_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '2' && c <= '7');
}

} // namespace

bool onionsite::is_onion_address(const std::string& s) {
    if (s.size() != ONION_ID_LENGTH + SUFFIX_LENGTH) return false;
    if (s.compare(ONION_ID_LENGTH, SUFFIX_LENGTH, SUFFIX) != 0) return false;
    for (std::size_t i = 0; i < ONION_ID_LENGTH; ++i) {
        if (!is_base32_char(s[i])) return false;
    }
    return true;
}

std::string onionsite::trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::optional<std::string> onionsite::find_onion_address(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);  // also drops a trailing '\r'
        if (is_onion_address(t)) return t;
    }
    return std::nullopt;
}
