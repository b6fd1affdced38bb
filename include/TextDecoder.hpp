#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace UrSerial {

// Decodes received bytes into UTF-8 text.
class TextDecoder {
public:
    // Throws std::invalid_argument for an encoding label iconv does not know.
    // Malformed input is replaced with U+FFFD.
    static std::string decode(const uint8_t* data, std::size_t size, const std::string& encoding);
    static std::string decode(const std::vector<uint8_t>& data, const std::string& encoding);

    static bool isUtf8Label(const std::string& encoding);
};

} // namespace UrSerial
