#include "TextDecoder.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <stdexcept>
#include <iconv.h>

namespace UrSerial {

namespace {

const char* const kReplacementChar = "\xEF\xBF\xBD";

class IconvHandle {
public:
    explicit IconvHandle(const std::string& fromEncoding)
        : cd_(iconv_open("UTF-8", fromEncoding.c_str())) {}

    ~IconvHandle() {
        if (valid()) {
            iconv_close(cd_);
        }
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

} // namespace

bool TextDecoder::isUtf8Label(const std::string& encoding) {
    std::string lower(encoding);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.empty() || lower == "utf-8" || lower == "utf8" || lower == "unicode-1-1-utf-8";
}

std::string TextDecoder::decode(const std::vector<uint8_t>& data, const std::string& encoding) {
    return decode(data.data(), data.size(), encoding);
}

std::string TextDecoder::decode(const uint8_t* data, std::size_t size, const std::string& encoding) {
    // UTF-8 input still goes through iconv so that invalid sequences are replaced
    IconvHandle handle(isUtf8Label(encoding) ? std::string("UTF-8") : encoding);
    if (!handle.valid()) {
        throw std::invalid_argument("Unsupported encoding: " + encoding);
    }

    std::string result;
    result.reserve(size * 2);

    char* in = const_cast<char*>(reinterpret_cast<const char*>(data));
    std::size_t inLeft = size;
    char buffer[256];

    while (inLeft > 0) {
        char* out = buffer;
        std::size_t outLeft = sizeof(buffer);

        const std::size_t rc = iconv(handle.get(), &in, &inLeft, &out, &outLeft);
        result.append(buffer, sizeof(buffer) - outLeft);

        if (rc != static_cast<std::size_t>(-1)) {
            continue;
        }

        if (errno == E2BIG) {
            continue;
        } else if (errno == EILSEQ) {
            result.append(kReplacementChar);
            ++in;
            --inLeft;
        } else if (errno == EINVAL) {
            // Truncated sequence at the end of the chunk
            result.append(kReplacementChar);
            break;
        } else {
            throw std::runtime_error("Decoding failed for encoding: " + encoding);
        }
    }

    // Flush any shift state
    char* out = buffer;
    std::size_t outLeft = sizeof(buffer);
    iconv(handle.get(), nullptr, nullptr, &out, &outLeft);
    result.append(buffer, sizeof(buffer) - outLeft);

    return result;
}

} // namespace UrSerial
