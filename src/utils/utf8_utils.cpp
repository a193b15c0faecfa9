#include "utf8_utils.h"

#include <utf8proc.h>

namespace nestsh::utf8_utils {

namespace {

template <typename Transform>
std::string transform_codepoints(const std::string& str, Transform&& transform) {
    std::string result;
    result.reserve(str.size());

    const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(str.data());
    auto len = static_cast<utf8proc_ssize_t>(str.size());
    utf8proc_ssize_t pos = 0;

    while (pos < len) {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes_read = utf8proc_iterate(data + pos, len - pos, &codepoint);
        if (bytes_read <= 0 || codepoint < 0) {
            result.push_back(static_cast<char>(data[pos]));
            ++pos;
            continue;
        }

        utf8proc_int32_t transformed = transform(codepoint);
        if (transformed == codepoint) {
            result.append(str, static_cast<size_t>(pos), static_cast<size_t>(bytes_read));
        } else {
            utf8proc_uint8_t buffer[4] = {0};
            utf8proc_ssize_t written = utf8proc_encode_char(transformed, buffer);
            if (written <= 0) {
                result.append(str, static_cast<size_t>(pos), static_cast<size_t>(bytes_read));
            } else {
                result.append(reinterpret_cast<char*>(buffer), static_cast<size_t>(written));
            }
        }

        pos += bytes_read;
    }

    return result;
}

}  // namespace

size_t codepoint_length(const std::string& str, size_t pos) {
    if (pos >= str.size()) {
        return 0;
    }

    const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(str.data()) + pos;
    auto remaining = static_cast<utf8proc_ssize_t>(str.size() - pos);
    utf8proc_int32_t codepoint = 0;
    utf8proc_ssize_t bytes_read = utf8proc_iterate(data, remaining, &codepoint);
    if (bytes_read <= 0 || codepoint < 0) {
        return 1;
    }
    return static_cast<size_t>(bytes_read);
}

std::string to_lowercase(const std::string& str) {
    return transform_codepoints(str, [](utf8proc_int32_t cp) { return utf8proc_tolower(cp); });
}

std::string to_uppercase(const std::string& str) {
    return transform_codepoints(str, [](utf8proc_int32_t cp) { return utf8proc_toupper(cp); });
}

}  // namespace nestsh::utf8_utils
