#include "utils/utf8.h"

namespace advisor {

namespace {
constexpr char kReplacement[] = "\xEF\xBF\xBD";

inline void append_replacement(std::string& out) {
    out.append(kReplacement, sizeof(kReplacement) - 1);
}

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// 先頭バイトが示すシーケンス長。先頭になれないバイトは 0
inline size_t sequence_length(unsigned char c0) {
    if (c0 <= 0x7F) return 1;
    if (c0 >= 0xC2 && c0 <= 0xDF) return 2;
    if (c0 >= 0xE0 && c0 <= 0xEF) return 3;
    if (c0 >= 0xF0 && c0 <= 0xF4) return 4;
    return 0;
}

}  // namespace

std::string sanitize_utf8_lossy(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    while (i < input.size()) {
        const unsigned char c0 = bytes[i];
        const size_t len = sequence_length(c0);
        if (len == 1) {
            out.push_back(static_cast<char>(c0));
            ++i;
            continue;
        }
        if (len == 0) {
            append_replacement(out);
            ++i;
            continue;
        }

        if (i + len > input.size()) {
            append_replacement(out);
            break;
        }

        bool continuation_ok = true;
        for (size_t k = 1; k < len; ++k) {
            if (!is_continuation(bytes[i + k])) {
                continuation_ok = false;
                break;
            }
        }
        if (!continuation_ok) {
            append_replacement(out);
            ++i;
            continue;
        }

        // 冗長表現・サロゲート・U+10FFFF 超えを弾く
        const unsigned char c1 = bytes[i + 1];
        bool ok = true;
        if (len == 3) {
            if (c0 == 0xE0 && c1 < 0xA0) ok = false;
            if (c0 == 0xED && c1 >= 0xA0) ok = false;
        } else if (len == 4) {
            if (c0 == 0xF0 && c1 < 0x90) ok = false;
            if (c0 == 0xF4 && c1 > 0x8F) ok = false;
        }
        if (!ok) {
            append_replacement(out);
            ++i;
            continue;
        }

        out.append(input.data() + i, len);
        i += len;
    }

    return out;
}

size_t utf8_complete_prefix_length(std::string_view input) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(input.data());
    const size_t size = input.size();
    // 末尾から最大3バイト戻って先頭バイトを探す
    for (size_t back = 1; back <= 3 && back <= size; ++back) {
        const unsigned char c = bytes[size - back];
        if (is_continuation(c)) {
            continue;
        }
        const size_t len = sequence_length(c);
        if (len > back) {
            return size - back;
        }
        return size;
    }
    return size;
}

}  // namespace advisor
