#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace advisor {

/// 不正なシーケンスを U+FFFD に置き換えた有効な UTF-8 を返す
std::string sanitize_utf8_lossy(std::string_view input);

/// 末尾の書きかけマルチバイト文字を除いた長さ。
/// ストリーム途中のバッファに使い、続きのバイトが届くまで末尾を保留する。
size_t utf8_complete_prefix_length(std::string_view input);

}  // namespace advisor
