#ifndef DROPIN_COLOR_H_
#define DROPIN_COLOR_H_

#include <string>
#include <string_view>

namespace icons {
constexpr const char* Success = "✅";
constexpr const char* Error = "❌";
constexpr const char* Warning = "⚠️";
constexpr const char* File = "📄";
constexpr const char* Image = "🖼️";
constexpr const char* Drop = "📥";
constexpr const char* Clipboard = "📋";
constexpr const char* Trash = "🗑️";
}  // namespace icons

namespace ansi {
constexpr const char* Reset = "\033[0m";
constexpr const char* Bold = "\033[1m";

constexpr const char* White = "\033[37m";
constexpr const char* Cyan = "\033[36m";
constexpr const char* Grey = "\033[90m";
constexpr const char* Green = "\033[32m";
constexpr const char* Red = "\033[31m";
constexpr const char* Metadata = Grey;
constexpr const char* Logo = Cyan;
constexpr const char* Added = Green;
constexpr const char* Rejected = Red;
}  // namespace ansi

namespace dropin {

inline std::string Colorize(const std::string& text, const char* bg_background,
                            const char* fg_foreground = ansi::White) {
  return std::string(bg_background) + std::string(fg_foreground) + text + ansi::Reset;
}

/**
 * @brief Calculates the printable length of a string, excluding ANSI escape codes.
 *
 * Counts UTF-8 lead bytes only and skips SGR sequences, so the result is the
 * number of terminal columns for the common single-width case.
 */
inline size_t VisibleLength(std::string_view s) {
  size_t len = 0;
  for (size_t i = 0; i < s.length(); ++i) {
    if (s[i] == '\033' && i + 1 < s.length() && s[i + 1] == '[') {
      i += 2;
      while (i < s.length() && (s[i] < 0x40 || s[i] > 0x7E)) {
        i++;
      }
    } else if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      len++;
    }
  }
  return len;
}

}  // namespace dropin

#endif  // DROPIN_COLOR_H_
