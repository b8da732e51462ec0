#include "core/path_heuristics.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/strip.h"

namespace dropin {

namespace {

constexpr std::string_view kFileScheme = "file://";

bool IsDriveLetterPath(std::string_view s) {
  return s.size() >= 3 && absl::ascii_isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':' &&
         (s[2] == '\\' || s[2] == '/');
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool EndsUri(char c) {
  return absl::ascii_isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'' || c == '<' || c == '>' ||
         c == '\0';
}

}  // namespace

std::string_view StripMatchingQuotes(std::string_view text) {
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::vector<std::string> SplitShellWords(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      } else if (c == '\\' && quote == '"' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
        current += text[++i];
      } else {
        current += c;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      in_word = true;
    } else if (c == '\\' && i + 1 < text.size()) {
      current += text[++i];
      in_word = true;
    } else if (absl::ascii_isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
    } else {
      current += c;
      in_word = true;
    }
  }
  if (in_word) words.push_back(std::move(current));
  return words;
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += text[i];
  }
  return out;
}

std::optional<std::string> DecodeFileUri(std::string_view uri) {
  if (!absl::ConsumePrefix(&uri, kFileScheme)) return std::nullopt;
  absl::ConsumePrefix(&uri, "localhost");
  if (uri.empty() || uri.front() != '/') return std::nullopt;

  std::string path = PercentDecode(uri);
  // file:///C:/dir/file -> C:/dir/file
  if (path.size() >= 4 && IsDriveLetterPath(std::string_view(path).substr(1))) path.erase(0, 1);
  return path;
}

std::vector<std::string> ExtractFileUris(std::string_view text) {
  std::vector<std::string> paths;
  size_t pos = 0;
  while ((pos = text.find(kFileScheme, pos)) != std::string_view::npos) {
    size_t end = pos + kFileScheme.size();
    while (end < text.size() && !EndsUri(text[end])) ++end;
    if (auto path = DecodeFileUri(text.substr(pos, end - pos))) {
      paths.push_back(*std::move(path));
    }
    pos = end;
  }
  return paths;
}

bool HasExplicitPathPrefix(std::string_view word) {
  return absl::StartsWith(word, "/") || absl::StartsWith(word, "~/") || absl::StartsWith(word, "./") ||
         absl::StartsWith(word, "../") || IsDriveLetterPath(word);
}

std::vector<std::string> ExtractBarePaths(std::string_view text) {
  std::vector<std::string> paths;
  absl::flat_hash_set<std::string> seen;
  for (std::string& word : SplitShellWords(text)) {
    if (absl::StartsWith(word, kFileScheme) || !HasExplicitPathPrefix(word)) continue;
    if (word == "/" || word == "./" || word == "../" || word == "~/") continue;
    if (seen.insert(word).second) paths.push_back(std::move(word));
  }
  return paths;
}

bool LooksLikeFilePath(std::string_view text) {
  text = absl::StripAsciiWhitespace(text);
  if (text.empty() || text.find('\n') != std::string_view::npos) return false;
  if (IsDriveLetterPath(text) || HasExplicitPathPrefix(text)) return true;
  if (text.find('/') != std::string_view::npos || text.find('\\') != std::string_view::npos) return true;

  // name.ext with a short alphanumeric extension and no spaces.
  size_t dot = text.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == text.size()) return false;
  if (text.find(' ') != std::string_view::npos) return false;
  std::string_view ext = text.substr(dot + 1);
  if (ext.size() > 10) return false;
  for (char c : ext) {
    if (!absl::ascii_isalnum(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace dropin
