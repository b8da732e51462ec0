#ifndef DROPIN_PATH_HEURISTICS_H_
#define DROPIN_PATH_HEURISTICS_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dropin {

// Removes one pair of matching surrounding quotes ('...' or "...").
std::string_view StripMatchingQuotes(std::string_view text);

// Splits like a shell would for word boundaries: whitespace separates words,
// quotes group, a backslash escapes the next character.
std::vector<std::string> SplitShellWords(std::string_view text);

// Decodes %XX escapes. Malformed escapes are kept literally.
std::string PercentDecode(std::string_view text);

// Converts a file:// URI to a local path. Accepts an empty host or
// "localhost"; other hosts yield nullopt.
std::optional<std::string> DecodeFileUri(std::string_view uri);

// Every file:// URI in `text`, decoded. Stops each URI at whitespace or quotes.
std::vector<std::string> ExtractFileUris(std::string_view text);

// True if `word` starts like an explicit path: "/", "~/", "./", "../" or "C:\".
bool HasExplicitPathPrefix(std::string_view word);

// Explicit-prefix paths among the shell words of `text`, in order, without repeats.
std::vector<std::string> ExtractBarePaths(std::string_view text);

/**
 * @brief Loose test for clipboard text that may name a file.
 *
 * Matches Windows drive paths, Unix absolute paths, ./ and ../ relative paths,
 * bare "name.ext" words and anything containing a path separator. Callers still
 * have to check the path exists.
 */
bool LooksLikeFilePath(std::string_view text);

}  // namespace dropin

#endif  // DROPIN_PATH_HEURISTICS_H_
