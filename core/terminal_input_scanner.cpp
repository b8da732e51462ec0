#include "core/terminal_input_scanner.h"

#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "core/path_heuristics.h"

namespace dropin {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';
constexpr std::string_view kPasteStart = "\x1b[200~";
constexpr std::string_view kPasteEnd = "\x1b[201~";
constexpr std::string_view kInlineFilePrefix = "1337;File=";
constexpr size_t kMaxSgrLength = 32;

ScanEvent MouseEvent(ScanEvent::Type type, int x, int y) {
  ScanEvent event{type};
  event.x = x;
  event.y = y;
  return event;
}

ScanEvent PathEvent(std::string path) {
  ScanEvent event{ScanEvent::Type::kPath};
  event.path = std::move(path);
  return event;
}

ScanEvent ErrorEvent(std::string message) {
  ScanEvent event{ScanEvent::Type::kError};
  event.message = std::move(message);
  return event;
}

// Button byte layout: low two bits pick the button, 32 flags motion, 64 the wheel.
void EmitMouse(int b, int x, int y, bool pressed, std::vector<ScanEvent>& events) {
  if (b & 64) return;
  int button = b & 3;
  if (b & 32) {
    if (button == 0) events.push_back(MouseEvent(ScanEvent::Type::kMouseDrag, x, y));
    return;
  }
  if (pressed) {
    if (button == 0) {
      events.push_back(MouseEvent(ScanEvent::Type::kMousePress, x, y));
    } else if (button != 3) {
      events.push_back(MouseEvent(ScanEvent::Type::kMouseCancel, x, y));
    }
  } else if (button == 0) {
    events.push_back(MouseEvent(ScanEvent::Type::kMouseRelease, x, y));
  }
}

// Some terminals paste a dropped path with spaces on its own line and no
// escaping, so a whole line is tried as one path before it is split into words.
void ScanPasteBody(std::string_view body, std::vector<ScanEvent>& events) {
  absl::flat_hash_set<std::string> seen;
  for (std::string_view line : absl::StrSplit(body, absl::ByAnyChar("\r\n"), absl::SkipWhitespace())) {
    std::string_view trimmed = StripMatchingQuotes(absl::StripAsciiWhitespace(line));
    if (HasExplicitPathPrefix(trimmed) && seen.insert(std::string(trimmed)).second) {
      events.push_back(PathEvent(std::string(trimmed)));
    }
    std::vector<ScanEvent> words;
    ScanTextForPaths(line, words);
    for (ScanEvent& event : words) {
      if (seen.insert(event.path).second) events.push_back(std::move(event));
    }
  }
}

}  // namespace

std::string_view ScanEventTypeName(ScanEvent::Type type) {
  switch (type) {
    case ScanEvent::Type::kMousePress:
      return "mouse-press";
    case ScanEvent::Type::kMouseDrag:
      return "mouse-drag";
    case ScanEvent::Type::kMouseRelease:
      return "mouse-release";
    case ScanEvent::Type::kMouseCancel:
      return "mouse-cancel";
    case ScanEvent::Type::kInlineFile:
      return "inline-file";
    case ScanEvent::Type::kPath:
      return "path";
    case ScanEvent::Type::kError:
      return "error";
  }
  return "unknown";
}

std::string MouseTrackingSequence(bool enable) {
  const char mode = enable ? 'h' : 'l';
  return absl::StrCat("\x1b[?1000", std::string(1, mode), "\x1b[?1003", std::string(1, mode), "\x1b[?1006",
                      std::string(1, mode), "\x1b[?2004", std::string(1, mode));
}

void ScanTextForPaths(std::string_view text, std::vector<ScanEvent>& events) {
  // Stray control bytes (Ctrl-C, backspace) would otherwise glue onto words.
  std::string cleaned(text);
  for (char& c : cleaned) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x20 && !absl::ascii_isspace(u)) c = ' ';
  }

  absl::flat_hash_set<std::string> seen;
  for (std::string& path : ExtractFileUris(cleaned)) {
    if (seen.insert(path).second) events.push_back(PathEvent(std::move(path)));
  }
  for (std::string& path : ExtractBarePaths(cleaned)) {
    if (seen.insert(path).second) events.push_back(PathEvent(std::move(path)));
  }
}

std::vector<ScanEvent> TerminalInputScanner::Feed(std::string_view chunk) {
  std::string buf = std::move(pending_);
  pending_.clear();
  buf.append(chunk.data(), chunk.size());

  std::vector<ScanEvent> events;
  size_t pos = 0;
  size_t text_start = 0;
  while (pos < buf.size()) {
    if (buf[pos] != kEsc) {
      ++pos;
      continue;
    }
    ScanTextForPaths(std::string_view(buf).substr(text_start, pos - text_start), events);
    const size_t escape_start = pos;
    if (ParseEscape(buf, pos, events) == Parse::kIncomplete) {
      if (buf.size() - escape_start > kMaxPendingBytes) {
        events.push_back(ErrorEvent(absl::StrCat("Dropped an unterminated escape sequence of ",
                                                 buf.size() - escape_start, " bytes")));
      } else {
        pending_ = buf.substr(escape_start);
      }
      return events;
    }
    text_start = pos;
  }

  std::string_view tail = std::string_view(buf).substr(text_start);
  // A trailing backslash escapes whatever comes in the next chunk.
  if (!tail.empty() && tail.back() == '\\' && tail.size() <= kMaxPendingBytes) {
    pending_ = std::string(tail);
  } else {
    ScanTextForPaths(tail, events);
  }
  return events;
}

std::vector<ScanEvent> TerminalInputScanner::Flush() {
  std::string buf = std::move(pending_);
  pending_.clear();

  std::vector<ScanEvent> events;
  std::string_view view = buf;
  if (absl::ConsumePrefix(&view, kPasteStart)) {
    ScanPasteBody(view, events);
  } else if (!view.empty() && view.front() != kEsc) {
    ScanTextForPaths(view, events);
  }
  return events;
}

TerminalInputScanner::Parse TerminalInputScanner::ParseEscape(std::string_view buf, size_t& pos,
                                                              std::vector<ScanEvent>& events) {
  if (pos + 1 >= buf.size()) return Parse::kIncomplete;
  const char next = buf[pos + 1];

  if (next == ']') return ParseOsc(buf, pos, events);

  if (next == 'O') {
    // SS3 function keys: ESC O <final>
    if (pos + 2 >= buf.size()) return Parse::kIncomplete;
    pos += 3;
    return Parse::kDone;
  }

  if (next != '[') {
    // Alt-modified key or lone escape.
    pos += 2;
    return Parse::kDone;
  }

  if (pos + 2 >= buf.size()) return Parse::kIncomplete;
  if (buf[pos + 2] == '<') return ParseSgrMouse(buf, pos, events);
  if (buf[pos + 2] == 'M') return ParseX10Mouse(buf, pos, events);

  // Generic CSI: parameter and intermediate bytes, then one final byte.
  size_t j = pos + 2;
  while (j < buf.size() && buf[j] >= 0x20 && buf[j] <= 0x3f) ++j;
  if (j >= buf.size()) return Parse::kIncomplete;
  if (buf[j] < 0x40 || buf[j] > 0x7e) {
    pos += 2;
    return Parse::kDone;
  }
  if (buf.substr(pos, j + 1 - pos) == kPasteStart) {
    return ParseBracketedPaste(buf, pos, events);
  }
  pos = j + 1;
  return Parse::kDone;
}

TerminalInputScanner::Parse TerminalInputScanner::ParseSgrMouse(std::string_view buf, size_t& pos,
                                                                std::vector<ScanEvent>& events) {
  size_t j = pos + 3;
  while (j < buf.size() && (absl::ascii_isdigit(static_cast<unsigned char>(buf[j])) || buf[j] == ';')) {
    if (j - pos > kMaxSgrLength) break;
    ++j;
  }
  if (j >= buf.size()) return Parse::kIncomplete;

  const char final_byte = buf[j];
  std::vector<std::string_view> fields = absl::StrSplit(buf.substr(pos + 3, j - pos - 3), ';');
  int b = 0, x = 0, y = 0;
  if ((final_byte != 'M' && final_byte != 'm') || fields.size() != 3 || !absl::SimpleAtoi(fields[0], &b) ||
      !absl::SimpleAtoi(fields[1], &x) || !absl::SimpleAtoi(fields[2], &y)) {
    pos += 3;
    return Parse::kDone;
  }
  EmitMouse(b, x, y, final_byte == 'M', events);
  pos = j + 1;
  return Parse::kDone;
}

TerminalInputScanner::Parse TerminalInputScanner::ParseX10Mouse(std::string_view buf, size_t& pos,
                                                                std::vector<ScanEvent>& events) {
  if (buf.size() < pos + 6) return Parse::kIncomplete;
  const int b = static_cast<unsigned char>(buf[pos + 3]) - 32;
  const int x = static_cast<unsigned char>(buf[pos + 4]) - 32;
  const int y = static_cast<unsigned char>(buf[pos + 5]) - 32;
  pos += 6;
  if (b < 0) return Parse::kDone;

  // X10 reports every release as button 3 without saying which button.
  if ((b & 3) == 3 && !(b & 32) && !(b & 64)) {
    events.push_back(MouseEvent(ScanEvent::Type::kMouseRelease, x, y));
  } else {
    EmitMouse(b, x, y, true, events);
  }
  return Parse::kDone;
}

TerminalInputScanner::Parse TerminalInputScanner::ParseBracketedPaste(std::string_view buf, size_t& pos,
                                                                      std::vector<ScanEvent>& events) {
  const size_t body_start = pos + kPasteStart.size();
  const size_t end = buf.find(kPasteEnd, body_start);
  if (end == std::string_view::npos) return Parse::kIncomplete;
  ScanPasteBody(buf.substr(body_start, end - body_start), events);
  pos = end + kPasteEnd.size();
  return Parse::kDone;
}

TerminalInputScanner::Parse TerminalInputScanner::ParseOsc(std::string_view buf, size_t& pos,
                                                           std::vector<ScanEvent>& events) {
  const size_t body_start = pos + 2;
  size_t j = body_start;
  size_t terminator_len = 0;
  for (; j < buf.size(); ++j) {
    if (buf[j] == kBel) {
      terminator_len = 1;
      break;
    }
    if (buf[j] == kEsc) {
      if (j + 1 >= buf.size()) return Parse::kIncomplete;
      if (buf[j + 1] == '\\') {
        terminator_len = 2;
        break;
      }
      // Interrupted by another escape sequence; drop what came before it.
      pos = j;
      return Parse::kDone;
    }
  }
  if (terminator_len == 0) return Parse::kIncomplete;

  std::string_view body = buf.substr(body_start, j - body_start);
  pos = j + terminator_len;
  if (!absl::ConsumePrefix(&body, kInlineFilePrefix)) return Parse::kDone;

  size_t colon = body.find(':');
  if (colon == std::string_view::npos) {
    events.push_back(ErrorEvent("Inline file transfer carried no payload"));
    return Parse::kDone;
  }

  std::string filename = "inline-file";
  for (std::string_view arg : absl::StrSplit(body.substr(0, colon), ';', absl::SkipEmpty())) {
    std::pair<std::string_view, std::string_view> kv = absl::StrSplit(arg, absl::MaxSplits('=', 1));
    if (kv.first != "name") continue;
    std::string decoded;
    if (absl::Base64Unescape(kv.second, &decoded) && !decoded.empty()) {
      filename = decoded;
    } else if (!kv.second.empty()) {
      filename = std::string(kv.second);
    }
  }

  ScanEvent event{ScanEvent::Type::kInlineFile};
  if (!absl::Base64Unescape(body.substr(colon + 1), &event.payload)) {
    events.push_back(ErrorEvent(absl::StrCat("Could not decode inline file payload for ", filename)));
    return Parse::kDone;
  }
  event.filename = std::move(filename);
  events.push_back(std::move(event));
  return Parse::kDone;
}

}  // namespace dropin
