#ifndef DROPIN_TERMINAL_INPUT_SCANNER_H_
#define DROPIN_TERMINAL_INPUT_SCANNER_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dropin {

struct ScanEvent {
  enum class Type {
    kMousePress,    // left button down
    kMouseDrag,     // motion with the left button held
    kMouseRelease,  // left button up
    kMouseCancel,   // another button pressed
    kInlineFile,    // OSC 1337 File= transfer; payload holds the decoded bytes
    kPath,          // path taken from a file:// URI, bracketed paste or bare text
    kError,         // malformed input worth reporting
  };

  Type type;
  int x = 0;
  int y = 0;
  std::string path;
  std::string filename;
  std::string payload;
  std::string message;
};

std::string_view ScanEventTypeName(ScanEvent::Type type);

// Escape sequences that turn mouse reporting (any-event + SGR) and bracketed
// paste on or off. Written to the terminal by the front end.
std::string MouseTrackingSequence(bool enable);

/**
 * @brief Incremental parser for raw terminal input.
 *
 * Recognizes SGR (`ESC[<b;x;yM`) and X10 (`ESC[M` + 3 bytes) mouse reports,
 * iTerm2 inline file transfers (`ESC]1337;File=...:<base64>` ended by BEL or
 * ST), bracketed paste (`ESC[200~ ... ESC[201~`), `file://` URIs and bare
 * paths. Other escape sequences are skipped. Input may be split anywhere; an
 * unfinished sequence at the end of a chunk is held until the next Feed().
 *
 * Not thread-safe; one scanner per input stream.
 */
class TerminalInputScanner {
 public:
  // Caps the bytes held for one unfinished paste or OSC transfer.
  static constexpr size_t kMaxPendingBytes = 64 * 1024 * 1024;

  TerminalInputScanner() = default;

  std::vector<ScanEvent> Feed(std::string_view chunk);

  // Treats whatever is held as complete input and scans it as text.
  std::vector<ScanEvent> Flush();

  size_t pending_bytes() const { return pending_.size(); }

 private:
  enum class Parse { kDone, kIncomplete };

  Parse ParseEscape(std::string_view buf, size_t& pos, std::vector<ScanEvent>& events);
  Parse ParseSgrMouse(std::string_view buf, size_t& pos, std::vector<ScanEvent>& events);
  Parse ParseX10Mouse(std::string_view buf, size_t& pos, std::vector<ScanEvent>& events);
  Parse ParseBracketedPaste(std::string_view buf, size_t& pos, std::vector<ScanEvent>& events);
  Parse ParseOsc(std::string_view buf, size_t& pos, std::vector<ScanEvent>& events);

  std::string pending_;
};

// Emits kPath events for file:// URIs and explicit paths found in plain text.
void ScanTextForPaths(std::string_view text, std::vector<ScanEvent>& events);

}  // namespace dropin

#endif  // DROPIN_TERMINAL_INPUT_SCANNER_H_
