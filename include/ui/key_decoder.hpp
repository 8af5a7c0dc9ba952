#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ddi {

enum class KeyEvent {
    ToggleView,
    Cancel,
    ScrollUp,
    ScrollDown,
    PageUp,
    PageDown,
    Home,
    End,
    Other,
};

// Decodes raw terminal input that may arrive split across reads. An escape
// sequence cut off at the end of a chunk is held until the next Feed();
// Flush() resolves it once no more input is pending (a held lone ESC is the
// Escape key).
class KeyDecoder {
  public:
    std::vector<KeyEvent> Feed(std::string_view input);
    std::vector<KeyEvent> Flush();

    bool HasPending() const { return !pending_.empty(); }

  private:
    std::string pending_;
};

// Decodes one complete chunk: Feed() followed by Flush().
std::vector<KeyEvent> DecodeKeys(std::string_view input);

} // namespace ddi
