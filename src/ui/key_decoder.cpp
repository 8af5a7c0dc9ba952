#include "ui/key_decoder.hpp"

namespace ddi {

namespace {

constexpr char kEsc = '\x1B';

// Maps the final part of a CSI sequence (after "ESC [").
KeyEvent DecodeCsi(std::string_view params, char final_byte) {
    switch (final_byte) {
    case 'A': return KeyEvent::ScrollUp;
    case 'B': return KeyEvent::ScrollDown;
    case 'H': return KeyEvent::Home;
    case 'F': return KeyEvent::End;
    case '~':
        if (params == "5") return KeyEvent::PageUp;
        if (params == "6") return KeyEvent::PageDown;
        if (params == "1" || params == "7") return KeyEvent::Home;
        if (params == "4" || params == "8") return KeyEvent::End;
        return KeyEvent::Other;
    default:
        return KeyEvent::Other;
    }
}

KeyEvent DecodePlain(char c) {
    switch (c) {
    case 'v': case 'V': return KeyEvent::ToggleView;
    case 'q': case 'Q': return KeyEvent::Cancel;
    case 'k': return KeyEvent::ScrollUp;
    case 'j': return KeyEvent::ScrollDown;
    default: return KeyEvent::Other;
    }
}

} // namespace

std::vector<KeyEvent> KeyDecoder::Feed(std::string_view input) {
    pending_.append(input);
    const std::string_view buf(pending_);

    std::vector<KeyEvent> out;
    std::size_t i = 0;
    while (i < buf.size()) {
        if (buf[i] != kEsc) {
            out.push_back(DecodePlain(buf[i]));
            ++i;
            continue;
        }

        // ESC at the end: maybe the start of a sequence still in flight.
        if (i + 1 >= buf.size())
            break;

        const char intro = buf[i + 1];
        if (intro == kEsc) {
            out.push_back(KeyEvent::Cancel);
            ++i;
            continue;
        }
        if (intro != '[' && intro != 'O') {
            // Alt+key: report the key itself as unhandled.
            out.push_back(KeyEvent::Other);
            i += 2;
            continue;
        }

        std::size_t j = i + 2;
        while (j < buf.size() && ((buf[j] >= '0' && buf[j] <= '9') || buf[j] == ';'))
            ++j;
        if (j >= buf.size())
            break;
        out.push_back(DecodeCsi(buf.substr(i + 2, j - (i + 2)), buf[j]));
        i = j + 1;
    }
    pending_.erase(0, i);
    return out;
}

std::vector<KeyEvent> KeyDecoder::Flush() {
    std::vector<KeyEvent> out;
    if (pending_ == std::string_view(&kEsc, 1))
        out.push_back(KeyEvent::Cancel);
    else if (!pending_.empty())
        out.push_back(KeyEvent::Other);
    pending_.clear();
    return out;
}

std::vector<KeyEvent> DecodeKeys(std::string_view input) {
    KeyDecoder d;
    auto out = d.Feed(input);
    for (KeyEvent k : d.Flush())
        out.push_back(k);
    return out;
}

} // namespace ddi
