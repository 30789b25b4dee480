#include "input_reader.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

using namespace std;

int KeyDecoder::csiKey(char final) const {
    switch (final) {
        case 'A': return SK_UP;
        case 'B': return SK_DOWN;
        case 'C': return SK_RIGHT;
        case 'D': return SK_LEFT;
        case 'H': return SK_HOME;
        case 'F': return SK_END;
        case '~': break;
        default:  return SK_UNKNOWN;
    }

    int n = atoi(params_.c_str());
    switch (n) {
        case 1: case 7: return SK_HOME;
        case 2:  return SK_INSERT;
        case 3:  return SK_DELETE;
        case 4: case 8: return SK_END;
        case 5:  return SK_PAGE_UP;
        case 6:  return SK_PAGE_DOWN;
        case 11: return SK_F1;
        case 12: return SK_F2;
        case 13: return SK_F3;
        case 14: return SK_F4;
        default: return SK_UNKNOWN;
    }
}

int KeyDecoder::ss3Key(char final) const {
    switch (final) {
        case 'A': return SK_UP;
        case 'B': return SK_DOWN;
        case 'C': return SK_RIGHT;
        case 'D': return SK_LEFT;
        case 'H': return SK_HOME;
        case 'F': return SK_END;
        case 'P': return SK_F1;
        case 'Q': return SK_F2;
        case 'R': return SK_F3;
        case 'S': return SK_F4;
        default:  return SK_UNKNOWN;
    }
}

vector<int> KeyDecoder::feed(const char* data, size_t len) {
    vector<int> keys;

    for (size_t i = 0; i < len; i++) {
        unsigned char c = (unsigned char)data[i];
        switch (state_) {
            case Ground:
                if (c == KEY_ESCAPE) state_ = Escape;
                else keys.push_back(c);
                break;

            case Escape:
                if (c == '[') {
                    state_ = Csi;
                    params_.clear();
                } else if (c == 'O') {
                    state_ = Ss3;
                } else if (c == KEY_ESCAPE) {
                    keys.push_back(KEY_ESCAPE);
                } else {
                    // ESC followed by a plain byte: report both
                    keys.push_back(KEY_ESCAPE);
                    keys.push_back(c);
                    state_ = Ground;
                }
                break;

            case Csi:
                if (c >= 0x20 && c <= 0x3f) {
                    params_ += (char)c;
                } else {
                    keys.push_back(c >= 0x40 && c <= 0x7e ? csiKey((char)c) : SK_UNKNOWN);
                    state_ = Ground;
                }
                break;

            case Ss3:
                keys.push_back(ss3Key((char)c));
                state_ = Ground;
                break;
        }
    }

    // A lone ESC at the end of a read is the Escape key itself.
    if (state_ == Escape) {
        keys.push_back(KEY_ESCAPE);
        state_ = Ground;
    }
    return keys;
}

string describeKey(int code) {
    switch (code) {
        case SK_UP:        return "<up>";
        case SK_DOWN:      return "<down>";
        case SK_RIGHT:     return "<right>";
        case SK_LEFT:      return "<left>";
        case SK_HOME:      return "<home>";
        case SK_END:       return "<end>";
        case SK_INSERT:    return "<insert>";
        case SK_DELETE:    return "<delete>";
        case SK_PAGE_UP:   return "<pgup>";
        case SK_PAGE_DOWN: return "<pgdn>";
        case SK_F1:        return "<f1>";
        case SK_F2:        return "<f2>";
        case SK_F3:        return "<f3>";
        case SK_F4:        return "<f4>";
        case SK_UNKNOWN:   return "<unknown>";
        case KEY_ESCAPE:   return "<esc>";
        default: break;
    }
    if (code >= 0x21 && code < 0x7f) return string(1, (char)code);

    char buf[16];
    snprintf(buf, sizeof(buf), "0x%02x", code);
    return string(buf);
}

void runInputReader(EventSender sender, shared_ptr<EventLog> log, int fd) {
    KeyDecoder decoder;
    char buf[64];

    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            log->note("producer_stopped", string("input: ") + strerror(errno));
            return;
        }
        if (n == 0) {
            log->note("producer_stopped", "input: end of input");
            return;
        }

        for (int key : decoder.feed(buf, (size_t)n))
            sender.send(Event::keyPress(key));
    }
}
