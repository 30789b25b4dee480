#pragma once

#include <memory>
#include <string>
#include <vector>

#include "event_channel.h"
#include "event_log.h"

// Codes for multi-byte keys. Plain bytes decode to themselves.
enum SpecialKey {
    SK_BASE = 0x1000,
    SK_UP,
    SK_DOWN,
    SK_RIGHT,
    SK_LEFT,
    SK_HOME,
    SK_END,
    SK_INSERT,
    SK_DELETE,
    SK_PAGE_UP,
    SK_PAGE_DOWN,
    SK_F1,
    SK_F2,
    SK_F3,
    SK_F4,
    SK_UNKNOWN
};

const int KEY_ESCAPE = 0x1b;

// Turns raw terminal bytes into key presses. CSI and SS3 sequences collapse
// to one SpecialKey; a sequence split across reads is carried over.
class KeyDecoder {
public:
    std::vector<int> feed(const char* data, size_t len);

private:
    enum State { Ground, Escape, Csi, Ss3 };

    int csiKey(char final) const;
    int ss3Key(char final) const;

    State       state_ = Ground;
    std::string params_;
};

std::string describeKey(int code);

// Thread body: blocks on fd, forwards every key press. Returns on EOF or a
// read error other than EINTR.
void runInputReader(EventSender sender, std::shared_ptr<EventLog> log, int fd = 0);
