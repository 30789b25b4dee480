// tests/test_key_decoder.cpp
// @brief Raw terminal bytes to key codes.
// @invariant Escape sequence tails never surface as plain keys.

#include "input_reader.h"

#include <cassert>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <unistd.h>
#include <vector>

static std::vector<int> decode(KeyDecoder& d, const char* s)
{
    return d.feed(s, std::strlen(s));
}

static void plain_bytes()
{
    KeyDecoder d;
    auto keys = decode(d, "qcx");
    assert(keys.size() == 3);
    assert(keys[0] == 'q' && keys[1] == 'c' && keys[2] == 'x');
}

static void arrows_and_function_keys()
{
    KeyDecoder d;
    auto keys = decode(d, "\x1b[A\x1b[D\x1bOP\x1b[3~\x1b[6~");
    assert(keys.size() == 5);
    assert(keys[0] == SK_UP);
    assert(keys[1] == SK_LEFT);
    assert(keys[2] == SK_F1);
    assert(keys[3] == SK_DELETE);
    assert(keys[4] == SK_PAGE_DOWN);
}

static void modified_arrow_is_one_key()
{
    // shift+right: ESC [ 1 ; 2 C
    KeyDecoder d;
    auto keys = decode(d, "\x1b[1;2Cq");
    assert(keys.size() == 2);
    assert(keys[0] == SK_RIGHT);
    assert(keys[1] == 'q');
}

static void sequence_split_across_reads()
{
    KeyDecoder d;
    auto first = decode(d, "c\x1b[");
    assert(first.size() == 1 && first[0] == 'c');
    auto second = decode(d, "1");
    assert(second.empty());
    auto third = decode(d, "5~");
    assert(third.size() == 1 && third[0] == SK_PAGE_UP);
}

static void lone_escape()
{
    KeyDecoder d;
    auto keys = decode(d, "\x1b");
    assert(keys.size() == 1 && keys[0] == KEY_ESCAPE);

    keys = decode(d, "\x1bq");
    assert(keys.size() == 2 && keys[0] == KEY_ESCAPE && keys[1] == 'q');
}

static void unknown_sequence()
{
    KeyDecoder d;
    auto keys = decode(d, "\x1b[99~\x1b[Z");
    assert(keys.size() == 2);
    assert(keys[0] == SK_UNKNOWN && keys[1] == SK_UNKNOWN);
}

static void describe()
{
    assert(describeKey('q') == "q");
    assert(describeKey(SK_UP) == "<up>");
    assert(describeKey(KEY_ESCAPE) == "<esc>");
    assert(describeKey(' ') == "0x20");
    assert(describeKey(',') == ",");
}

static void reader_forwards_keys_then_stops_at_eof()
{
    int fds[2];
    int rc = pipe(fds);
    assert(rc == 0);
    const char input[] = "c\x1b[Aq";
    ssize_t written = write(fds[1], input, sizeof(input) - 1);
    assert(written == (ssize_t)(sizeof(input) - 1));
    close(fds[1]);

    auto ch = std::make_shared<EventChannel>();
    auto log = std::make_shared<EventLog>("");
    runInputReader(EventSender(ch), log, fds[0]);
    close(fds[0]);

    std::vector<int> keys;
    Event ev;
    while (ch->tryReceive(ev)) {
        assert(ev.kind == Event::KeyPress);
        keys.push_back(ev.key);
    }
    assert(keys.size() == 3);
    assert(keys[0] == 'c' && keys[1] == SK_UP && keys[2] == 'q');
    assert(log->rows() == 1);  // producer_stopped
}

static void reader_stops_on_bad_descriptor()
{
    auto ch = std::make_shared<EventChannel>();
    auto log = std::make_shared<EventLog>("");
    runInputReader(EventSender(ch), log, -1);
    assert(ch->pending() == 0);
    assert(log->rows() == 1);
}

int main()
{
    plain_bytes();
    arrows_and_function_keys();
    modified_arrow_is_one_key();
    sequence_split_across_reads();
    lone_escape();
    unknown_sequence();
    describe();
    reader_forwards_keys_then_stops_at_eof();
    reader_stops_on_bad_descriptor();
    return 0;
}
