#include "ncurses_screen.h"
#include "layout.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>
#include <ncurses.h>

using namespace std;

#define COL_TITLE          1
#define COL_BORDER         2
#define COL_KEYHINT        3
#define COL_NOTICE         4
#define COL_PRIMARY_BAR    5
#define COL_PRIMARY_TEXT   6
#define COL_SECONDARY_BAR  7
#define COL_SECONDARY_TEXT 8

static void initColors() {
    if (!has_colors()) return;
    start_color();
    init_pair(COL_TITLE,          COLOR_WHITE,  COLOR_BLACK);
    init_pair(COL_BORDER,         COLOR_WHITE,  COLOR_BLACK);
    init_pair(COL_KEYHINT,        COLOR_BLUE,   COLOR_BLACK);
    init_pair(COL_NOTICE,         COLOR_RED,    COLOR_BLACK);
    init_pair(COL_PRIMARY_BAR,    COLOR_BLACK,  COLOR_GREEN);
    init_pair(COL_PRIMARY_TEXT,   COLOR_GREEN,  COLOR_BLACK);
    init_pair(COL_SECONDARY_BAR,  COLOR_BLACK,  COLOR_YELLOW);
    init_pair(COL_SECONDARY_TEXT, COLOR_YELLOW, COLOR_BLACK);
}

TerminalSession::TerminalSession(FILE* out, FILE* in) {
    screen_ = newterm(nullptr, out, in);
    if (!screen_) throw runtime_error("cannot initialise terminal");
    initColors();
    raw();
    noecho();
    curs_set(0);
}

TerminalSession::~TerminalSession() {
    endwin();
    delscreen(screen_);
}

static void printAt(int row, int col, int colorPair, const string& s, bool bold = false) {
    if (bold) attron(A_BOLD);
    attron(COLOR_PAIR(colorPair));
    mvprintw(row, col, "%s", s.c_str());
    attroff(COLOR_PAIR(colorPair));
    if (bold) attroff(A_BOLD);
}

NcursesScreen::NcursesScreen(const Config& config) : config_(config) {}

// Nothing calls getch(), so pick up SIGWINCH size changes here.
void NcursesScreen::syncSize() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0) return;
    if (is_term_resized(ws.ws_row, ws.ws_col)) resizeterm(ws.ws_row, ws.ws_col);
}

void NcursesScreen::drawGauge(const AppState& state, int rows, int cols) {
    GaugeLayout l = computeLayout(rows, cols);
    if (!l.fits) return;

    int bottom = l.top + l.height - 1;
    int right  = l.left + l.width - 1;

    attron(COLOR_PAIR(COL_BORDER) | A_BOLD);
    mvaddch(l.top, l.left, ACS_ULCORNER);
    mvhline(l.top, l.left + 1, ACS_HLINE, l.innerWidth);
    mvaddch(l.top, right, ACS_URCORNER);
    for (int r = l.top + 1; r < bottom; r++) {
        mvaddch(r, l.left, ACS_VLINE);
        mvaddch(r, right, ACS_VLINE);
    }
    mvaddch(bottom, l.left, ACS_LLCORNER);
    mvhline(bottom, l.left + 1, ACS_HLINE, l.innerWidth);
    mvaddch(bottom, right, ACS_LRCORNER);
    attroff(COLOR_PAIR(COL_BORDER) | A_BOLD);

    string panelTitle(PANEL_TITLE);
    if ((int)panelTitle.size() > l.innerWidth) panelTitle.resize(l.innerWidth);
    printAt(l.top, l.left + 1, COL_BORDER, panelTitle);

    // bar, with the label drawn over it in the inverse colors
    bool primary  = state.gaugeColor == GaugeColor::Primary;
    int  barPair  = primary ? COL_PRIMARY_BAR  : COL_SECONDARY_BAR;
    int  textPair = primary ? COL_PRIMARY_TEXT : COL_SECONDARY_TEXT;

    string label    = progressLabel(state.progress);
    int    filled   = filledCells(l.innerWidth, state.progress);
    int    barRow   = l.top + 1;
    int    barLeft  = l.left + 1;
    int    labelCol = centeredColumn(0, l.innerWidth, (int)label.size());

    for (int i = 0; i < l.innerWidth; i++) {
        int  li = i - labelCol;
        char ch = (li >= 0 && li < (int)label.size()) ? label[li] : ' ';
        chtype attr = COLOR_PAIR(i < filled ? barPair : textPair);
        mvaddch(barRow, barLeft + i, (chtype)(unsigned char)ch | attr);
    }

    auto spans = captionSpans(config_);
    int  col   = centeredColumn(l.left + 1, l.innerWidth, captionLength(spans));
    for (auto& s : spans) {
        string text = s.text;
        int room = right - col;
        if (room <= 0) break;
        if ((int)text.size() > room) text.resize(room);
        if (s.highlight) printAt(bottom, col, COL_KEYHINT, text, true);
        else             printAt(bottom, col, COL_BORDER, text);
        col += (int)text.size();
    }
}

void NcursesScreen::draw(const AppState& state) {
    syncSize();
    erase();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);

    // the title gets no row when the screen is too short for one
    if (computeLayout(rows, cols).titleHeight > 0)
        printAt(0, 0, COL_TITLE, string(TITLE_TEXT).substr(0, max(cols, 0)));
    drawGauge(state, rows, cols);

    if (refresh() == ERR) throw runtime_error("terminal refresh failed");
}

void NcursesScreen::notice(const string& message) {
    lastNotice_ = message;

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows <= 0 || cols <= 0) return;
    printAt(rows - 1, 0, COL_NOTICE, message.substr(0, cols), true);
    refresh();
}
