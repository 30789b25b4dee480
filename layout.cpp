#include "layout.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

using namespace std;

GaugeLayout computeLayout(int rows, int cols) {
    GaugeLayout l;
    rows = max(rows, 0);
    cols = max(cols, 0);

    l.titleRow    = 0;
    l.titleHeight = rows * TITLE_PERCENT / 100;
    l.top         = l.titleHeight;
    l.left        = 0;
    l.width       = cols;
    l.height      = min(GAUGE_HEIGHT, rows - l.top);
    l.innerWidth  = max(cols - 2, 0);
    l.fits        = l.height == GAUGE_HEIGHT && l.innerWidth > 0;
    return l;
}

int filledCells(int innerWidth, double ratio) {
    if (innerWidth <= 0) return 0;
    ratio = max(0.0, min(1.0, ratio));
    return (int)floor(innerWidth * ratio);
}

string progressLabel(double progress) {
    char buf[32];
    snprintf(buf, sizeof(buf), "Process 1: %.0f%%", progress * 100.0);
    return string(buf);
}

vector<CaptionSpan> captionSpans(const Config& config) {
    string toggle = "<" + string(1, (char)toupper((unsigned char)config.toggleKey)) + ">";
    string quit   = "<" + string(1, config.quitKey) + ">";
    return {
        {"Change color",  false},
        {toggle,          true},
        {" Quit ",        false},
        {quit,            true},
    };
}

int captionLength(const vector<CaptionSpan>& spans) {
    int len = 0;
    for (auto& s : spans) len += (int)s.text.size();
    return len;
}

int centeredColumn(int left, int width, int len) {
    if (len >= width) return left;
    return left + (width - len) / 2;
}
