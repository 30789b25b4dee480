#pragma once

#include <string>
#include <vector>

#include "config.h"

const char* const TITLE_TEXT    = "Process Overview";
const char* const PANEL_TITLE   = "Background Processes";
const int         TITLE_PERCENT = 20;
const int         GAUGE_HEIGHT  = 3;

// Screen geometry for the title line and the bordered gauge panel.
struct GaugeLayout {
    int  titleRow;
    int  titleHeight;
    int  top;
    int  left;
    int  width;
    int  height;
    int  innerWidth;
    bool fits;  // false when the panel has no room for its inner bar
};

GaugeLayout computeLayout(int rows, int cols);

// Cells of the bar to fill for ratio in [0, 1].
int filledCells(int innerWidth, double ratio);

// "Process 1: NN%"
std::string progressLabel(double progress);

struct CaptionSpan {
    std::string text;
    bool        highlight;
};

std::vector<CaptionSpan> captionSpans(const Config& config);
int captionLength(const std::vector<CaptionSpan>& spans);

// Column at which text of length len is centered in [left, left + width).
int centeredColumn(int left, int width, int len);
