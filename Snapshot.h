#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include <string>
#include <vector>

// One displayable fact. Pixel width is derived per frame, never stored here.
struct MetricLine {
    std::string text;

    bool operator==(const MetricLine& other) const { return text == other.text; }
    bool operator!=(const MetricLine& other) const { return !(*this == other); }
};

// One complete sampling pass, lines in vertical draw order.
struct Snapshot {
    std::vector<MetricLine> lines;

    bool empty() const { return lines.empty(); }
    bool operator==(const Snapshot& other) const { return lines == other.lines; }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

#endif // SNAPSHOT_H
