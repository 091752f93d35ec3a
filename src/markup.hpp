#pragma once

// C++ includes
#include <string>
#include <vector>

enum class Alignment {
    LEFT,
    CENTER,
    RIGHT,
};

const char *alignment_name(Alignment alignment);

struct AlignedSegments {
    std::vector<std::string> left;
    std::vector<std::string> center;
    std::vector<std::string> right;

    std::vector<std::string> &operator[](Alignment alignment);
    const std::vector<std::string> &operator[](Alignment alignment) const;

    bool empty() const { return left.empty() && center.empty() && right.empty(); }
};

// Fields start with '^' followed by one of the tags 'l', 'c' or 'r', fields with any other tag are dropped
AlignedSegments parse_markup(const std::string &line);
