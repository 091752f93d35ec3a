#include "markup.hpp"

const char *alignment_name(Alignment alignment) {
    switch (alignment) {
        case Alignment::LEFT: return "left";
        case Alignment::CENTER: return "center";
        case Alignment::RIGHT: return "right";
    }

    return "unknown";
}

std::vector<std::string> &AlignedSegments::operator[](Alignment alignment) {
    switch (alignment) {
        case Alignment::CENTER: return center;
        case Alignment::RIGHT: return right;
        case Alignment::LEFT: break;
    }

    return left;
}

const std::vector<std::string> &AlignedSegments::operator[](Alignment alignment) const {
    return const_cast<AlignedSegments &>(*this)[alignment];
}

AlignedSegments parse_markup(const std::string &line) {
    AlignedSegments segments;

    size_t start = 0;
    while (start <= line.size()) {
        size_t end = line.find('^', start);
        if (end == std::string::npos) end = line.size();

        if (end > start) {
            std::string body = line.substr(start + 1, end - start - 1);

            switch (line[start]) {
                case 'l':
                    segments.left.push_back(std::move(body));
                    break;
                case 'c':
                    segments.center.push_back(std::move(body));
                    break;
                case 'r':
                    segments.right.push_back(std::move(body));
                    break;
            }
        }

        start = end + 1;
    }

    return segments;
}
