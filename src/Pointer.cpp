/**
 * @file Pointer.cpp
 * @brief Implementation of JSON Pointer parsing and encoding
 */

#include "jpatch/Pointer.hpp"
#include "jpatch/Errors.hpp"

#include <sstream>
#include <utility>

namespace jpatch {

std::string encode_segment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string decode_segment(const std::string& segment, const std::string& pointer) {
    if (segment.find('~') == std::string::npos) {
        return segment;
    }

    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];
        if (c != '~') {
            out += c;
            continue;
        }
        if (i + 1 >= segment.size()) {
            throw PointerSyntaxError(pointer, "trailing '~' in segment");
        }
        char next = segment[++i];
        if (next == '0') {
            out += '~';
        } else if (next == '1') {
            out += '/';
        } else {
            throw PointerSyntaxError(pointer, "invalid escape sequence '~" + std::string(1, next) + "'");
        }
    }
    return out;
}

Pointer Pointer::parse(const std::string& raw) {
    if (raw.empty()) {
        return Pointer(); // Empty pointer is the root
    }

    if (raw[0] != '/') {
        throw PointerSyntaxError(raw, "must be empty or start with '/'");
    }

    std::vector<std::string> segments;
    size_t pos = 1;
    while (true) {
        size_t next = raw.find('/', pos);
        if (next == std::string::npos) {
            segments.push_back(decode_segment(raw.substr(pos), raw));
            break;
        }
        segments.push_back(decode_segment(raw.substr(pos, next - pos), raw));
        pos = next + 1;
    }

    return Pointer(std::move(segments));
}

Pointer Pointer::parent() const {
    if (segments_.empty()) {
        return *this;
    }
    return Pointer(std::vector<std::string>(segments_.begin(), segments_.end() - 1));
}

const std::string& Pointer::last() const {
    if (segments_.empty()) {
        throw PointerSyntaxError("", "root pointer has no last segment");
    }
    return segments_.back();
}

Pointer Pointer::child(const std::string& segment) const {
    std::vector<std::string> segments = segments_;
    segments.push_back(segment);
    return Pointer(std::move(segments));
}

std::string Pointer::to_string() const {
    if (segments_.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (const auto& seg : segments_) {
        oss << '/' << encode_segment(seg);
    }
    return oss.str();
}

} // namespace jpatch
