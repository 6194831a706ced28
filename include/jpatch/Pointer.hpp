/**
 * @file Pointer.hpp
 * @brief JSON Pointer (RFC 6901) addressing
 *
 * A Pointer is an ordered list of raw (unescaped) segments. The empty list
 * denotes the document root. Escaping only happens at the text boundary:
 * - parse() decodes "~1" to "/" and "~0" to "~"
 * - to_string() encodes "~" to "~0" and "/" to "~1"
 *
 * Examples:
 * - ""          → []            (root)
 * - "/a/b"      → ["a", "b"]
 * - "/"         → [""]
 * - "/a~1b/c~0" → ["a/b", "c~"]
 */

#ifndef JPATCH_POINTER_HPP
#define JPATCH_POINTER_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jpatch {

/**
 * @brief Encode a raw segment for pointer text
 *
 * @param segment Raw segment, e.g. "a/b~c"
 * @return Escaped segment, e.g. "a~1b~0c"
 */
std::string encode_segment(const std::string& segment);

/**
 * @brief Decode one escaped segment of pointer text
 *
 * @param segment Escaped segment
 * @param pointer Full pointer text, used for the error message
 * @return Raw segment
 * @throws PointerSyntaxError on "~" not followed by "0" or "1"
 */
std::string decode_segment(const std::string& segment, const std::string& pointer);

class Pointer {
public:
    /// Root pointer
    Pointer() = default;

    explicit Pointer(std::vector<std::string> segments)
        : segments_(std::move(segments)) {}

    /**
     * @brief Parse pointer text
     *
     * @param raw "" or text starting with "/"
     * @return Parsed pointer
     * @throws PointerSyntaxError if raw is non-empty and does not start
     *         with "/", or contains an invalid escape sequence
     */
    static Pointer parse(const std::string& raw);

    const std::vector<std::string>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    bool is_root() const noexcept { return segments_.empty(); }

    /**
     * @brief Pointer to the containing value
     *
     * The parent of root is root.
     */
    Pointer parent() const;

    /**
     * @brief Final segment
     * @throws PointerSyntaxError on root
     */
    const std::string& last() const;

    /**
     * @brief Pointer with one more raw segment appended
     */
    Pointer child(const std::string& segment) const;

    /**
     * @brief Encode back to pointer text ("" for root)
     */
    std::string to_string() const;

    bool operator==(const Pointer& other) const { return segments_ == other.segments_; }
    bool operator!=(const Pointer& other) const { return segments_ != other.segments_; }

private:
    std::vector<std::string> segments_;
};

} // namespace jpatch

#endif // JPATCH_POINTER_HPP
