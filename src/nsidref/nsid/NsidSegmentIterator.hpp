#pragma once
#include <cstddef>
#include <iterator>
#include <string_view>

namespace NR {

// Walks the '.' separated segments of an identifier in either direction.
// Segments are sliced out of the viewed text on demand, nothing is stored.
struct NsidSegmentIterator {
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::string_view*;
    using reference         = std::string_view;

    NsidSegmentIterator() = default;
    NsidSegmentIterator(std::string_view text, std::size_t start);

    auto operator++() -> NsidSegmentIterator&;
    auto operator++(int) -> NsidSegmentIterator;
    auto operator--() -> NsidSegmentIterator&;
    auto operator--(int) -> NsidSegmentIterator;
    auto operator==(NsidSegmentIterator const& other) const -> bool;
    auto operator*() const -> std::string_view;

private:
    auto segmentEnd() const -> std::size_t;

    std::string_view text;
    std::size_t      start = 0; // text.size() + 1 once past the final segment
};

struct NsidSegmentRange {
    using iterator         = NsidSegmentIterator;
    using reverse_iterator = std::reverse_iterator<NsidSegmentIterator>;

    explicit NsidSegmentRange(std::string_view text);

    auto begin() const -> iterator;
    auto end() const -> iterator;
    auto rbegin() const -> reverse_iterator;
    auto rend() const -> reverse_iterator;

    auto front() const -> std::string_view;
    auto back() const -> std::string_view;
    auto size() const -> std::size_t;

private:
    std::string_view text;
};

} // namespace NR
