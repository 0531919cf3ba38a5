#include "NsidSegmentIterator.hpp"

#include <algorithm>

namespace NR {

NsidSegmentIterator::NsidSegmentIterator(std::string_view text, std::size_t start)
    : text(text), start(start) {
}

auto NsidSegmentIterator::segmentEnd() const -> std::size_t {
    auto dot = this->text.find('.', this->start);
    return dot == std::string_view::npos ? this->text.size() : dot;
}

auto NsidSegmentIterator::operator++() -> NsidSegmentIterator& {
    this->start = this->segmentEnd() + 1;
    return *this;
}

auto NsidSegmentIterator::operator++(int) -> NsidSegmentIterator {
    auto previous = *this;
    ++*this;
    return previous;
}

auto NsidSegmentIterator::operator--() -> NsidSegmentIterator& {
    // The separator (or the end of the text) closing the previous segment.
    std::size_t const close = this->start - 1;
    if (close == 0) {
        this->start = 0;
        return *this;
    }
    auto dot    = this->text.rfind('.', close - 1);
    this->start = dot == std::string_view::npos ? 0 : dot + 1;
    return *this;
}

auto NsidSegmentIterator::operator--(int) -> NsidSegmentIterator {
    auto previous = *this;
    --*this;
    return previous;
}

auto NsidSegmentIterator::operator==(NsidSegmentIterator const& other) const -> bool {
    return this->start == other.start && this->text.data() == other.text.data();
}

auto NsidSegmentIterator::operator*() const -> std::string_view {
    return this->text.substr(this->start, this->segmentEnd() - this->start);
}

NsidSegmentRange::NsidSegmentRange(std::string_view text) : text(text) {
}

auto NsidSegmentRange::begin() const -> iterator {
    return {this->text, 0};
}

auto NsidSegmentRange::end() const -> iterator {
    return {this->text, this->text.size() + 1};
}

auto NsidSegmentRange::rbegin() const -> reverse_iterator {
    return reverse_iterator{this->end()};
}

auto NsidSegmentRange::rend() const -> reverse_iterator {
    return reverse_iterator{this->begin()};
}

auto NsidSegmentRange::front() const -> std::string_view {
    return *this->begin();
}

auto NsidSegmentRange::back() const -> std::string_view {
    return *this->rbegin();
}

auto NsidSegmentRange::size() const -> std::size_t {
    return static_cast<std::size_t>(std::count(this->text.begin(), this->text.end(), '.')) + 1;
}

} // namespace NR
