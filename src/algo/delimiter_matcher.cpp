// =============================================================================
// mas-segmenter - Delimiter Matcher Implementation
// =============================================================================

#include "masseg/algo/delimiter_matcher.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace masseg::algo {

namespace {

/// @brief Append a span when it is non-empty and lies fully inside the read.
///
/// A span reaching outside [0, readLength - 1] describes bases the read does
/// not have; it stays counted but is not emitted.
void emitSpan(ElementSpan span, Coordinate readLength, std::vector<ElementSpan>& out) {
    if (span.isEmpty() || span.start < 0 || span.end >= readLength) {
        return;
    }
    out.push_back(std::move(span));
}

/// @brief Per-window progress of the simple matcher.
struct WindowState {
    std::size_t counter = 0;
    const format::Segment* startSegment = nullptr;
    const format::Segment* endSegment = nullptr;
};

/// @brief A completed simple-mode window.
struct Boundary {
    std::size_t window;
    const format::Segment* startSegment;
    const format::Segment* endSegment;
};

/// @brief Per-template progress of the bounded-region matcher.
struct TemplateState {
    std::size_t counter = 0;
    std::vector<const format::Segment*> captured;
    MatchScore score = 0;
    bool complete = false;

    void reset() noexcept {
        counter = 0;
        captured.clear();
        score = 0;
    }
};

}  // namespace

// =============================================================================
// SimpleDelimiterMatcher
// =============================================================================

SimpleDelimiterMatcher::SimpleDelimiterMatcher(const model::ArrayElementStructure& structure,
                                               bool keepDelimiters)
    : SimpleDelimiterMatcher(structure.simpleDelimiters(), keepDelimiters) {}

SimpleDelimiterMatcher::SimpleDelimiterMatcher(std::vector<model::DelimiterWindow> windows,
                                               bool keepDelimiters)
    : windows_(std::move(windows)), keepDelimiters_(keepDelimiters) {
    windowNames_.reserve(windows_.size());
    for (const auto& window : windows_) {
        windowNames_.push_back(fmt::format("{}", fmt::join(window, kDelimiterLabelJoiner)));
    }
}

MatchResult SimpleDelimiterMatcher::match(std::span<const format::Segment> segments,
                                          Coordinate readLength) const {
    std::vector<WindowState> states(windows_.size());

    for (const auto& segment : segments) {
        for (std::size_t i = 0; i < windows_.size(); ++i) {
            const auto& window = windows_[i];
            auto& state = states[i];
            if (state.counter == window.size()) {
                continue;
            }

            if (segment.name == window[state.counter]) {
                if (state.counter == 0) {
                    state.startSegment = &segment;
                }
                ++state.counter;
                if (state.counter == window.size()) {
                    state.endSegment = &segment;
                }
            } else {
                state = WindowState{};
            }
        }
    }

    std::vector<Boundary> boundaries;
    for (std::size_t i = 0; i < states.size(); ++i) {
        if (states[i].endSegment != nullptr) {
            boundaries.push_back({i, states[i].startSegment, states[i].endSegment});
        }
    }
    std::stable_sort(boundaries.begin(), boundaries.end(),
                     [](const Boundary& a, const Boundary& b) {
                         return a.startSegment->start < b.startSegment->start;
                     });

    MatchResult result;
    result.count = boundaries.size();

    Coordinate cursor = 0;
    std::string prevDelimiter(kStartDelimiterName);
    for (const auto& boundary : boundaries) {
        ElementSpan span;
        span.segStart = cursor;
        span.segEnd = boundary.endSegment->end;
        span.start = cursor;
        span.end = keepDelimiters_ ? span.segEnd : boundary.startSegment->start - 1;
        span.prevDelimiter = prevDelimiter;
        span.delimiter = windowNames_[boundary.window];

        cursor = keepDelimiters_ ? boundary.startSegment->start : boundary.endSegment->end + 1;
        prevDelimiter = span.delimiter;
        emitSpan(std::move(span), readLength, result.elements);
    }

    ElementSpan remainder;
    remainder.start = remainder.segStart = cursor;
    remainder.end = remainder.segEnd = readLength - 1;
    remainder.prevDelimiter = std::move(prevDelimiter);
    remainder.delimiter = std::string(kEndDelimiterName);
    emitSpan(std::move(remainder), readLength, result.elements);

    return result;
}

// =============================================================================
// BoundedRegionMatcher
// =============================================================================

BoundedRegionMatcher::BoundedRegionMatcher(model::ArrayElementStructure structure,
                                           bool keepDelimiters)
    : structure_(std::move(structure)), keepDelimiters_(keepDelimiters) {}

MatchResult BoundedRegionMatcher::match(std::span<const format::Segment> segments,
                                        Coordinate readLength) const {
    const auto& templates = structure_.elements();
    std::vector<TemplateState> states(templates.size());

    for (const auto& segment : segments) {
        for (std::size_t i = 0; i < templates.size(); ++i) {
            const auto& labels = templates[i];
            auto& state = states[i];
            if (state.complete) {
                continue;
            }

            if (segment.name == labels[state.counter]) {
                ++state.counter;
                state.captured.push_back(&segment);
                state.score += kExactMatchScore;
            } else {
                bool resynced = false;
                if (state.counter != 0) {
                    // Skip over labels the annotation missed.
                    for (std::size_t offset = 1; offset < labels.size() - state.counter; ++offset) {
                        if (segment.name == labels[state.counter + offset]) {
                            state.counter += 1 + offset;
                            state.captured.push_back(&segment);
                            state.score += kIndelMatchScore;
                            resynced = true;
                            break;
                        }
                    }
                }
                if (!resynced) {
                    state.reset();
                }
            }

            if (state.counter == labels.size()) {
                state.complete = true;
            }
        }
    }

    MatchResult result;
    for (const auto& state : states) {
        if (!state.complete) {
            continue;
        }
        ++result.count;

        const auto& captured = state.captured;
        const auto* first = captured.front();
        const auto* last = captured.back();

        ElementSpan span;
        span.segStart = first->start;
        span.segEnd = last->end;
        span.prevDelimiter = first->name;
        span.delimiter = last->name;
        span.score = state.score;
        if (keepDelimiters_) {
            span.start = first->start;
            span.end = last->end;
        } else if (captured.size() >= 3) {
            span.start = captured[1]->start;
            span.end = captured[captured.size() - 2]->end;
        } else {
            // Nothing left once both delimiters are dropped.
            continue;
        }
        emitSpan(std::move(span), readLength, result.elements);
    }

    std::stable_sort(result.elements.begin(), result.elements.end(),
                     [](const ElementSpan& a, const ElementSpan& b) {
                         return a.segStart < b.segStart;
                     });
    return result;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<IDelimiterMatcher> createDelimiterMatcher(
    SplitMode mode, const model::ArrayElementStructure& structure, bool keepDelimiters) {
    switch (mode) {
        case SplitMode::kSimple:
            return std::make_unique<SimpleDelimiterMatcher>(structure, keepDelimiters);
        case SplitMode::kBounded:
            return std::make_unique<BoundedRegionMatcher>(structure, keepDelimiters);
    }
    return std::make_unique<BoundedRegionMatcher>(structure, keepDelimiters);
}

}  // namespace masseg::algo
