// =============================================================================
// mas-segmenter - Array Element Writer
// =============================================================================
// Materializes located array elements as new BAM records.
//
// An element record carries:
// - name "{source}_{start}-{end}_{prevDelimiter}-{delimiter}"
// - the source sequence and qualities sliced to [start, end]
// - every aux tag of the source, with the segment tag rewritten to the
//   segments starting inside [segStart, segEnd]
// - the unmapped flag and a mapping quality of 255
// =============================================================================

#ifndef MASSEG_PIPELINE_ELEMENT_WRITER_H
#define MASSEG_PIPELINE_ELEMENT_WRITER_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "masseg/algo/delimiter_matcher.h"
#include "masseg/format/segment_tag.h"
#include "masseg/io/bam_io.h"

namespace masseg::pipeline {

/// @brief Name of an element record.
/// @param sourceName Name of the read the element came from.
/// @param span Located element.
/// @return "{source}_{start}-{end}_{prevDelimiter}-{delimiter}".
[[nodiscard]] std::string elementName(std::string_view sourceName, const algo::ElementSpan& span);

/// @brief Build the record for one element.
/// @param source Read the element was located in.
/// @param segments All segments of the source read.
/// @param span Element span, within the source sequence.
/// @param segmentsTag Aux tag receiving the element's segments.
/// @return Unmapped record holding the element's bases.
/// @throws FormatError if the span lies outside the read or the name is too long.
[[nodiscard]] io::BamRecordPtr buildElementRecord(const bam1_t* source,
                                                  std::span<const format::Segment> segments,
                                                  const algo::ElementSpan& span,
                                                  std::string_view segmentsTag);

/// @brief Writes element records to an output file.
class ArrayElementWriter {
public:
    /// @brief Construct over an open writer.
    /// @param output Destination; must outlive this object.
    /// @param segmentsTag Aux tag receiving each element's segments.
    ArrayElementWriter(io::BamWriter& output, std::string segmentsTag);

    /// @brief Build and write one element.
    /// @param source Read the element was located in.
    /// @param segments All segments of the source read.
    /// @param span Element span, within the source sequence.
    /// @throws FormatError for a span outside the read, IOError on write failure.
    void write(const bam1_t* source, std::span<const format::Segment> segments,
               const algo::ElementSpan& span);

    /// @brief Elements written so far.
    [[nodiscard]] std::uint64_t elementsWritten() const noexcept { return elementsWritten_; }

private:
    io::BamWriter& output_;
    std::string segmentsTag_;
    std::uint64_t elementsWritten_ = 0;
};

}  // namespace masseg::pipeline

#endif  // MASSEG_PIPELINE_ELEMENT_WRITER_H
