// =============================================================================
// mas-segmenter - Array Element Writer Implementation
// =============================================================================

#include "masseg/pipeline/element_writer.h"

#include <cstring>
#include <utility>

#include <fmt/format.h>

#include "masseg/common/types.h"

namespace masseg::pipeline {

std::string elementName(std::string_view sourceName, const algo::ElementSpan& span) {
    return fmt::format("{}_{}-{}_{}-{}", sourceName, span.start, span.end, span.prevDelimiter,
                       span.delimiter);
}

io::BamRecordPtr buildElementRecord(const bam1_t* source,
                                    std::span<const format::Segment> segments,
                                    const algo::ElementSpan& span,
                                    std::string_view segmentsTag) {
    const Coordinate readLength = source->core.l_qseq;
    if (span.isEmpty() || span.start < 0 || span.end >= readLength) {
        throw FormatError(fmt::format("element span {}-{} outside read {} of length {}",
                                      span.start, span.end, io::recordName(source), readLength));
    }

    const std::string name = elementName(io::recordName(source), span);
    const auto offset = static_cast<std::size_t>(span.start);
    const auto length = static_cast<std::size_t>(span.length());

    const std::string sequence = io::decodeSubsequence(source, offset, length);
    const char* qualities = nullptr;
    if (io::hasQualities(source)) {
        qualities = reinterpret_cast<const char*>(bam_get_qual(source) + offset);
    }

    const auto auxLength = static_cast<std::size_t>(bam_get_l_aux(source));

    auto record = io::makeRecord();
    if (bam_set1(record.get(), name.size(), name.c_str(), BAM_FUNMAP, -1, -1,
                 kElementMappingQuality, 0, nullptr, -1, -1, 0, sequence.size(), sequence.data(),
                 qualities, auxLength) < 0) {
        throw FormatError(fmt::format("cannot build element record {}", name));
    }

    // bam_set1 reserves room for the aux block but leaves it to the caller.
    std::memcpy(bam_get_aux(record.get()), bam_get_aux(source), auxLength);
    record->l_data += static_cast<int>(auxLength);

    const std::string tagName(segmentsTag);
    const std::string annotation =
        format::encodeSegments(format::filterSegments(segments, span.segStart, span.segEnd));
    if (bam_aux_update_str(record.get(), tagName.c_str(), static_cast<int>(annotation.size() + 1),
                           annotation.c_str()) != 0) {
        throw FormatError(fmt::format("cannot set {} tag on element record {}", segmentsTag, name));
    }
    return record;
}

ArrayElementWriter::ArrayElementWriter(io::BamWriter& output, std::string segmentsTag)
    : output_(output), segmentsTag_(std::move(segmentsTag)) {}

void ArrayElementWriter::write(const bam1_t* source, std::span<const format::Segment> segments,
                               const algo::ElementSpan& span) {
    auto record = buildElementRecord(source, segments, span, segmentsTag_);
    output_.write(record.get());
    ++elementsWritten_;
}

}  // namespace masseg::pipeline
