#ifndef ALIGN_DIST_ALIGNIO_UTIL_H
#define ALIGN_DIST_ALIGNIO_UTIL_H

#include "alignment_validator.hpp"
#include "pairwise_alignments.hpp"
#include "sequence.hpp"

#include "alignio.pb.h"

#include <map>
#include <string>
#include <vector>

namespace align_dist {

/// Record for `p`; labels are taken from `sequences`
alignio::AlignmentRecord toRecord(const PairwiseAlignment& p, const std::vector<Sequence>& sequences);

/// Untyped entry; nothing is checked here
RawAlignmentEntry toRawEntry(const alignio::AlignmentRecord& record);

/// Write records to `path`; gzip compressed when `path` ends with ".gz"
void writeAlignmentFile(const std::string& path, const std::vector<alignio::AlignmentRecord>& records);

/// \brief Append the records in `path` to `dest`
///
/// When `labels` is non-null, labels found in record names are added to it, keyed by id.
/// \throws std::runtime_error if the file cannot be opened or parsed
void loadAlignmentFile(const std::string& path,
                       std::vector<RawAlignmentEntry>& dest,
                       std::map<SequenceId, std::string>* labels = nullptr);

}

#endif
