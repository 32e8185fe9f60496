#ifndef ALIGN_DIST_SEQUENCE_READER_H
#define ALIGN_DIST_SEQUENCE_READER_H

#include "result.hpp"
#include "sequence.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace align_dist {

/// \brief Read sequence records
///
/// Each non-blank line has the form `>label chunk [chunk ...]`. Chunks are
/// joined and upper-cased and must contain only A, C, G and T. Labels are
/// lower-cased with the first letter capitalized.
Result<std::vector<Sequence>> readSequences(std::istream& in);
Result<std::vector<Sequence>> readSequencesFromFile(const std::string& path);

/// "hOMO" -> "Homo"
std::string normalizeLabel(const std::string& label);

}

#endif
