#ifndef ALIGN_DIST_ALIGNMENT_VALIDATOR_H
#define ALIGN_DIST_ALIGNMENT_VALIDATOR_H

#include "aligned_pair.hpp"
#include "index_pair.hpp"
#include "result.hpp"

#include <string>
#include <vector>

namespace align_dist {

/// One entry of an alignment map supplied from outside, before any checks.
/// `key` should hold two distinct ids and `value` two aligned strings.
struct RawAlignmentEntry {
    std::vector<SequenceId> key;
    std::vector<std::string> value;
};

struct ValidatedAlignments {
    /// Every id mentioned by a key, ascending
    std::vector<SequenceId> ids;
    /// Copy of the input, keyed by canonical pair
    AlignmentSet alignments;
};

/// True for A, C, G, T (either case) and '-'
bool isAlignmentCharacter(const char c);

/// \brief Normalize and check an alignment map
///
/// Fails on the first violation: empty input; keys that are not two distinct
/// non-negative ids; values that are not two non-empty strings of equal
/// length over {A,C,G,T,a,c,g,t,-}; a canonical key seen twice; fewer than
/// two ids; or a key set that is not every pair of the ids mentioned.
/// Gap-stripped values are not compared against any source sequence.
Result<ValidatedAlignments> validateAlignments(const std::vector<RawAlignmentEntry>& entries);
Result<ValidatedAlignments> validateAlignments(const AlignmentSet& alignments);

}

#endif
