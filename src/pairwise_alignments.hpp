#ifndef ALIGN_DIST_PAIRWISE_ALIGNMENTS_H
#define ALIGN_DIST_PAIRWISE_ALIGNMENTS_H

#include "aligned_pair.hpp"
#include "index_pair.hpp"
#include "sequence.hpp"

#include <vector>

namespace align_dist {

struct PairwiseAlignment {
    IndexPair pair;
    AlignedPair alignment;
    /// Needleman-Wunsch score
    int score;
};

/// \brief Globally align every unordered pair of `sequences`
///
/// Bases are upper-cased before alignment. Pairs are processed in parallel
/// when OpenMP is available; the result is in enumeratePairs order.
std::vector<PairwiseAlignment> alignPairs(const std::vector<Sequence>& sequences);

/// As alignPairs, keyed by pair
AlignmentSet alignAll(const std::vector<Sequence>& sequences);

}

#endif
