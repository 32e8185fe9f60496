#ifndef ALIGN_DIST_ALIGNED_PAIR_H
#define ALIGN_DIST_ALIGNED_PAIR_H

#include "index_pair.hpp"

#include <map>
#include <string>

namespace align_dist {

/// Two gapped sequences of equal length, over {A,C,G,T,-}
struct AlignedPair {
    std::string first;
    std::string second;
};

/// Alignments keyed by canonical pair; ordered so iteration is reproducible.
typedef std::map<IndexPair, AlignedPair> AlignmentSet;

}

#endif
