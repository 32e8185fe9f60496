#ifndef ALIGN_DIST_SEQUENCE_H
#define ALIGN_DIST_SEQUENCE_H

#include <string>

namespace align_dist {

/// A labelled nucleotide sequence; identified by its position in the input.
struct Sequence {
    std::string name;
    std::string bases;
};

}

#endif
