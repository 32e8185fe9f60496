#ifndef ALIGN_DIST_DISTANCE_MATRIX_H
#define ALIGN_DIST_DISTANCE_MATRIX_H

#include "alignment_validator.hpp"
#include "result.hpp"

#include <Eigen/Core>

#include <vector>

namespace align_dist {

/// Symmetric, zero-diagonal distances; row/column k belongs to ids[k].
struct DistanceMatrix {
    std::vector<SequenceId> ids;
    Eigen::MatrixXd distances;

    /// Row of `id`
    /// \throws std::out_of_range if `id` is not in `ids`
    size_t position(const SequenceId id) const;
    double operator()(const SequenceId a, const SequenceId b) const
    {
        return distances(position(a), position(b));
    }
};

/// \brief Validate an alignment map and compute the Jukes-Cantor distance of every pair
Result<DistanceMatrix> buildDistanceMatrix(const std::vector<RawAlignmentEntry>& entries);
Result<DistanceMatrix> buildDistanceMatrix(const AlignmentSet& alignments);
/// Distances for an already validated map
Result<DistanceMatrix> buildDistanceMatrix(const ValidatedAlignments& validated);

}

#endif
