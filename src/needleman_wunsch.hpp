#ifndef ALIGN_DIST_NEEDLEMAN_WUNSCH_H
#define ALIGN_DIST_NEEDLEMAN_WUNSCH_H

#include "aligned_pair.hpp"

#include <Eigen/Core>

#include <cstdint>
#include <string>

namespace align_dist {

struct ScoredAlignment {
    AlignedPair alignment;
    int score;
};

/// \brief Global alignment with a linear gap penalty
///
/// Scores: match +5, mismatch -2, each gap column -6.
/// When candidate moves tie, the traceback prefers diagonal, then up
/// (consume the first sequence), then left (consume the second).
///
/// DP buffers are kept between calls; use one instance per thread.
class NeedlemanWunsch
{
public:
    static const int MATCH = 5;
    static const int MISMATCH = -2;
    static const int GAP = -6;

    AlignedPair align(const std::string& a, const std::string& b);
    ScoredAlignment alignWithScore(const std::string& a, const std::string& b);

private:
    enum Direction : std::uint8_t { DIAGONAL = 0, UP = 1, LEFT = 2 };

    void fill(const std::string& a, const std::string& b);
    AlignedPair traceback(const std::string& a, const std::string& b) const;

    Eigen::MatrixXi scores_;
    Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic> directions_;
};

/// Score an existing alignment with the NeedlemanWunsch weights.
/// Columns where both characters are gaps score zero.
int scoreAlignment(const std::string& gappedA, const std::string& gappedB);

}

#endif
