#include "needleman_wunsch.hpp"

#include <algorithm>
#include <stdexcept>

namespace align_dist {

const int NeedlemanWunsch::MATCH;
const int NeedlemanWunsch::MISMATCH;
const int NeedlemanWunsch::GAP;

void NeedlemanWunsch::fill(const std::string& a, const std::string& b)
{
    const long m = a.size(), n = b.size();
    scores_.resize(m + 1, n + 1);
    directions_.resize(m + 1, n + 1);

    scores_(0, 0) = 0;
    directions_(0, 0) = DIAGONAL;
    for(long i = 1; i <= m; i++) {
        scores_(i, 0) = i * GAP;
        directions_(i, 0) = UP;
    }
    for(long j = 1; j <= n; j++) {
        scores_(0, j) = j * GAP;
        directions_(0, j) = LEFT;
    }

    // Column-major storage: walk down each column
    for(long j = 1; j <= n; j++) {
        for(long i = 1; i <= m; i++) {
            const int diag = scores_(i - 1, j - 1) + (a[i - 1] == b[j - 1] ? MATCH : MISMATCH);
            const int up = scores_(i - 1, j) + GAP;
            const int left = scores_(i, j - 1) + GAP;

            if(diag >= up && diag >= left) {
                scores_(i, j) = diag;
                directions_(i, j) = DIAGONAL;
            } else if(up >= left) {
                scores_(i, j) = up;
                directions_(i, j) = UP;
            } else {
                scores_(i, j) = left;
                directions_(i, j) = LEFT;
            }
        }
    }
}

AlignedPair NeedlemanWunsch::traceback(const std::string& a, const std::string& b) const
{
    AlignedPair result;
    result.first.reserve(a.size() + b.size());
    result.second.reserve(a.size() + b.size());

    size_t i = a.size(), j = b.size();
    while(i > 0 || j > 0) {
        Direction d;
        if(i == 0)
            d = LEFT;
        else if(j == 0)
            d = UP;
        else
            d = static_cast<Direction>(directions_(i, j));

        switch(d) {
            case DIAGONAL:
                result.first.push_back(a[i - 1]);
                result.second.push_back(b[j - 1]);
                i--;
                j--;
                break;
            case UP:
                result.first.push_back(a[i - 1]);
                result.second.push_back('-');
                i--;
                break;
            case LEFT:
                result.first.push_back('-');
                result.second.push_back(b[j - 1]);
                j--;
                break;
        }
    }

    std::reverse(result.first.begin(), result.first.end());
    std::reverse(result.second.begin(), result.second.end());
    return result;
}

AlignedPair NeedlemanWunsch::align(const std::string& a, const std::string& b)
{
    return alignWithScore(a, b).alignment;
}

ScoredAlignment NeedlemanWunsch::alignWithScore(const std::string& a, const std::string& b)
{
    fill(a, b);
    ScoredAlignment result;
    result.alignment = traceback(a, b);
    result.score = scores_(a.size(), b.size());
    return result;
}

int scoreAlignment(const std::string& gappedA, const std::string& gappedB)
{
    if(gappedA.size() != gappedB.size())
        throw std::invalid_argument("aligned sequences differ in length");

    int score = 0;
    for(size_t k = 0; k < gappedA.size(); k++) {
        const bool gapA = gappedA[k] == '-', gapB = gappedB[k] == '-';
        if(gapA && gapB)
            continue;
        else if(gapA || gapB)
            score += NeedlemanWunsch::GAP;
        else if(gappedA[k] == gappedB[k])
            score += NeedlemanWunsch::MATCH;
        else
            score += NeedlemanWunsch::MISMATCH;
    }
    return score;
}

}
