#include "pairwise_alignments.hpp"
#include "logging.hpp"
#include "needleman_wunsch.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <boost/algorithm/string/case_conv.hpp>

#include <string>
#include <utility>
#include <vector>

namespace align_dist {

std::vector<PairwiseAlignment> alignPairs(const std::vector<Sequence>& sequences)
{
    std::vector<std::string> bases;
    bases.reserve(sequences.size());
    for(const Sequence& s : sequences)
        bases.push_back(boost::algorithm::to_upper_copy(s.bases));

    const std::vector<IndexPair> pairs = enumeratePairs(sequences.size());
    std::vector<PairwiseAlignment> result;
    result.reserve(pairs.size());
    for(const IndexPair& p : pairs)
        result.push_back(PairwiseAlignment { p, AlignedPair(), 0 });

    int nThreads = 1;
#ifdef _OPENMP
    nThreads = omp_get_max_threads();
#endif
    LOG_INFO(logger()) << "aligning " << pairs.size() << " pairs of " << sequences.size()
                       << " sequences on " << nThreads << " thread(s)\n";

#ifdef _OPENMP
    #pragma omp parallel
#endif
    {
        // DP buffers are per thread
        NeedlemanWunsch aligner;
#ifdef _OPENMP
        #pragma omp for schedule(dynamic)
#endif
        for(size_t k = 0; k < result.size(); k++) {
            PairwiseAlignment& out = result[k];
            ScoredAlignment scored = aligner.alignWithScore(bases[out.pair.first()], bases[out.pair.second()]);
            out.alignment = std::move(scored.alignment);
            out.score = scored.score;
        }
    }

    return result;
}

AlignmentSet alignAll(const std::vector<Sequence>& sequences)
{
    AlignmentSet result;
    for(PairwiseAlignment& p : alignPairs(sequences))
        result.insert(std::make_pair(p.pair, std::move(p.alignment)));
    return result;
}

}
