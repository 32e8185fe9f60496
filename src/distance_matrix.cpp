#include "distance_matrix.hpp"
#include "jukes_cantor.hpp"
#include "logging.hpp"

#include <boost/optional.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace align_dist {

size_t DistanceMatrix::position(const SequenceId id) const
{
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if(it == ids.end() || *it != id)
        throw std::out_of_range("unknown sequence id: " + std::to_string(id));
    return it - ids.begin();
}

Result<DistanceMatrix> buildDistanceMatrix(const std::vector<RawAlignmentEntry>& entries)
{
    const Result<ValidatedAlignments> validated = validateAlignments(entries);
    if(!validated)
        return validated.error();
    return buildDistanceMatrix(validated.value());
}

Result<DistanceMatrix> buildDistanceMatrix(const AlignmentSet& alignments)
{
    const Result<ValidatedAlignments> validated = validateAlignments(alignments);
    if(!validated)
        return validated.error();
    return buildDistanceMatrix(validated.value());
}

Result<DistanceMatrix> buildDistanceMatrix(const ValidatedAlignments& validated)
{
    std::vector<const AlignmentSet::value_type*> work;
    work.reserve(validated.alignments.size());
    for(const AlignmentSet::value_type& p : validated.alignments)
        work.push_back(&p);

    std::vector<double> values(work.size(), 0.0);
    std::vector<boost::optional<MalformedInput>> errors(work.size());

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for(size_t k = 0; k < work.size(); k++) {
        const AlignedPair& alignment = work[k]->second;
        const Result<double> d = jukesCantorDistance(countSites(alignment.first, alignment.second));
        if(d)
            values[k] = d.value();
        else
            errors[k] = d.error();
    }

    DistanceMatrix result;
    result.ids = validated.ids;
    const size_t n = result.ids.size();
    result.distances = Eigen::MatrixXd::Zero(n, n);

    for(size_t k = 0; k < work.size(); k++) {
        if(errors[k]) {
            LOG_WARN(logger()) << "no distance for pair " << work[k]->first << ": " << errors[k]->reason << '\n';
            return *errors[k];
        }
        const size_t i = result.position(work[k]->first.first()),
                     j = result.position(work[k]->first.second());
        result.distances(i, j) = values[k];
        result.distances(j, i) = values[k];
    }

    LOG_INFO(logger()) << "computed " << work.size() << " distances between " << n << " sequences\n";
    return result;
}

}
