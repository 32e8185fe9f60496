#ifndef ALIGN_DIST_JUKES_CANTOR_H
#define ALIGN_DIST_JUKES_CANTOR_H

#include "result.hpp"

#include <cstddef>
#include <string>

namespace align_dist {

/// Distance reported once the p-distance reaches 0.75
const double JC_SATURATION_DISTANCE = 30.0;

/// Column counts over an alignment; gapped columns are not comparable.
struct SiteCounts {
    size_t comparable;
    size_t mismatches;

    double pDistance() const
    {
        return comparable == 0 ? 0.0 : static_cast<double>(mismatches) / comparable;
    }
};

/// Compares aligned columns as given; 'a' and 'A' count as a mismatch
SiteCounts countSites(const std::string& gappedA, const std::string& gappedB);

/// \brief Jukes-Cantor corrected distance from column counts
///
/// Does not log, so it may be called from inside a parallel region.
Result<double> jukesCantorDistance(const SiteCounts& counts);

/// \brief Jukes-Cantor corrected distance between two aligned sequences
///
/// d = -3/4 ln(1 - 4/3 p). Zero when no column is comparable;
/// JC_SATURATION_DISTANCE when p >= 0.75.
/// Fails if the sequences differ in length. Rejections are logged at WARN.
Result<double> jukesCantorDistance(const std::string& gappedA, const std::string& gappedB);

}

#endif
