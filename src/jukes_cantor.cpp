#include "jukes_cantor.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>

namespace align_dist {

SiteCounts countSites(const std::string& gappedA, const std::string& gappedB)
{
    SiteCounts counts { 0, 0 };
    const size_t n = std::min(gappedA.size(), gappedB.size());
    for(size_t k = 0; k < n; k++) {
        const char a = gappedA[k], b = gappedB[k];
        if(a == '-' || b == '-')
            continue;
        counts.comparable++;
        if(a != b)
            counts.mismatches++;
    }
    return counts;
}

Result<double> jukesCantorDistance(const SiteCounts& counts)
{
    // No informative sites, or identical ones; avoids returning -0.0
    if(counts.comparable == 0 || counts.mismatches == 0)
        return 0.0;

    const double p = counts.pDistance();
    if(p >= 0.75)
        return JC_SATURATION_DISTANCE;

    const double correction = 1.0 - (4.0 / 3.0) * p;
    // Unreachable while p < 0.75
    if(correction <= 0.0)
        return malformed("non-positive Jukes-Cantor correction at p = " + std::to_string(p));

    return -0.75 * std::log(correction);
}

Result<double> jukesCantorDistance(const std::string& gappedA, const std::string& gappedB)
{
    if(gappedA.size() != gappedB.size()) {
        LOG_WARN(logger()) << "aligned sequences differ in length: " << gappedA.size() << " vs " << gappedB.size() << '\n';
        return malformed("aligned sequences differ in length");
    }

    const Result<double> d = jukesCantorDistance(countSites(gappedA, gappedB));
    if(!d)
        LOG_WARN(logger()) << d.error().reason << '\n';
    return d;
}

}
