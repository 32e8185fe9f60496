#include "index_pair.hpp"

#include <boost/functional/hash.hpp>

#include <ostream>
#include <stdexcept>
#include <string>

namespace align_dist {

IndexPair IndexPair::make(const SequenceId a, const SequenceId b)
{
    if(a == b)
        throw std::invalid_argument("self pair: " + std::to_string(a));
    if(a < 0 || b < 0)
        throw std::invalid_argument("negative sequence id");
    return a < b ? IndexPair(a, b) : IndexPair(b, a);
}

std::ostream& operator<<(std::ostream& out, const IndexPair& pair)
{
    return out << '(' << pair.first() << ", " << pair.second() << ')';
}

std::vector<IndexPair> enumeratePairs(const size_t n)
{
    std::vector<IndexPair> result;
    if(n < 2)
        return result;
    result.reserve(n * (n - 1) / 2);
    for(size_t i = 0; i < n; i++)
        for(size_t j = i + 1; j < n; j++)
            result.push_back(IndexPair::make(static_cast<SequenceId>(i), static_cast<SequenceId>(j)));
    return result;
}

std::vector<IndexPair> enumeratePairs(const std::vector<SequenceId>& ids)
{
    std::vector<IndexPair> result;
    if(ids.size() < 2)
        return result;
    result.reserve(ids.size() * (ids.size() - 1) / 2);
    for(size_t i = 0; i < ids.size(); i++)
        for(size_t j = i + 1; j < ids.size(); j++)
            result.push_back(IndexPair::make(ids[i], ids[j]));
    return result;
}

}

size_t std::hash<align_dist::IndexPair>::operator()(const align_dist::IndexPair& p) const
{
    size_t seed = 0;
    boost::hash_combine(seed, p.first());
    boost::hash_combine(seed, p.second());
    return seed;
}
