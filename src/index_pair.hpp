#ifndef ALIGN_DIST_INDEX_PAIR_H
#define ALIGN_DIST_INDEX_PAIR_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <vector>

namespace align_dist {

/// Position of a sequence in its input collection
typedef std::int64_t SequenceId;

/// An unordered pair of distinct, non-negative sequence ids.
/// Always stored with the smaller id first.
class IndexPair
{
public:
    /// \throws std::invalid_argument if a == b or either id is negative
    static IndexPair make(const SequenceId a, const SequenceId b);

    SequenceId first() const { return first_; }
    SequenceId second() const { return second_; }

    bool operator==(const IndexPair& other) const
    {
        return first_ == other.first_ && second_ == other.second_;
    }
    bool operator!=(const IndexPair& other) const { return !(*this == other); }
    bool operator<(const IndexPair& other) const
    {
        return first_ < other.first_ || (first_ == other.first_ && second_ < other.second_);
    }

private:
    IndexPair(const SequenceId first, const SequenceId second) : first_(first), second_(second) {}

    SequenceId first_;
    SequenceId second_;
};

std::ostream& operator<<(std::ostream& out, const IndexPair& pair);

/// All pairs (i, j), 0 <= i < j < n, in lexicographic order
std::vector<IndexPair> enumeratePairs(const size_t n);

/// All pairs drawn from `ids`, which must be sorted and unique
std::vector<IndexPair> enumeratePairs(const std::vector<SequenceId>& ids);

}

namespace std {
template<>
struct hash<align_dist::IndexPair> {
    size_t operator()(const align_dist::IndexPair& p) const;
};
}

#endif
