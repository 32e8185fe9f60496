#include "alignment_validator.hpp"
#include "logging.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace align_dist {

namespace {

MalformedInput reject(const std::string& reason)
{
    LOG_WARN(logger()) << "malformed alignment map: " << reason << '\n';
    return malformed(reason);
}

std::string describeKey(const std::vector<SequenceId>& key)
{
    std::ostringstream out;
    out << '(';
    for(size_t i = 0; i < key.size(); i++)
        out << (i ? ", " : "") << key[i];
    out << ')';
    return out.str();
}

}

bool isAlignmentCharacter(const char c)
{
    switch(c) {
        case 'A': case 'C': case 'G': case 'T':
        case 'a': case 'c': case 'g': case 't':
        case '-':
            return true;
        default:
            return false;
    }
}

Result<ValidatedAlignments> validateAlignments(const std::vector<RawAlignmentEntry>& entries)
{
    if(entries.empty())
        return reject("no alignments");

    ValidatedAlignments result;
    std::set<SequenceId> identifiers;

    for(const RawAlignmentEntry& entry : entries) {
        const std::string key = describeKey(entry.key);

        if(entry.key.size() != 2)
            return reject("key " + key + " does not hold exactly two ids");
        if(entry.key[0] == entry.key[1])
            return reject("self pair " + key);
        if(entry.key[0] < 0 || entry.key[1] < 0)
            return reject("negative id in " + key);

        if(entry.value.size() != 2)
            return reject("value for " + key + " does not hold exactly two sequences");
        const std::string& a = entry.value[0];
        const std::string& b = entry.value[1];
        if(a.empty() || a.size() != b.size())
            return reject("sequences for " + key + " are empty or differ in length");
        if(!std::all_of(a.begin(), a.end(), isAlignmentCharacter) ||
           !std::all_of(b.begin(), b.end(), isAlignmentCharacter))
            return reject("invalid character in alignment for " + key);

        const IndexPair pair = IndexPair::make(entry.key[0], entry.key[1]);
        if(result.alignments.count(pair))
            return reject("duplicate entry for " + key);

        result.alignments[pair] = AlignedPair { a, b };
        identifiers.insert(pair.first());
        identifiers.insert(pair.second());
    }

    if(identifiers.size() < 2)
        return reject("fewer than two sequence ids");
    result.ids.assign(identifiers.begin(), identifiers.end());

    // Every key is drawn from `ids`, so the key set is complete iff no pair is missing.
    for(const IndexPair& expected : enumeratePairs(result.ids)) {
        if(result.alignments.count(expected) == 0) {
            std::ostringstream reason;
            reason << "missing alignment for pair " << expected;
            return reject(reason.str());
        }
    }

    LOG_DEBUG(logger()) << "validated " << result.alignments.size() << " alignments over "
                        << result.ids.size() << " sequences\n";
    return result;
}

Result<ValidatedAlignments> validateAlignments(const AlignmentSet& alignments)
{
    std::vector<RawAlignmentEntry> entries;
    entries.reserve(alignments.size());
    for(const auto& p : alignments) {
        RawAlignmentEntry entry;
        entry.key = { p.first.first(), p.first.second() };
        entry.value = { p.second.first, p.second.second };
        entries.push_back(std::move(entry));
    }
    return validateAlignments(entries);
}

}
