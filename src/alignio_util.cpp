#include "alignio_util.hpp"
#include "logging.hpp"
#include "protobuftools.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <fstream>
#include <stdexcept>

namespace align_dist {

alignio::AlignmentRecord toRecord(const PairwiseAlignment& p, const std::vector<Sequence>& sequences)
{
    alignio::AlignmentRecord record;
    record.add_index(p.pair.first());
    record.add_index(p.pair.second());
    record.add_sequence(p.alignment.first);
    record.add_sequence(p.alignment.second);
    record.set_score(p.score);
    record.set_name(sequences.at(p.pair.first()).name + '\t' + sequences.at(p.pair.second()).name);
    return record;
}

RawAlignmentEntry toRawEntry(const alignio::AlignmentRecord& record)
{
    RawAlignmentEntry entry;
    entry.key.assign(record.index().begin(), record.index().end());
    entry.value.assign(record.sequence().begin(), record.sequence().end());
    return entry;
}

void writeAlignmentFile(const std::string& path, const std::vector<alignio::AlignmentRecord>& records)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if(!out)
        throw std::runtime_error("cannot open " + path + " for writing");
    writeDelimitedToStream(out, records, boost::algorithm::ends_with(path, ".gz"));
    LOG_INFO(logger()) << "wrote " << records.size() << " alignments to " << path << '\n';
}

void loadAlignmentFile(const std::string& path,
                       std::vector<RawAlignmentEntry>& dest,
                       std::map<SequenceId, std::string>* labels)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if(!in)
        throw std::runtime_error("cannot open " + path);

    size_t count = 0;
    const bool gzipped = boost::algorithm::ends_with(path, ".gz");
    for(DelimitedProtocolBufferIterator<alignio::AlignmentRecord> it(in, gzipped), end; it != end; ++it) {
        const alignio::AlignmentRecord& record = *it;
        dest.push_back(toRawEntry(record));
        count++;

        if(labels == nullptr || !record.has_name() || record.index_size() != 2)
            continue;
        const std::string& name = record.name();
        const size_t tab = name.find('\t');
        if(tab == std::string::npos)
            continue;
        (*labels)[record.index(0)] = name.substr(0, tab);
        (*labels)[record.index(1)] = name.substr(tab + 1);
    }
    LOG_INFO(logger()) << "loaded " << count << " alignments from " << path << '\n';
}

}
