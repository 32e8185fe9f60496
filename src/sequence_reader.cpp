#include "sequence_reader.hpp"
#include "logging.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <utility>

namespace align_dist {

namespace {

MalformedInput reject(const size_t lineNumber, const std::string& reason)
{
    const std::string message = "line " + std::to_string(lineNumber) + ": " + reason;
    LOG_WARN(logger()) << "malformed sequence file: " << message << '\n';
    return malformed(message);
}

bool isNucleotide(const char c)
{
    return c == 'A' || c == 'C' || c == 'G' || c == 'T';
}

}

std::string normalizeLabel(const std::string& label)
{
    std::string result = boost::algorithm::to_lower_copy(label);
    if(!result.empty())
        result[0] = std::toupper(static_cast<unsigned char>(result[0]));
    return result;
}

Result<std::vector<Sequence>> readSequences(std::istream& in)
{
    std::vector<Sequence> result;
    std::string line;
    size_t lineNumber = 0;
    while(std::getline(in, line)) {
        lineNumber++;
        boost::algorithm::trim(line);
        if(line.empty())
            continue;
        if(line[0] != '>')
            return reject(lineNumber, "record does not start with '>'");

        std::string body = line.substr(1);
        boost::algorithm::trim(body);
        if(body.empty())
            return reject(lineNumber, "empty record");

        std::vector<std::string> fields;
        boost::algorithm::split(fields, body, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        if(fields.size() < 2)
            return reject(lineNumber, "record has a label but no sequence");

        Sequence sequence;
        sequence.name = normalizeLabel(fields[0]);
        for(size_t i = 1; i < fields.size(); i++)
            sequence.bases += boost::algorithm::to_upper_copy(fields[i]);
        if(!std::all_of(sequence.bases.begin(), sequence.bases.end(), isNucleotide))
            return reject(lineNumber, "sequence for " + sequence.name + " has characters other than A, C, G, T");

        result.push_back(std::move(sequence));
    }
    if(in.bad())
        return reject(lineNumber + 1, "read error");

    LOG_DEBUG(logger()) << "read " << result.size() << " sequences\n";
    return result;
}

Result<std::vector<Sequence>> readSequencesFromFile(const std::string& path)
{
    std::ifstream in(path);
    if(!in) {
        LOG_WARN(logger()) << "cannot open " << path << '\n';
        return malformed("cannot open " + path);
    }
    return readSequences(in);
}

}
