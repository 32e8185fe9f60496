#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/program_options.hpp>
#include <json/json.h>
#include <json/value.h>

#include "alignio.pb.h"
#include "align_dist_config.h"
#include "alignio_util.hpp"
#include "distance_matrix.hpp"
#include "logging.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

// STL
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace align_dist;
namespace po = boost::program_options;

void writeResults(std::ostream& out,
                  const DistanceMatrix& matrix,
                  const std::map<SequenceId, std::string>& labels,
                  const bool includeLabels = true)
{
    Json::Value root;
    root["version"] = ALIGN_DIST_VERSION;

    const size_t n = matrix.ids.size();
    root["pairs"] = static_cast<Json::UInt64>(n * (n - 1) / 2);

    Json::Value idsNode(Json::arrayValue);
    for(const SequenceId id : matrix.ids)
        idsNode.append(static_cast<Json::Int64>(id));
    root["ids"] = idsNode;

    if(includeLabels && !labels.empty()) {
        Json::Value labelsNode(Json::arrayValue);
        for(const SequenceId id : matrix.ids) {
            auto it = labels.find(id);
            labelsNode.append(it == labels.end() ? std::string() : it->second);
        }
        root["labels"] = labelsNode;
    }

    Json::Value matrixNode(Json::arrayValue);
    for(size_t i = 0; i < n; i++) {
        Json::Value row(Json::arrayValue);
        for(size_t j = 0; j < n; j++)
            row.append(matrix.distances(i, j));
        matrixNode.append(row);
    }
    root["matrix"] = matrixNode;

    out << root << '\n';
}

int main(const int argc, const char** argv)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    std::string outputPath;
    std::vector<std::string> inputPaths;
    bool noLabels = false, verbose = false, quiet = false;
    int nThreads = 0;

    // command-line parsing
    po::options_description desc("Allowed options");
    desc.add_options()
    ("help,h", "Produce help message")
    ("version,v", "Show version")
    ("input-file,i", po::value(&inputPaths)->composing()->required(),
     "input file(s) - output of build-alignments [required]")
    ("output-file,o", po::value(&outputPath)->required(), "output JSON file; gzipped if ending in .gz [required]")
    ("threads,j", po::value(&nThreads), "Number of threads [default: all]")
    ("no-labels", po::bool_switch(&noLabels), "*do not* include sequence labels in output")
    ("verbose", po::bool_switch(&verbose), "Log debugging messages")
    ("quiet,q", po::bool_switch(&quiet), "Only log warnings and errors");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                  options(desc).run(), vm);

        if(vm.count("help")) {
            std::cout << desc << '\n';
            return 0;
        }
        if(vm.count("version")) {
            std::cout << ALIGN_DIST_VERSION << '\n';
            return 0;
        }

        po::notify(vm);
    } catch(po::error& e) {
        LOG_ERROR(logger()) << e.what() << '\n';
        return 1;
    }

    if(verbose)
        setLogLevel(LL_DEBUG);
    else if(quiet)
        setLogLevel(LL_WARN);
#ifdef _OPENMP
    if(nThreads > 0)
        omp_set_num_threads(nThreads);
#endif

    std::vector<RawAlignmentEntry> entries;
    std::map<SequenceId, std::string> labels;
    try {
        for(const std::string& path : inputPaths) {
            LOG_INFO(logger()) << "Loading from " << path << '\n';
            loadAlignmentFile(path, entries, &labels);
        }
    } catch(std::runtime_error& e) {
        LOG_ERROR(logger()) << e.what() << '\n';
        return 1;
    }
    LOG_INFO(logger()) << entries.size() << " alignments." << '\n';

    const Result<DistanceMatrix> matrix = buildDistanceMatrix(entries);
    if(!matrix) {
        LOG_ERROR(logger()) << "rejected input: " << matrix.error().reason << '\n';
        return 2;
    }

    std::ofstream file(outputPath, std::ios_base::out | std::ios_base::binary);
    if(!file) {
        LOG_ERROR(logger()) << "cannot open " << outputPath << " for writing\n";
        return 1;
    }
    {
        boost::iostreams::filtering_streambuf<boost::iostreams::output> outBuf;
        if(boost::algorithm::ends_with(outputPath, ".gz"))
            outBuf.push(boost::iostreams::gzip_compressor());
        outBuf.push(file);
        std::ostream outStream(&outBuf);
        writeResults(outStream, matrix.value(), labels, !noLabels);
    }
    LOG_INFO(logger()) << "wrote " << matrix.value().ids.size() << "x" << matrix.value().ids.size()
                       << " matrix to " << outputPath << '\n';

    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
