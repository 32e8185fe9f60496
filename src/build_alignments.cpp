#include "alignio.pb.h"
#include "align_dist_config.h"
#include "alignio_util.hpp"
#include "logging.hpp"
#include "pairwise_alignments.hpp"
#include "sequence_reader.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace align_dist {

int run_main(int argc, char* argv[])
{
    std::string inputPath, outputPath;
    int nThreads = 0;
    bool verbose = false, quiet = false;

    po::options_description desc("Allowed options");
    desc.add_options()
    ("help,h", "Produce help message")
    ("version,v", "Print version")
    ("input-file,i", po::value(&inputPath)->required(), "Sequence records, one '>label SEQUENCE' per line [required]")
    ("output-file,o", po::value(&outputPath)->required(), "Output alignments; gzipped if ending in .gz [required]")
    ("threads,j", po::value(&nThreads), "Number of threads [default: all]")
    ("verbose", po::bool_switch(&verbose), "Log debugging messages")
    ("quiet,q", po::bool_switch(&quiet), "Only log warnings and errors");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if(vm.count("help")) {
        std::cout << "Usage: build-alignments [options] -i <in.txt> -o <out.bin>\n";
        std::cout << desc << '\n';
        return 0;
    }
    if(vm.count("version")) {
        std::cout << ALIGN_DIST_VERSION << '\n';
        return 0;
    }

    po::notify(vm);

    if(verbose)
        setLogLevel(LL_DEBUG);
    else if(quiet)
        setLogLevel(LL_WARN);
#ifdef _OPENMP
    if(nThreads > 0)
        omp_set_num_threads(nThreads);
#endif

    const Result<std::vector<Sequence>> sequences = readSequencesFromFile(inputPath);
    if(!sequences) {
        LOG_ERROR(logger()) << inputPath << ": " << sequences.error().reason << '\n';
        return 2;
    }
    LOG_INFO(logger()) << sequences.value().size() << " sequences.\n";

    std::vector<alignio::AlignmentRecord> records;
    for(const PairwiseAlignment& p : alignPairs(sequences.value()))
        records.push_back(toRecord(p, sequences.value()));

    writeAlignmentFile(outputPath, records);
    return 0;
}

}

int main(int argc, char* argv[])
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    int res = 1;
    try {
        res = align_dist::run_main(argc, argv);
    } catch(po::error& e) {
        LOG_ERROR(align_dist::logger()) << e.what() << '\n';
    } catch(std::runtime_error& e) {
        LOG_ERROR(align_dist::logger()) << e.what() << '\n';
    }
    google::protobuf::ShutdownProtobufLibrary();
    return res;
}
