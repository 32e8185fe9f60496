#include "alignio.pb.h"
#include "align_dist_config.h"
#include "logging.hpp"
#include "protobuftools.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>

using namespace align_dist;
namespace po = boost::program_options;

int main(const int argc, const char** argv)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    std::string inputPath;

    po::options_description desc("Allowed options");
    desc.add_options()
    ("help,h", "Produce help message")
    ("version,v", "Show version")
    ("input-file,i", po::value(&inputPath)->required(),
     "input file - output of build-alignments [required]");

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

    std::ifstream in(inputPath, std::ios::binary | std::ios::in);
    if(!in) {
        LOG_ERROR(logger()) << "cannot open " << inputPath << '\n';
        return 1;
    }

    size_t count = 0;
    try {
        const bool gzipped = boost::algorithm::ends_with(inputPath, ".gz");
        for(DelimitedProtocolBufferIterator<alignio::AlignmentRecord> it(in, gzipped), end; it != end; ++it) {
            std::cout << it->DebugString() << "\n---------------------------------\n";
            count++;
        }
    } catch(std::runtime_error& e) {
        LOG_ERROR(logger()) << inputPath << ": " << e.what() << '\n';
        return 1;
    }
    std::cout << "Count: " << count << '\n';

    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
