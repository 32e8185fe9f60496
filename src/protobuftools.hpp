#ifndef ALIGN_DIST_PROTOBUFTOOLS_H
#define ALIGN_DIST_PROTOBUFTOOLS_H

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/gzip_stream.h>

#include <boost/iterator/iterator_facade.hpp>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace align_dist {

/// Single-pass iterator over varint-length-delimited messages of type T
template<typename T>
class DelimitedProtocolBufferIterator :
    public boost::iterator_facade<DelimitedProtocolBufferIterator<T>, const T, boost::single_pass_traversal_tag>
{
public:
    DelimitedProtocolBufferIterator(std::istream& in, const bool isGzipped = true) :
        rawIn_(new google::protobuf::io::IstreamInputStream(&in)),
        current_(new T())
    {
        if(isGzipped) {
            zipIn_.reset(new google::protobuf::io::GzipInputStream(rawIn_.get()));
            stream_ = zipIn_.get();
        } else {
            stream_ = rawIn_.get();
        }
        increment();
    }
    /// End of stream
    DelimitedProtocolBufferIterator() : stream_(nullptr) {}

private:
    friend class boost::iterator_core_access;

    /// \throws std::runtime_error on a truncated length prefix, or a truncated or unparseable message
    void increment()
    {
        current_->Clear();
        google::protobuf::io::CodedInputStream codedIn(stream_);
        std::uint32_t size = 0;
        if(!codedIn.ReadVarint32(&size)) {
            // Bytes consumed before the failure mean the length prefix was cut off
            if(codedIn.CurrentPosition() != 0)
                throw std::runtime_error("truncated length prefix in delimited stream");
            stream_ = nullptr;
            return;
        }

        std::string s;
        if(!codedIn.ReadString(&s, size) || !current_->ParseFromString(s))
            throw std::runtime_error("failed to parse delimited message");
    }

    bool equal(const DelimitedProtocolBufferIterator& other) const
    {
        return stream_ == other.stream_;
    }

    const T& dereference() const { return *current_; }

    std::shared_ptr<google::protobuf::io::IstreamInputStream> rawIn_;
    std::shared_ptr<google::protobuf::io::GzipInputStream> zipIn_;
    google::protobuf::io::ZeroCopyInputStream* stream_;
    std::shared_ptr<T> current_;
};

/// Write `items` as varint-length-delimited messages
template<typename T>
void writeDelimitedToStream(std::ostream& out, const std::vector<T>& items, const bool gzip = true)
{
    google::protobuf::io::OstreamOutputStream rawOut(&out);
    std::unique_ptr<google::protobuf::io::GzipOutputStream> zipOut;
    google::protobuf::io::ZeroCopyOutputStream* stream = &rawOut;
    if(gzip) {
        zipOut.reset(new google::protobuf::io::GzipOutputStream(&rawOut));
        stream = zipOut.get();
    }

    {
        google::protobuf::io::CodedOutputStream codedOut(stream);
        for(const T& item : items) {
            codedOut.WriteVarint32(static_cast<std::uint32_t>(item.ByteSizeLong()));
            item.SerializeWithCachedSizes(&codedOut);
        }
        if(codedOut.HadError())
            throw std::runtime_error("failed to write delimited messages");
    }
    if(zipOut && !zipOut->Close())
        throw std::runtime_error("failed to finish gzip stream");
}

}

#endif
