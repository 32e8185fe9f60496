#include <sstream>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "logging.hpp"
#include "sequence_reader.hpp"

using namespace align_dist;

namespace {

Result<std::vector<Sequence>> parse(const std::string& text)
{
    std::istringstream in(text);
    return readSequences(in);
}

}

TEST(SequenceReader, records) {
    const Result<std::vector<Sequence>> r = parse(">human ACGT\n\n>CHIMP acg tta\n   >gorilla   AC GT AA  \n");
    ASSERT_TRUE(r.ok()) << r.error().reason;
    const std::vector<Sequence>& s = r.value();
    ASSERT_EQ(3u, s.size());
    EXPECT_EQ("Human", s[0].name);
    EXPECT_EQ("ACGT", s[0].bases);
    EXPECT_EQ("Chimp", s[1].name);
    EXPECT_EQ("ACGTTA", s[1].bases);
    EXPECT_EQ("Gorilla", s[2].name);
    EXPECT_EQ("ACGTAA", s[2].bases);
}

TEST(SequenceReader, empty_input) {
    const Result<std::vector<Sequence>> r = parse("\n  \n");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().empty());
}

TEST(SequenceReader, line_without_marker) {
    EXPECT_FALSE(parse(">human ACGT\nACGT\n").ok());
}

TEST(SequenceReader, empty_record) {
    EXPECT_FALSE(parse(">\n").ok());
    EXPECT_FALSE(parse(">   \n").ok());
}

TEST(SequenceReader, label_without_sequence) {
    EXPECT_FALSE(parse(">human\n").ok());
}

TEST(SequenceReader, invalid_bases) {
    EXPECT_FALSE(parse(">human ACGN\n").ok());
    EXPECT_FALSE(parse(">human ACGU\n").ok());
    EXPECT_FALSE(parse(">human AC-GT\n").ok());
}

TEST(SequenceReader, reason_names_line) {
    const Result<std::vector<Sequence>> r = parse(">a ACGT\n>b AC*T\n");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(std::string::npos, r.error().reason.find("line 2"));
}

TEST(SequenceReader, stream_failure_is_logged) {
    std::istringstream in(">human ACGT\n");
    in.setstate(std::ios::badbit);

    std::ostringstream captured;
    cpplog::OstreamLogger sink(captured);
    setLogTarget(&sink);
    const Result<std::vector<Sequence>> r = readSequences(in);
    setLogTarget(nullptr);

    ASSERT_FALSE(r.ok());
    EXPECT_NE(std::string::npos, r.error().reason.find("read error"));
    EXPECT_NE(std::string::npos, captured.str().find("read error"));
}

TEST(SequenceReader, missing_file) {
    EXPECT_FALSE(readSequencesFromFile("/nonexistent/sequences.txt").ok());
}

TEST(NormalizeLabel, capitalization) {
    EXPECT_EQ("Homo", normalizeLabel("hOMO"));
    EXPECT_EQ("Homo_sapiens", normalizeLabel("HOMO_SAPIENS"));
    EXPECT_EQ("X", normalizeLabel("x"));
    EXPECT_EQ("", normalizeLabel(""));
}
