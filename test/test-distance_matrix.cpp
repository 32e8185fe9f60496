#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "distance_matrix.hpp"
#include "jukes_cantor.hpp"
#include "pairwise_alignments.hpp"

using namespace align_dist;

namespace {

RawAlignmentEntry entry(const SequenceId a, const SequenceId b, const std::string& x, const std::string& y)
{
    RawAlignmentEntry e;
    e.key = { a, b };
    e.value = { x, y };
    return e;
}

void checkSymmetricZeroDiagonal(const DistanceMatrix& m)
{
    ASSERT_EQ(m.ids.size(), static_cast<size_t>(m.distances.rows()));
    ASSERT_EQ(m.ids.size(), static_cast<size_t>(m.distances.cols()));
    for(long i = 0; i < m.distances.rows(); i++) {
        EXPECT_EQ(0.0, m.distances(i, i));
        for(long j = 0; j < m.distances.cols(); j++) {
            EXPECT_EQ(m.distances(i, j), m.distances(j, i));
            EXPECT_GE(m.distances(i, j), 0.0);
        }
    }
}

}

TEST(DistanceMatrix, three_sequences) {
    const std::vector<RawAlignmentEntry> entries {
        entry(1, 2, "AA", "AA"),
        entry(1, 3, "AA", "AT"),
        entry(2, 3, "AA", "AT")
    };
    const Result<DistanceMatrix> r = buildDistanceMatrix(entries);
    ASSERT_TRUE(r.ok()) << r.error().reason;
    const DistanceMatrix& m = r.value();
    checkSymmetricZeroDiagonal(m);

    EXPECT_EQ(0u, m.position(1));
    EXPECT_EQ(2u, m.position(3));
    EXPECT_EQ(m(1, 3), m(2, 3));
    EXPECT_EQ(0.0, m(1, 2));
    EXPECT_NEAR(-0.75 * std::log(1.0 - (4.0 / 3.0) * 0.5), m(1, 3), 1e-12);
    EXPECT_THROW(m.position(4), std::out_of_range);
}

TEST(DistanceMatrix, hand_crafted_alignments) {
    const std::vector<RawAlignmentEntry> entries {
        entry(1, 2, "ACGTCGTAACAA", "ACGTCGTTACGT"),
        entry(1, 3, "ACGTACGT--ACGT", "ACGTTCGTATGCGT"),
        entry(1, 4, "ACGTACGTACACGTACGT--ACGTACGTACGTAAACGTTCGTATGCGT",
                    "ACGTACGTAAACGTTCGTATGCGTACGTACGTACACGTACGT--ACGT"),
        entry(2, 3, "ACGTACGT--ACGT", "ACGTTCGTATGCGT"),
        entry(2, 4, "ACGTACGT--ACGT", "ACGTTCGTATGCGT"),
        entry(3, 4, "ACGTACGTACACGTACGT--ACGTACGTACACGTACGTGTAAACGTTCGTATGCGT",
                    "ACGTACGTAAACGTTCGTATGCACGTACGTGTACGTACGTACACGTACGT--ACGT")
    };
    const Result<DistanceMatrix> r = buildDistanceMatrix(entries);
    ASSERT_TRUE(r.ok()) << r.error().reason;
    const DistanceMatrix& m = r.value();
    checkSymmetricZeroDiagonal(m);

    EXPECT_NEAR(0.304098831081, m(1, 2), 1e-9);
    EXPECT_NEAR(0.188485821211, m(1, 3), 1e-9);
    EXPECT_NEAR(0.150503021597, m(1, 4), 1e-9);
    EXPECT_NEAR(0.188485821211, m(2, 3), 1e-9);
    EXPECT_NEAR(0.188485821211, m(2, 4), 1e-9);
    EXPECT_NEAR(0.622761226555, m(3, 4), 1e-9);
}

TEST(DistanceMatrix, saturated_pair) {
    const std::vector<RawAlignmentEntry> entries { entry(0, 1, "ACGT", "TGCA") };
    const Result<DistanceMatrix> r = buildDistanceMatrix(entries);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(30.0, r.value()(0, 1));
    EXPECT_EQ(30.0, r.value()(1, 0));
}

TEST(DistanceMatrix, lower_case_is_compared_as_given) {
    const std::vector<RawAlignmentEntry> entries {
        entry(0, 1, "acgt", "ACGT"),
        entry(0, 2, "acgt", "acgt"),
        entry(1, 2, "ACGT", "acgt")
    };
    const Result<DistanceMatrix> r = buildDistanceMatrix(entries);
    ASSERT_TRUE(r.ok()) << r.error().reason;
    EXPECT_EQ(JC_SATURATION_DISTANCE, r.value()(0, 1));
    EXPECT_EQ(0.0, r.value()(0, 2));
    EXPECT_EQ(JC_SATURATION_DISTANCE, r.value()(2, 1));
}

TEST(DistanceMatrix, rejects_incomplete_set) {
    const std::vector<RawAlignmentEntry> entries {
        entry(1, 2, "AA", "AA"),
        entry(2, 3, "AA", "AT")
    };
    EXPECT_FALSE(buildDistanceMatrix(entries).ok());
}

TEST(DistanceMatrix, rejects_self_pair) {
    const std::vector<RawAlignmentEntry> entries { entry(1, 1, "AA", "AA") };
    EXPECT_FALSE(buildDistanceMatrix(entries).ok());
}

TEST(DistanceMatrix, from_aligned_sequences) {
    const std::vector<Sequence> sequences {
        Sequence { "Alpha", "ACGTACGTAC" },
        Sequence { "Beta", "ACGTTCGTAC" },
        Sequence { "Gamma", "ACGACGTAC" },
        Sequence { "Delta", "TTGTACCTACGG" },
        Sequence { "Epsilon", "ACGTACGTAC" }
    };
    const Result<DistanceMatrix> r = buildDistanceMatrix(alignAll(sequences));
    ASSERT_TRUE(r.ok()) << r.error().reason;
    const DistanceMatrix& m = r.value();
    const std::vector<SequenceId> expectedIds { 0, 1, 2, 3, 4 };
    EXPECT_EQ(expectedIds, m.ids);
    checkSymmetricZeroDiagonal(m);
    EXPECT_EQ(0.0, m(0, 4));
    EXPECT_GT(m(0, 1), 0.0);
    EXPECT_GT(m(0, 3), m(0, 1));
}
