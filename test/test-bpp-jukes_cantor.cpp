#include <memory>
#include <string>
#include "gtest/gtest.h"
#include "jukes_cantor.hpp"
#include "needleman_wunsch.hpp"

#include <Bpp/Phyl/Likelihood/RHomogeneousTreeLikelihood.h>
#include <Bpp/Phyl/Model/Nucleotide/JCnuc.h>
#include <Bpp/Phyl/Model/RateDistributionFactory.h>
#include <Bpp/Phyl/TreeTemplate.h>
#include <Bpp/Seq/Alphabet/AlphabetTools.h>
#include <Bpp/Seq/Container/VectorSiteContainer.h>
#include <Bpp/Seq/Sequence.h>

using namespace align_dist;

/// Log-likelihood of two ungapped sequences under JC69 at total distance `distance`
double jcLogLikelihood(const std::string& a, const std::string& b, const double distance)
{
    const bpp::Alphabet* alphabet = &bpp::AlphabetTools::DNA_ALPHABET;
    bpp::JCnuc model(&bpp::AlphabetTools::DNA_ALPHABET);

    bpp::VectorSiteContainer sites(alphabet);
    sites.addSequence(bpp::BasicSequence("A", a, alphabet));
    sites.addSequence(bpp::BasicSequence("B", b, alphabet));

    bpp::Node *root = new bpp::Node(0),
        *c1 = new bpp::Node(1, sites.getSequence(0).getName()),
        *c2 = new bpp::Node(2, sites.getSequence(1).getName());
    root->addSon(c1);
    root->addSon(c2);
    c1->setDistanceToFather(distance / 2);
    c2->setDistanceToFather(distance / 2);
    bpp::TreeTemplate<bpp::Node> tree(root);

    bpp::RateDistributionFactory fac(1);
    std::unique_ptr<bpp::DiscreteDistribution> rates(fac.createDiscreteDistribution("Constant"));

    bpp::RHomogeneousTreeLikelihood calc(tree, sites, &model, rates.get(), true, false);
    calc.initialize();
    calc.computeTreeLikelihood();
    return calc.getLogLikelihood();
}

void checkMaximizesLikelihood(const std::string& a, const std::string& b)
{
    const Result<double> d = jukesCantorDistance(a, b);
    ASSERT_TRUE(d.ok());
    ASSERT_GT(d.value(), 0.0);
    ASSERT_LT(d.value(), JC_SATURATION_DISTANCE);

    const double ll = jcLogLikelihood(a, b, d.value());
    EXPECT_GT(ll, jcLogLikelihood(a, b, d.value() * 0.95)) << "distance " << d.value();
    EXPECT_GT(ll, jcLogLikelihood(a, b, d.value() * 1.05)) << "distance " << d.value();
}

TEST(JukesCantorBpp, one_in_four) {
    checkMaximizesLikelihood("AAAA", "ATAA");
}

TEST(JukesCantorBpp, longer_pair) {
    checkMaximizesLikelihood("ACGGTACCGTAACGGTACCGTAACGATCGA",
                             "ACTTTGGCGTCATGGTACCGTAACGATCCA");
}

TEST(JukesCantorBpp, aligned_without_gaps) {
    NeedlemanWunsch nw;
    const AlignedPair p = nw.align("ACGTACGTTGCAACGT", "ACGAACGTTGCTACGT");
    ASSERT_EQ(std::string::npos, p.first.find('-'));
    ASSERT_EQ(std::string::npos, p.second.find('-'));
    checkMaximizesLikelihood(p.first, p.second);
}
