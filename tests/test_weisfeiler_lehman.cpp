#include <gtest/gtest.h>
#include <rdf2vec/weisfeiler_lehman.hpp>
#include <rdf2vec/digest.hpp>
#include <rdf2vec/job_types.hpp>
#include "test_helpers.hpp"
#include <stdexcept>
#include <string>

using namespace rdf2vec;

class WeisfeilerLehmanTest : public ::testing::Test {
protected:
    KnowledgeGraph chain = test_utils::create_chain_graph();

    Vertex predicate_named(const KnowledgeGraph& kg, const std::string& name) {
        for (const auto& v : kg.all_vertices()) {
            if (v.is_predicate() && v.name() == name) return v;
        }
        throw std::runtime_error("no predicate " + name);
    }
};

TEST_F(WeisfeilerLehmanTest, CompositeLabelSortsAndDeduplicates) {
    EXPECT_EQ(WeisfeilerLehman::composite_label("v", {"c", "a", "b", "a"}), "v-a-b-c");
    EXPECT_EQ(WeisfeilerLehman::composite_label("v", {}), "v-");
    EXPECT_EQ(WeisfeilerLehman::composite_label("v", {"x"}), "v-x");
}

TEST_F(WeisfeilerLehmanTest, RoundZeroIsName) {
    WeisfeilerLehman wl(3);
    auto result = wl.relabel(chain);

    ASSERT_EQ(result.labels.size(), chain.num_vertices());
    for (const auto& v : chain.all_vertices()) {
        ASSERT_EQ(result.labels.at(v).size(), 4u);
        EXPECT_EQ(result.label(v, 0), v.name());
    }
}

TEST_F(WeisfeilerLehmanTest, RoundOneOfChain) {
    WeisfeilerLehman wl(1);
    auto result = wl.relabel(chain);

    Vertex p = predicate_named(chain, "p");
    Vertex q = predicate_named(chain, "q");

    EXPECT_EQ(result.label(p, 1), md5_hex("p-A"));
    EXPECT_EQ(result.label(*chain.entity("B"), 1), md5_hex("B-p"));
    EXPECT_EQ(result.label(q, 1), md5_hex("q-B"));
    EXPECT_EQ(result.label(*chain.entity("C"), 1), md5_hex("C-q"));
}

TEST_F(WeisfeilerLehmanTest, LeafWithoutInverseNeighborsHasEmptySuffix) {
    WeisfeilerLehman wl(3);
    auto result = wl.relabel(chain);
    Vertex a = *chain.entity("A");

    std::string expected = "A";
    for (std::size_t n = 1; n <= 3; ++n) {
        expected = md5_hex(expected + "-");
        EXPECT_EQ(result.label(a, n), expected) << "round " << n;
    }
}

TEST_F(WeisfeilerLehmanTest, LaterRoundsUsePreviousRoundLabels) {
    WeisfeilerLehman wl(2);
    auto result = wl.relabel(chain);
    Vertex b = *chain.entity("B");
    Vertex p = predicate_named(chain, "p");

    EXPECT_EQ(result.label(b, 2), md5_hex(result.label(b, 1) + "-" + result.label(p, 1)));
}

TEST_F(WeisfeilerLehmanTest, DuplicateNeighborLabelsCountOnce) {
    // B is reached through two "p" occurrences from the same subject A
    auto kg = test_utils::create_test_graph({{"A", "p", "B"}, {"A", "p", "B"}});
    WeisfeilerLehman wl(2);
    auto result = wl.relabel(kg);

    Vertex b = *kg.entity("B");
    EXPECT_EQ(kg.inverse_neighbors(b).size(), 2u);
    EXPECT_EQ(result.label(b, 1), md5_hex("B-p"));
}

TEST_F(WeisfeilerLehmanTest, InvariantUnderEnumerationOrder) {
    auto kg = test_utils::create_test_graph({
        {"A", "p", "C"}, {"B", "q", "C"}, {"D", "r", "C"},
        {"C", "s", "E"}, {"A", "s", "E"}, {"E", "p", "A"}});
    test_utils::ReversedGraph reversed(kg);

    WeisfeilerLehman wl(4);
    auto forward = wl.relabel(kg);
    auto backward = wl.relabel(reversed);

    EXPECT_EQ(forward.labels, backward.labels);
}

TEST_F(WeisfeilerLehmanTest, RelabelingIsIdempotent) {
    WeisfeilerLehman wl(4);
    auto first = wl.relabel(chain);
    auto second = wl.relabel(chain);

    EXPECT_EQ(first.labels, second.labels);
    EXPECT_EQ(first.inverse_labels, second.inverse_labels);
}

TEST_F(WeisfeilerLehmanTest, PredicateLabelsDependOnSubject) {
    // X and Y are each reached by one "p" occurrence from a different source
    auto kg = test_utils::create_test_graph({{"S", "p", "X"}, {"T", "p", "Y"}});
    WeisfeilerLehman wl(2);
    auto result = wl.relabel(kg);

    // Names differ, so labels differ from round 0 on
    EXPECT_NE(result.label(*kg.entity("X"), 1), result.label(*kg.entity("Y"), 1));
    // The two predicate occurrences only differ by their subject
    Vertex px = kg.inverse_neighbors(*kg.entity("X"))[0];
    Vertex py = kg.inverse_neighbors(*kg.entity("Y"))[0];
    EXPECT_EQ(result.label(px, 1), md5_hex("p-S"));
    EXPECT_EQ(result.label(py, 1), md5_hex("p-T"));
}

TEST_F(WeisfeilerLehmanTest, InverseMapRecordsRounds) {
    WeisfeilerLehman wl(2);
    auto result = wl.relabel(chain);
    Vertex b = *chain.entity("B");

    const auto& inverse = result.inverse_labels.at(b);
    EXPECT_EQ(inverse.at("B"), 0u);
    EXPECT_EQ(inverse.at(result.label(b, 1)), 1u);
    EXPECT_EQ(inverse.at(result.label(b, 2)), 2u);
}

TEST_F(WeisfeilerLehmanTest, ZeroIterationsOnlyNames) {
    WeisfeilerLehman wl(0);
    auto result = wl.relabel(chain);
    for (const auto& v : chain.all_vertices()) {
        EXPECT_EQ(result.labels.at(v), std::vector<std::string>{v.name()});
    }
}

TEST_F(WeisfeilerLehmanTest, UnknownVertexLookupThrows) {
    WeisfeilerLehman wl(1);
    auto result = wl.relabel(chain);
    VertexRegistry other;
    EXPECT_THROW(result.label(other.create("Z"), 0), std::out_of_range);
    EXPECT_THROW(result.label(*chain.entity("A"), 2), std::out_of_range);
}

TEST_F(WeisfeilerLehmanTest, ParallelMatchesSequential) {
    // Large enough to be split into several relabeling jobs
    KnowledgeGraph kg;
    for (int i = 0; i < 400; ++i) {
        kg.add_triple("e" + std::to_string(i), "r" + std::to_string(i % 7),
                      "e" + std::to_string((i * 31 + 5) % 400));
    }

    ExtractionJobSystem jobs(4);
    jobs.start();

    auto sequential = WeisfeilerLehman(3).relabel(kg);
    auto parallel = WeisfeilerLehman(3, &jobs).relabel(kg);

    jobs.shutdown();
    EXPECT_EQ(sequential.labels, parallel.labels);
}
