/**
 * @file shape_conversions_tests.cpp
 * @brief Unit tests for embedding fixed shapes into FreeDiagram.
 */
#include <gtest/gtest.h>
#include "freediag/finset/fin_set.hpp"
#include "freediag/graph/shape_conversions.hpp"

using namespace freediag;

class ShapeConversionsTests : public ::testing::Test
{
protected:
    FinSet A{2};
    FinSet B{3};
    FinSet C{4};
    FinFunction f{{0, 2}, B};        // A -> B
    FinFunction g{{1, 3}, C};        // A -> C
    FinFunction h{{1, 1}, B};        // A -> B
    FinFunction k{{2, 2, 0, 1}, B};  // C -> B
};

// ============================================================================
// Span
// ============================================================================

TEST_F(ShapeConversionsTests, Span_ThreeVerticesTwoEdges)
{
    auto d = to_free_diagram(make_span(f, g));

    ASSERT_EQ(d.vertex_count(), 3u);
    ASSERT_EQ(d.edge_count(), 2u);
    EXPECT_EQ(d.ob(0), A);
    EXPECT_EQ(d.ob(1), B);
    EXPECT_EQ(d.ob(2), C);
    EXPECT_EQ(d.out_edges(0), (std::vector<EdgeIdx>{0, 1}));
    EXPECT_EQ(d.hom(0), f);
    EXPECT_EQ(d.hom(1), g);
    EXPECT_EQ(d.tgt(0), 1u);
    EXPECT_EQ(d.tgt(1), 2u);
    EXPECT_TRUE(d.get_diagnostics()->is_valid());
}

TEST_F(ShapeConversionsTests, Multispan_ApexIsUniqueSource)
{
    Multispan<FinFunction> span({f, g, h, f});
    auto d = to_free_diagram(span);

    ASSERT_EQ(d.vertex_count(), 5u);
    ASSERT_EQ(d.edge_count(), 4u);
    for (EdgeIdx e : d.edges())
    {
        EXPECT_EQ(d.src(e), 0u);
        EXPECT_EQ(d.tgt(e), e + 1);
        EXPECT_EQ(d.hom(e), span.leg(e));
    }
    EXPECT_TRUE(d.in_edges(0).empty());
}

TEST_F(ShapeConversionsTests, Span_InputUnchanged)
{
    const auto span = make_span(f, g);
    const auto copy = span;
    (void)to_free_diagram(span);
    EXPECT_EQ(span, copy);
}

TEST_F(ShapeConversionsTests, Span_InconsistentTrustedApex_Rejected)
{
    // The trusted constructor accepts a wrong apex; the embedding does not.
    Multispan<FinFunction> span(C, {f, g});
    try
    {
        (void)to_free_diagram(span);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
    }
}

// ============================================================================
// Cospan
// ============================================================================

TEST_F(ShapeConversionsTests, Cospan_BaseIsLastVertex)
{
    auto d = to_free_diagram(make_cospan(f, k));

    ASSERT_EQ(d.vertex_count(), 3u);
    ASSERT_EQ(d.edge_count(), 2u);
    EXPECT_EQ(d.ob(0), A);
    EXPECT_EQ(d.ob(1), C);
    EXPECT_EQ(d.ob(2), B);
    EXPECT_EQ(d.in_edges(2), (std::vector<EdgeIdx>{0, 1}));
    EXPECT_EQ(d.src(0), 0u);
    EXPECT_EQ(d.src(1), 1u);
    EXPECT_EQ(d.hom(0), f);
    EXPECT_EQ(d.hom(1), k);
    EXPECT_TRUE(d.get_diagnostics()->is_valid());
}

TEST_F(ShapeConversionsTests, Multicospan_BaseIsUniqueTarget)
{
    Multicospan<FinFunction> cospan({k, f, h});
    auto d = to_free_diagram(cospan);

    ASSERT_EQ(d.vertex_count(), 4u);
    const VertexIdx base = d.vertex_count() - 1;
    EXPECT_EQ(d.ob(base), B);
    for (EdgeIdx e : d.edges())
    {
        EXPECT_EQ(d.src(e), e);
        EXPECT_EQ(d.tgt(e), base);
        EXPECT_EQ(d.hom(e), cospan.leg(e));
    }
    EXPECT_TRUE(d.out_edges(base).empty());
}

// ============================================================================
// Parallel morphisms
// ============================================================================

TEST_F(ShapeConversionsTests, ParallelPair_TwoVerticesTwoEdges)
{
    auto d = to_free_diagram(make_parallel_pair(f, h));

    ASSERT_EQ(d.vertex_count(), 2u);
    ASSERT_EQ(d.edge_count(), 2u);
    EXPECT_EQ(d.vertices(), (std::vector<VertexIdx>{0, 1}));
    EXPECT_EQ(d.edges(), (std::vector<EdgeIdx>{0, 1}));
    EXPECT_EQ(ob(d, 0), A);
    EXPECT_EQ(ob(d, 1), B);
    EXPECT_EQ(hom(d, 0), f);
    EXPECT_EQ(hom(d, 1), h);
    for (EdgeIdx e : d.edges())
    {
        EXPECT_EQ(d.src(e), 0u);
        EXPECT_EQ(d.tgt(e), 1u);
    }
}

TEST_F(ShapeConversionsTests, ParallelMorphisms_KeepsOrder)
{
    ParallelMorphisms<FinFunction> para({h, f, h});
    auto d = to_free_diagram(para);
    ASSERT_EQ(d.edge_count(), 3u);
    EXPECT_EQ(d.homs(), para.homs());
}

// ============================================================================
// Determinism
// ============================================================================

TEST_F(ShapeConversionsTests, Conversion_IsIdempotent)
{
    const auto span = make_span(f, g);
    const auto cospan = make_cospan(f, k);
    const auto pair = make_parallel_pair(f, h);

    EXPECT_EQ(to_free_diagram(span), to_free_diagram(span));
    EXPECT_EQ(to_free_diagram(cospan), to_free_diagram(cospan));
    EXPECT_EQ(to_free_diagram(pair), to_free_diagram(pair));
}

TEST_F(ShapeConversionsTests, Conversion_EqualsBulkConstruction)
{
    FreeDiagram<FinFunction> bulk({A, B, C}, {{0, 1, f}, {0, 2, g}});
    EXPECT_EQ(to_free_diagram(make_span(f, g)), bulk);
}
