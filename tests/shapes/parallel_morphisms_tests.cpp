#include <gtest/gtest.h>
#include "freediag/finset/fin_set.hpp"
#include "freediag/shapes/parallel_morphisms.hpp"

using namespace freediag;

class ParallelMorphismsTests : public ::testing::Test
{
protected:
    FinSet A{2};
    FinSet B{3};
    FinFunction f{{0, 2}, B};        // A -> B
    FinFunction g{{1, 1}, B};        // A -> B
    FinFunction k{{0, 1}, A};        // A -> A
    FinFunction m{{0, 0, 0}, B};     // B -> B
    FinFunction n{{0, 0, 1}, A};     // B -> A
};

TEST_F(ParallelMorphismsTests, FromHoms_DerivesDomAndCodom)
{
    ParallelMorphisms<FinFunction> para({f, g, f});
    EXPECT_EQ(para.dom(), A);
    EXPECT_EQ(para.codom(), B);
    EXPECT_EQ(para.size(), 3u);
}

TEST_F(ParallelMorphismsTests, FromHoms_CodomainMismatch_Throws)
{
    try
    {
        ParallelMorphisms<FinFunction> para({f, k});
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
        std::string msg = e.what();
        EXPECT_NE(msg.find("codomains"), std::string::npos) << msg;
        EXPECT_EQ(msg.find(" domains of"), std::string::npos) << msg;
    }
}

TEST_F(ParallelMorphismsTests, FromHoms_DomainMismatch_Throws)
{
    try
    {
        ParallelMorphisms<FinFunction> para({f, m});
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
        std::string msg = e.what();
        EXPECT_NE(msg.find("domains of hom(s) 1"), std::string::npos) << msg;
        EXPECT_EQ(msg.find("codomains"), std::string::npos) << msg;
    }
}

TEST_F(ParallelMorphismsTests, FromHoms_Empty_Throws)
{
    EXPECT_THROW(ParallelMorphisms<FinFunction>(std::vector<FinFunction>{}), DiagramError);
}

TEST_F(ParallelMorphismsTests, MakeParallelPair_Valid)
{
    ParallelPair<FinFunction> pair = make_parallel_pair(f, g);
    EXPECT_TRUE(pair.is_pair());
    EXPECT_EQ(pair.dom(), A);
    EXPECT_EQ(pair.codom(), B);
    EXPECT_EQ(pair[0], f);
    EXPECT_EQ(pair[1], g);
}

TEST_F(ParallelMorphismsTests, MakeParallelPair_ReportsDomainMismatch)
{
    try
    {
        make_parallel_pair(f, m);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
        EXPECT_STREQ(e.what(), "Domains of parallel pair do not match");
    }
}

TEST_F(ParallelMorphismsTests, MakeParallelPair_ReportsCodomainMismatch)
{
    try
    {
        make_parallel_pair(f, k);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
        EXPECT_STREQ(e.what(), "Codomains of parallel pair do not match");
    }
}

TEST_F(ParallelMorphismsTests, MakeParallelPair_ReportsBothMismatched)
{
    try
    {
        make_parallel_pair(f, n);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
        EXPECT_STREQ(e.what(), "Domains and codomains of parallel pair do not match");
    }
}

TEST_F(ParallelMorphismsTests, IndexedAccess_OutOfRange)
{
    ParallelMorphisms<FinFunction> para({f, g, f});
    EXPECT_EQ(para.at(2), f);
    try
    {
        (void)para[3];
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::IndexOutOfRange);
        std::string msg = e.what();
        EXPECT_NE(msg.find("3"), std::string::npos) << msg;
    }
}

TEST_F(ParallelMorphismsTests, FirstAndLastIndex)
{
    ParallelMorphisms<FinFunction> para({f, g, f, g});
    EXPECT_EQ(para.first_index(), 0u);
    EXPECT_EQ(para.last_index(), 3u);
    EXPECT_EQ(para[para.last_index()], g);
}

TEST_F(ParallelMorphismsTests, HomsPreservesOrder)
{
    ParallelMorphisms<FinFunction> para({g, f});
    ASSERT_EQ(para.homs().size(), 2u);
    EXPECT_EQ(para.homs()[0], g);
    EXPECT_EQ(para.homs()[1], f);
}

TEST_F(ParallelMorphismsTests, Hom_IsFullSequence)
{
    ParallelMorphisms<FinFunction> para({f, g, f});
    EXPECT_EQ(para.hom(), (std::vector<FinFunction>{f, g, f}));
    EXPECT_EQ(&para.hom(), &para.homs());
}

TEST_F(ParallelMorphismsTests, Equality)
{
    EXPECT_EQ(make_parallel_pair(f, g), ParallelMorphisms<FinFunction>({f, g}));
    EXPECT_NE(make_parallel_pair(f, g), make_parallel_pair(g, f));
    EXPECT_NE(ParallelMorphisms<FinFunction>(A, B, {f}), ParallelMorphisms<FinFunction>(A, A, {f}));
}
