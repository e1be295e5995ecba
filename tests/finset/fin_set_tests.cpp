#include <gtest/gtest.h>
#include "freediag/common/category_traits.hpp"
#include "freediag/common/diagram_exceptions.hpp"
#include "freediag/finset/fin_set.hpp"
#include <sstream>

using namespace freediag;

TEST(FinSetTests, Equality_BySize)
{
    EXPECT_EQ(FinSet(3), FinSet(3));
    EXPECT_NE(FinSet(3), FinSet(2));
}

TEST(FinFunctionTests, DomainIsTableSize)
{
    FinFunction f({0, 2, 2}, FinSet(3));
    EXPECT_EQ(f.dom(), FinSet(3));
    EXPECT_EQ(f.codom(), FinSet(3));
    EXPECT_EQ(f(1), 2u);
}

TEST(FinFunctionTests, ValueOutsideCodomain_InvalidMorphism)
{
    try
    {
        FinFunction f({0, 3}, FinSet(3));
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::InvalidMorphism);
    }
}

TEST(FinFunctionTests, TableSizeMismatch_InvalidMorphism)
{
    try
    {
        FinFunction f(FinSet(3), FinSet(2), {0, 1});
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::InvalidMorphism);
    }
}

TEST(FinFunctionTests, Evaluate_OutOfRange)
{
    FinFunction f({1}, FinSet(2));
    try
    {
        (void)f(1);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::IndexOutOfRange);
    }
}

TEST(FinFunctionTests, Identity)
{
    auto id = FinFunction::identity(FinSet(3));
    EXPECT_EQ(id.values(), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(id.dom(), id.codom());
}

TEST(FinFunctionTests, Compose_DiagrammaticOrder)
{
    FinFunction f({0, 2}, FinSet(3));       // 2 -> 3
    FinFunction g({1, 1, 0}, FinSet(2));    // 3 -> 2
    auto fg = compose(f, g);
    EXPECT_EQ(fg.dom(), FinSet(2));
    EXPECT_EQ(fg.codom(), FinSet(2));
    EXPECT_EQ(fg.values(), (std::vector<size_t>{1, 0}));
}

TEST(FinFunctionTests, Compose_WithIdentity)
{
    FinFunction f({0, 2}, FinSet(3));
    EXPECT_EQ(compose(FinFunction::identity(f.dom()), f), f);
    EXPECT_EQ(compose(f, FinFunction::identity(f.codom())), f);
}

TEST(FinFunctionTests, Compose_Mismatch_ShapeMismatch)
{
    FinFunction f({0, 2}, FinSet(3));
    try
    {
        (void)compose(f, f);
        FAIL() << "Expected DiagramError";
    }
    catch (const DiagramError& e)
    {
        EXPECT_EQ(e.code(), DiagramErrorCode::ShapeMismatch);
    }
}

TEST(FinFunctionTests, Traits_UseMembers)
{
    FinFunction f({0, 2}, FinSet(3));
    static_assert(std::is_same_v<CategoryTraits<FinFunction>::Ob, FinSet>,
                  "FinFunction objects are FinSets");
    EXPECT_EQ(CategoryTraits<FinFunction>::dom(f), FinSet(2));
    EXPECT_EQ(CategoryTraits<FinFunction>::codom(f), FinSet(3));
}

TEST(FinFunctionTests, Printing)
{
    std::ostringstream oss;
    oss << FinFunction({0, 2}, FinSet(3));
    EXPECT_EQ(oss.str(), "FinFunction(2 -> 3: [0, 2])");
}
