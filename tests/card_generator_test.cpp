#include "gtest/gtest.h"

#include <numeric>
#include <set>

#include "card.hpp"
#include "card_generator.hpp"

using namespace bingo;

// -----------------------------------------------------------------------------
// Column distribution
// -----------------------------------------------------------------------------
TEST(ColumnDistribution, CountsStayInBoundsAndSumToFifteen){
    CardGenerator gen(12345);
    for(int i = 0; i < 2000; ++i){
        ColumnCounts counts{};
        ASSERT_EQ(gen.column_distribution(counts), "");
        EXPECT_EQ(std::accumulate(counts.begin(), counts.end(), 0), kNumbersPerCard);
        for(int c : counts){
            EXPECT_GE(c, 1);
            EXPECT_LE(c, kMaxPerColumn);
        }
    }
}

TEST(ColumnDistribution, EveryColumnSometimesGetsThree){
    // Not a uniformity test; only checks that no column is starved.
    CardGenerator gen(777);
    std::set<int> seen_three;
    for(int i = 0; i < 2000; ++i){
        ColumnCounts counts{};
        ASSERT_EQ(gen.column_distribution(counts), "");
        for(int col = 0; col < kCols; ++col){
            if(counts[col] == 3) seen_three.insert(col);
        }
    }
    EXPECT_EQ(seen_three.size(), static_cast<size_t>(kCols));
}

// -----------------------------------------------------------------------------
// Row assignment, in isolation from the rest of the pipeline
// -----------------------------------------------------------------------------
static void expect_marks_match(const Grid& marks, const ColumnCounts& counts){
    for(int row = 0; row < kRows; ++row){
        int n = 0;
        for(int col = 0; col < kCols; ++col) n += marks[row][col] != kEmpty ? 1 : 0;
        EXPECT_EQ(n, kNumbersPerRow) << "row " << row;
    }
    for(int col = 0; col < kCols; ++col){
        int n = 0;
        for(int row = 0; row < kRows; ++row) n += marks[row][col] != kEmpty ? 1 : 0;
        EXPECT_EQ(n, counts[col]) << "column " << col;
    }
}

TEST(RowAssignment, HonoursThreeFullColumns){
    CardGenerator gen(1);
    const ColumnCounts counts{{3, 3, 3, 1, 1, 1, 1, 1, 1}};
    for(int i = 0; i < 500; ++i){
        Grid marks{};
        ASSERT_EQ(gen.row_assignment(counts, marks), "");
        expect_marks_match(marks, counts);
    }
}

TEST(RowAssignment, HonoursGeneratedDistributions){
    CardGenerator gen(2);
    for(int i = 0; i < 2000; ++i){
        ColumnCounts counts{};
        ASSERT_EQ(gen.column_distribution(counts), "");
        Grid marks{};
        // Gale-Ryser pruning means the solver never dead-ends on feasible input.
        ASSERT_EQ(gen.row_assignment(counts, marks), "");
        expect_marks_match(marks, counts);
    }
}

TEST(RowAssignment, RejectsInfeasibleCounts){
    CardGenerator gen(3);
    Grid marks{};
    const ColumnCounts too_many{{3, 3, 3, 3, 1, 1, 1, 1, 1}};
    EXPECT_NE(gen.row_assignment(too_many, marks), "");
    const ColumnCounts empty_column{{0, 3, 3, 2, 2, 2, 1, 1, 1}};
    EXPECT_NE(gen.row_assignment(empty_column, marks), "");
}

// -----------------------------------------------------------------------------
// Number fill
// -----------------------------------------------------------------------------
TEST(FillNumbers, PlacesAscendingValuesOnlyOnMarks){
    CardGenerator gen(4);
    Grid marks{};
    for(int col = 0; col < kCols; ++col){
        for(int row = 0; row < kRows; ++row) marks[row][col] = 1;
    }
    for(int i = 0; i < 200; ++i){
        Grid out{};
        gen.fill_numbers(marks, out);
        for(int col = 0; col < kCols; ++col){
            const auto range = column_range(col);
            for(int row = 0; row < kRows; ++row){
                EXPECT_GE(out[row][col], range.lo);
                EXPECT_LE(out[row][col], range.hi);
                if(row > 0) EXPECT_LT(out[row - 1][col], out[row][col]);
            }
        }
    }

    Grid sparse{};
    sparse[1][4] = 1;
    Grid out{};
    gen.fill_numbers(sparse, out);
    for(int row = 0; row < kRows; ++row){
        for(int col = 0; col < kCols; ++col){
            if(row == 1 && col == 4){
                EXPECT_GE(out[row][col], 40);
                EXPECT_LE(out[row][col], 49);
            } else{
                EXPECT_EQ(out[row][col], kEmpty);
            }
        }
    }
}

// -----------------------------------------------------------------------------
// generate_one()
// -----------------------------------------------------------------------------
TEST(GenerateOne, FiftyCardsAreStructurallyValid){
    CardGenerator gen;
    for(int i = 0; i < 50; ++i){
        Card card;
        ASSERT_EQ(gen.generate_one(card), "");
        EXPECT_EQ(validate(card), "") << card;

        for(int row = 0; row < kRows; ++row){
            if(card.filled(row, 0)){
                EXPECT_GE(card.at(row, 0), 1);
                EXPECT_LE(card.at(row, 0), 9);
            }
            if(card.filled(row, 8)){
                EXPECT_GE(card.at(row, 8), 80);
                EXPECT_LE(card.at(row, 8), 90);
            }
        }

        std::set<int> values;
        for(int row = 0; row < kRows; ++row){
            for(int col = 0; col < kCols; ++col){
                if(card.filled(row, col)) values.insert(card.at(row, col));
            }
        }
        EXPECT_EQ(values.size(), static_cast<size_t>(kNumbersPerCard));
    }
}

TEST(GenerateOne, SameSeedAndStreamReproduceCards){
    CardGenerator a(42, 0);
    CardGenerator b(42, 0);
    for(int i = 0; i < 20; ++i){
        Card ca, cb;
        ASSERT_EQ(a.generate_one(ca), "");
        ASSERT_EQ(b.generate_one(cb), "");
        EXPECT_EQ(ca, cb);
    }
}

TEST(GenerateOne, DifferentStreamsDiverge){
    CardGenerator a(42, 0);
    CardGenerator b(42, 1);
    int same = 0;
    for(int i = 0; i < 20; ++i){
        Card ca, cb;
        ASSERT_EQ(a.generate_one(ca), "");
        ASSERT_EQ(b.generate_one(cb), "");
        if(ca == cb) ++same;
    }
    EXPECT_EQ(same, 0);
}

TEST(GenerateOne, BackToBackEntropySeededGeneratorsDiffer){
    CardGenerator a;
    CardGenerator b;
    Card ca, cb;
    ASSERT_EQ(a.generate_one(ca), "");
    ASSERT_EQ(b.generate_one(cb), "");
    EXPECT_NE(ca, cb);
}

TEST(GenerateOne, StatsCountAcceptedCards){
    CardGenerator gen(9);
    EXPECT_EQ(gen.stats().attempts, 0u);
    for(int i = 0; i < 25; ++i){
        Card card;
        ASSERT_EQ(gen.generate_one(card), "");
    }
    const auto s = gen.stats();
    EXPECT_EQ(s.accepted, 25u);
    EXPECT_GE(s.attempts, s.accepted);
    EXPECT_EQ(s.rejected_duplicate, 0u);
    EXPECT_EQ(s.rejected_invalid, 0u);

    // stats() has no side effects.
    const auto again = gen.stats();
    EXPECT_EQ(again.attempts, s.attempts);
    EXPECT_EQ(again.accepted, s.accepted);
}
