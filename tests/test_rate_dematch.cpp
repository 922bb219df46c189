#include <gtest/gtest.h>
#include "droneid/constants.hpp"
#include "droneid/utils/rate_match.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <vector>
using namespace droneid;
using namespace droneid::utils;

TEST(RateDematch, InterleaverGeometryForSystematicStream) {
    const auto M = make_subblock_interleaver(kSystematicBits);
    EXPECT_EQ(M.rows, 45u);
    EXPECT_EQ(M.cols, 32u);
    EXPECT_EQ(M.n_dummy, 28u);
    ASSERT_EQ(M.map.size(), kSystematicBits);
    // Column 0 first (45 rows), then column 1.
    EXPECT_EQ(M.map[0], 0u);
    EXPECT_EQ(M.map[1], 32u);
    EXPECT_EQ(M.map[44], 1408u);
    EXPECT_EQ(M.map[45], 1u);
    EXPECT_EQ(M.map[46], 33u);

    auto sorted = M.map;
    std::sort(sorted.begin(), sorted.end());
    for (uint32_t i = 0; i < sorted.size(); ++i) ASSERT_EQ(sorted[i], i);
}

TEST(RateDematch, InvertsTheInterleaveWithoutDummies) {
    std::mt19937 gen(5);
    std::vector<uint8_t> natural(kSystematicBits);
    for (auto& b : natural) b = static_cast<uint8_t>(gen() & 1u);

    const auto M = make_subblock_interleaver(kSystematicBits);
    std::vector<uint8_t> tx(kSystematicBits);
    for (size_t k = 0; k < tx.size(); ++k) tx[k] = natural[M.map[k]];

    const auto out = rate_dematch(tx);
    ASSERT_EQ(out.size(), kSystematicBits);
    for (uint8_t v : out) EXPECT_LE(v, 1u);
    EXPECT_EQ(out, natural);
}

TEST(RateDematch, ColumnMajorCellsReadBackRowMajor) {
    // 1412 = 44 * 32 + 4: columns 0..3 hold 45 rows, the rest 44.
    const uint32_t n = kSystematicBits;
    const uint32_t full_rows = n / 32, long_cols = n % 32;
    std::vector<uint32_t> expected;
    for (uint32_t c = 0; c < 32; ++c) {
        const uint32_t rows = full_rows + (c < long_cols ? 1u : 0u);
        for (uint32_t r = 0; r < rows; ++r) expected.push_back(r * 32 + c);
    }
    ASSERT_EQ(expected.size(), n);

    for (size_t k : {0u, 1u, 44u, 45u, 46u, 179u, 180u, 181u, 700u, 1411u}) {
        std::vector<uint8_t> in(n, 0);
        in[k] = 1;
        const auto out = rate_dematch(in);
        ASSERT_EQ(out.size(), n);
        const auto it = std::find(out.begin(), out.end(), uint8_t{1});
        ASSERT_NE(it, out.end());
        EXPECT_EQ(static_cast<uint32_t>(it - out.begin()), expected[k]) << "k=" << k;
    }
    EXPECT_EQ(expected[45], 1u);
    EXPECT_EQ(expected[46], 33u);
    EXPECT_EQ(expected[180], 4u);
    EXPECT_EQ(expected[1411], 1407u);
}

TEST(RateDematch, SamePermutationEveryCall) {
    // One-hot inputs at a few positions.
    for (size_t pos : {0u, 1u, 44u, 45u, 700u, 1411u}) {
        std::vector<uint8_t> in(kSystematicBits, 0);
        in[pos] = 1;
        const auto a = rate_dematch(in);
        const auto b = rate_dematch(in);
        EXPECT_EQ(a, b);
        EXPECT_EQ(std::accumulate(a.begin(), a.end(), 0), 1);
    }
}

TEST(RateDematch, OtherLengthsAndEdgeCases) {
    EXPECT_TRUE(rate_dematch({}).empty());
    EXPECT_THROW(make_subblock_interleaver(0), std::invalid_argument);
    for (uint32_t n : {1u, 31u, 32u, 33u, 640u}) {
        const auto M = make_subblock_interleaver(n);
        std::vector<uint8_t> natural(n);
        for (uint32_t i = 0; i < n; ++i) natural[i] = static_cast<uint8_t>((i * 13) % 3 == 1);
        std::vector<uint8_t> tx(n);
        for (uint32_t k = 0; k < n; ++k) tx[k] = natural[M.map[k]];
        EXPECT_EQ(rate_dematch(tx), natural) << "n=" << n;
    }
}
