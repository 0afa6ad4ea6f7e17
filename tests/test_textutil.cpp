#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "textutil.hpp"

using bayestext::tokenize;
using Tokens = std::vector<std::string>;

TEST(Tokenize, LowercasesAndSplitsOnPunctuation) {
    EXPECT_EQ(tokenize("Hello, World!"), (Tokens{"hello", "world"}));
    EXPECT_EQ(tokenize("t-bone beef ribs."), (Tokens{"t", "bone", "beef", "ribs"}));
    EXPECT_EQ(tokenize("SALAMI\tpancetta\nBeef"), (Tokens{"salami", "pancetta", "beef"}));
}

TEST(Tokenize, DropsEmptyTokens) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("   ,,;  --  \n").empty());
    EXPECT_EQ(tokenize("  pea,,  okra  "), (Tokens{"pea", "okra"}));
}

TEST(Tokenize, KeepsDigitsAndRepeats) {
    EXPECT_EQ(tokenize("R2D2 pea pea"), (Tokens{"r2d2", "pea", "pea"}));
}

TEST(Tokenize, KeepsUtf8WordsWhole) {
    // "Jícama" with an accented i
    EXPECT_EQ(tokenize("J\xC3\xAD" "cama!"), (Tokens{"j\xC3\xAD" "cama"}));
}

TEST(Tokenize, IsRepeatable) {
    const std::string text = "Pork chop, shank shoulder; t-bone beef ribs drumstick.";
    EXPECT_EQ(tokenize(text), tokenize(text));
}
