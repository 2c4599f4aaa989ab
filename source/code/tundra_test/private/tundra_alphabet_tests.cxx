#include <tundra/tundra_alphabet.hxx>
#include <gtest/gtest.h>

namespace
{

    TEST(AlphabetTest, AssignsIndicesInFirstOccurrenceOrder)
    {
        tundra::Alphabet const alphabet{ "cabca" };

        EXPECT_EQ(alphabet.size(), 3u);
        EXPECT_EQ(alphabet.index_of('c'), 0u);
        EXPECT_EQ(alphabet.index_of('a'), 1u);
        EXPECT_EQ(alphabet.index_of('b'), 2u);
        EXPECT_EQ(alphabet.character(2), 'b');
        EXPECT_EQ(alphabet.characters(), "cab");
    }

    TEST(AlphabetTest, RejectsNonMembers)
    {
        tundra::Alphabet const alphabet{ "0123456789" };

        EXPECT_TRUE(alphabet.contains('7'));
        EXPECT_FALSE(alphabet.contains('a'));
        EXPECT_EQ(alphabet.index_of('a'), tundra::Constant_InvalidIndex);
        EXPECT_EQ(alphabet.index_of('\xe9'), tundra::Constant_InvalidIndex);
    }

    TEST(AlphabetTest, EmptyAlphabet)
    {
        tundra::Alphabet const alphabet{ "" };

        EXPECT_TRUE(alphabet.empty());
        EXPECT_EQ(alphabet.size(), 0u);
        EXPECT_FALSE(alphabet.contains('a'));
    }

    TEST(AlphabetTest, SkipsNonAsciiBytes)
    {
        tundra::Alphabet const alphabet{ "a\xc3\xa9" "b" };

        EXPECT_EQ(alphabet.size(), 2u);
        EXPECT_EQ(alphabet.characters(), "ab");
    }

    TEST(AlphabetTest, SyntaxCharactersCanBeMembers)
    {
        tundra::Alphabet const alphabet{ "[]+" };

        EXPECT_TRUE(alphabet.contains('['));
        EXPECT_TRUE(alphabet.contains(']'));
        EXPECT_TRUE(alphabet.contains('+'));
    }

} // namespace
