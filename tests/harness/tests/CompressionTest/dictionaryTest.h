#include <gtest/gtest.h>

TEST_F(CompressionTestFixture, DictionaryDropsOldestEntry)
{
	Dictionary dictionary(2);
	dictionary.insert(0x11111111);
	dictionary.insert(0x22222222);
	ASSERT_EQ( dictionary.findWord(0x11111111), 0 );
	ASSERT_EQ( dictionary.findWord(0x22222222), 1 );

	dictionary.insert(0x33333333);
	ASSERT_EQ( dictionary.size(), 2u );
	ASSERT_EQ( dictionary.findWord(0x11111111), -1 ) << "The oldest entry should have been replaced. Failed!";
	ASSERT_EQ( dictionary.entry(0), 0x22222222u );
	ASSERT_EQ( dictionary.entry(1), 0x33333333u );
	ASSERT_EQ( dictionary.findTop(0x3333ABCD), 1 );
	ASSERT_EQ( dictionary.findTop(0x4444ABCD), -1 );
}

TEST_F(CompressionTestFixture, DictionaryIndexIsChecked)
{
	Dictionary dictionary;
	ASSERT_EQ( dictionary.capacity(), 16u );
	ASSERT_THROW( dictionary.entry(0), Safecracker::Core::AssertionFailure );
}

TEST_F(CompressionTestFixture, SmallDictionaryForgetsWords)
{
	setWord(theLine, 0, 0x11111111);
	setWord(theLine, 1, 0x22222222);
	setWord(theLine, 2, 0x33333333);
	setWord(theLine, 3, 0x11111111);

	CPackCompressor small(2);
	ASSERT_EQ( small.compress(theLine).symbol(3).thePattern, kNew ) << "Word 0 should have aged out. Failed!";
	ASSERT_EQ( theCompressor.compress(theLine).symbol(3).thePattern, kMatch );
}

TEST_F(CompressionTestFixture, CompressionStartsFromEmptyDictionary)
{
	Dictionary dictionary;
	dictionary.insert(0x11223344);
	setWord(theLine, 0, 0x11223344);

	CompressedLine compressed(theCompressor.compress(theLine, dictionary));
	ASSERT_EQ( compressed.symbol(0).thePattern, kNew ) << "Stale dictionary entries leaked into compression. Failed!";
	ASSERT_EQ( dictionary.size(), 1u ) << "The dictionary should hold the encoder's final state. Failed!";
}
