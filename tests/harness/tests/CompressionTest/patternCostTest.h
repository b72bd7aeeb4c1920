#include <gtest/gtest.h>

TEST_F(CompressionTestFixture, ZeroLineIsSmallest)
{
	ASSERT_EQ( theCompressor.compressedBits(theLine), 32u ) << "An all-zero line must cost 2 bits per word. Failed!";
	ASSERT_EQ( theCompressor.compressedBytes(theLine), 4u ) << "32 bits round up to 4 bytes. Failed!";
}

TEST_F(CompressionTestFixture, IncompressibleLineIsLargest)
{
	LineData line(incompressibleLine());
	ASSERT_EQ( theCompressor.compressedBits(line), 544u ) << "16 new words must cost 34 bits each. Failed!";
	ASSERT_EQ( theCompressor.compressedBytes(line), 68u ) << "544 bits are 68 bytes. Failed!";
}

TEST_F(CompressionTestFixture, EveryPatternHasItsCost)
{
	setWord(theLine, 0, 0x11223344);	// new
	setWord(theLine, 1, 0x11223344);	// match
	setWord(theLine, 2, 0x000000AB);	// byte
	setWord(theLine, 3, 0x11225566);	// partial

	CompressedLine compressed(theCompressor.compress(theLine));
	ASSERT_EQ( compressed.symbol(0).thePattern, kNew );
	ASSERT_EQ( compressed.symbol(1).thePattern, kMatch );
	ASSERT_EQ( compressed.symbol(1).theIndex, 0 );
	ASSERT_EQ( compressed.symbol(2).thePattern, kByte );
	ASSERT_EQ( compressed.symbol(3).thePattern, kPartial );
	ASSERT_EQ( compressed.symbol(3).thePayload, 0x5566u );
	for (int32_t i = 4; i < Safecracker::Core::kWordsPerLine; ++i)
		ASSERT_EQ( compressed.symbol(i).thePattern, kZero ) << "Word " << i << " should be zero. Failed!";

	ASSERT_EQ( compressed.bits(), 34u + 6u + 10u + 22u + 12u * 2u );
	ASSERT_EQ( compressed.bytes(), 12u );
}

TEST_F(CompressionTestFixture, WordCosts)
{
	ASSERT_EQ( CPackCompressor::wordCost(kZero), 2u );
	ASSERT_EQ( CPackCompressor::wordCost(kMatch), 6u );
	ASSERT_EQ( CPackCompressor::wordCost(kByte), 10u );
	ASSERT_EQ( CPackCompressor::wordCost(kPartial), 22u );
	ASSERT_EQ( CPackCompressor::wordCost(kNew), 34u );

	ASSERT_EQ( CPackCompressor::bitsToBytes(32), 4u );
	ASSERT_EQ( CPackCompressor::bitsToBytes(33), 5u );
	ASSERT_EQ( CPackCompressor::bitsToBytes(532), 67u );
}

TEST_F(CompressionTestFixture, PartialMatchIsNotRemembered)
{
	setWord(theLine, 0, 0x11223344);
	setWord(theLine, 1, 0x11225566);
	setWord(theLine, 2, 0x11225566);

	CompressedLine compressed(theCompressor.compress(theLine));
	ASSERT_EQ( compressed.symbol(1).thePattern, kPartial );
	ASSERT_EQ( compressed.symbol(2).thePattern, kPartial ) << "A partial word must not enter the dictionary. Failed!";
}

TEST_F(CompressionTestFixture, ByteBeatsPartial)
{
	// 0x00000012 shares its top short with 0x0000ABCD
	setWord(theLine, 0, 0x0000ABCD);
	setWord(theLine, 1, 0x00000012);

	CompressedLine compressed(theCompressor.compress(theLine));
	ASSERT_EQ( compressed.symbol(0).thePattern, kNew );
	ASSERT_EQ( compressed.symbol(1).thePattern, kByte );
}
