#include <gtest/gtest.h>

// Bits a line should cost when encoded with a FIFO dictionary of
// aCapacity entries, worked out word by word
static uint32_t expectedBits(LineData const& aLine, uint32_t aCapacity)
{
	std::deque<Safecracker::Core::Word32Bit> dictionary;
	uint32_t bits = 0;
	for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i) {
		Safecracker::Core::Word32Bit word = wordAt(aLine, i);
		bool match = false;
		bool partial = false;
		for (Safecracker::Core::Word32Bit entry : dictionary) {
			match = match || entry == word;
			partial = partial || (entry >> 16) == (word >> 16);
		}
		if (word == 0) {
			bits += CPackCompressor::kZeroBits;
		} else if (match) {
			bits += CPackCompressor::kMatchBits;
		} else if ((word & 0xFFFFFF00) == 0) {
			bits += CPackCompressor::kByteBits;
		} else if (partial) {
			bits += CPackCompressor::kPartialBits;
		} else {
			bits += CPackCompressor::kNewBits;
			if (dictionary.size() == aCapacity)
				dictionary.pop_front();
			dictionary.push_back(word);
		}
	}
	return bits;
}

static uint32_t symbolBits(CompressedLine const& aLine)
{
	uint32_t bits = 0;
	for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i)
		bits += CPackCompressor::wordCost(aLine.symbol(i).thePattern);
	return bits;
}

TEST_F(CompressionTestFixture, RandomLinesSurviveCompression)
{
	boost::random::mt19937 generator(7);
	boost::random::uniform_int_distribution<uint32_t> words(0, 0xFFFFFFFF);

	for (int32_t trial = 0; trial < 500; ++trial) {
		LineData line;
		for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i)
			setWord(line, i, words(generator));

		CompressedLine compressed(theCompressor.compress(line));
		ASSERT_TRUE( theCompressor.decompress(compressed) == line ) << "Trial " << trial << ": " << compressed;
		ASSERT_EQ( compressed.bits(), symbolBits(compressed) ) << "Trial " << trial << ". Failed!";
		ASSERT_EQ( compressed.bits(), expectedBits(line, 16) ) << "Trial " << trial << ": " << compressed;
		ASSERT_LE( compressed.bytes(), 68u );
	}
}

TEST_F(CompressionTestFixture, MixedLinesFromWordPool)
{
	// Zero, byte, repeated and same-top words, plus enough distinct tops to
	// overflow every dictionary size below
	std::vector<Safecracker::Core::Word32Bit> pool = { 0, 0x7F, 0xFF, 0xDEADBEEF, 0xDEAD0001, 0xDEADFFFF,
	                                                   0x12345678, 0x1234ABCD, 0xCAFE0000, 0x00010000 };
	for (uint16_t top = 0x4000; top < 0x4018; ++top)
		pool.push_back(makeWord(top, top ^ 0x5A5A));

	boost::random::mt19937 generator(11);
	boost::random::uniform_int_distribution<int32_t> pick(0, static_cast<int32_t>(pool.size()) - 1);

	for (uint32_t capacity : { 16u, 8u, 4u, 2u }) {
		CPackCompressor compressor(capacity);
		for (int32_t trial = 0; trial < 300; ++trial) {
			LineData line;
			for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i)
				setWord(line, i, pool[pick(generator)]);

			Dictionary dictionary(capacity);
			CompressedLine compressed(compressor.compress(line, dictionary));
			ASSERT_TRUE( compressor.decompress(compressed) == line )
				<< "Capacity " << capacity << " trial " << trial << ": " << compressed;
			ASSERT_TRUE( theCompressor.decompress(compressed) == line )
				<< "Decoder ignored the encoder's dictionary size. Failed!";
			ASSERT_EQ( compressed.bits(), symbolBits(compressed) );
			ASSERT_EQ( compressed.bits(), expectedBits(line, capacity) )
				<< "Capacity " << capacity << " trial " << trial << ": " << compressed;
			ASSERT_LE( dictionary.size(), capacity ) << "Dictionary grew past its capacity. Failed!";
		}
	}
}

TEST_F(CompressionTestFixture, OverflowedDictionaryForgetsOldestWord)
{
	setWord(theLine, 0, 0xA0A0A0A0);
	setWord(theLine, 1, 0xB0B0B0B0);
	setWord(theLine, 2, 0xC0C0C0C0);
	setWord(theLine, 3, 0xA0A0A0A0);

	CPackCompressor small(2);
	CompressedLine compressed(small.compress(theLine));
	ASSERT_EQ( compressed.symbol(3).thePattern, kNew ) << "Evicted word still matched. Failed!";
	ASSERT_EQ( compressed.bits(), 4 * CPackCompressor::kNewBits + 12 * CPackCompressor::kZeroBits );
	ASSERT_TRUE( small.decompress(compressed) == theLine );

	compressed = theCompressor.compress(theLine);
	ASSERT_EQ( compressed.symbol(3).thePattern, kMatch );
	ASSERT_EQ( compressed.bits(), 3 * CPackCompressor::kNewBits + CPackCompressor::kMatchBits + 12 * CPackCompressor::kZeroBits );
}
