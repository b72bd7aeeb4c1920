#include <gtest/gtest.h>

TEST_F(VictimTestFixture, ZeroAndRepeatedBytesAreSkipped)
{
	SequenceSecretGenerator generator({ 0, 5, 5, 7, 0, 9, 11, 13 });

	std::vector<uint8_t> secret = generateSecret(generator, 4, 8);
	std::vector<uint8_t> expected = { 5, 7, 9, 11 };
	ASSERT_TRUE( secret == expected ) << "Unexpected secret. Failed!";
	ASSERT_EQ( generator.consumed(), 7u );
}

TEST_F(VictimTestFixture, TooManyRejectionsFail)
{
	SequenceSecretGenerator generator({ 0, 0, 0, 1 });
	ASSERT_THROW( generateSecret(generator, 1, 2), SecretGenerationFailure );

	SequenceSecretGenerator tolerant({ 0, 0, 0, 1 });
	ASSERT_EQ( generateSecret(tolerant, 1, 3)[0], 1 );
}

TEST_F(VictimTestFixture, ExhaustedSequenceFails)
{
	SequenceSecretGenerator generator({ 1, 2 });
	ASSERT_THROW( generateSecret(generator, 4, 100), SecretGenerationFailure );
}

TEST_F(VictimTestFixture, RandomSecretsAreValidAndRepeatable)
{
	for (uint32_t seed = 1; seed <= 20; ++seed) {
		RandomSecretGenerator generator(seed);
		std::vector<uint8_t> secret = generateSecret(generator, 8, 1024);
		ASSERT_EQ( secret.size(), 8u );
		ASSERT_TRUE( isValidSecret(secret) ) << "Seed " << seed << " gave an invalid secret. Failed!";

		RandomSecretGenerator again(seed);
		ASSERT_TRUE( generateSecret(again, 8, 1024) == secret ) << "Seed " << seed << " is not repeatable. Failed!";
	}
}

TEST_F(VictimTestFixture, SecretValidity)
{
	ASSERT_TRUE( isValidSecret({ 1, 2, 3, 4 }) );
	ASSERT_FALSE( isValidSecret({}) );
	ASSERT_FALSE( isValidSecret({ 1, 2, 2, 4 }) );
	ASSERT_FALSE( isValidSecret({ 0, 2, 3, 4 }) );
}
