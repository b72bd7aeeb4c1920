#include <gtest/gtest.h>

TEST_F(AttackTestFixture, GeneratedSecretIsUsed)
{
	nVictim::SequenceSecretGenerator generator({ 0, 0x21, 0x21, 0x43, 0x65, 0x87 });
	std::unique_ptr<Wiring::Trial> trial(Wiring::initialize(4, generator));

	nVictim::VictimBufferInspector inspector(trial->victim());
	std::vector<uint8_t> expected = { 0x21, 0x43, 0x65, 0x87 };
	ASSERT_TRUE( inspector.secret() == expected ) << "Generated secret not installed. Failed!";
	ASSERT_TRUE( trial->attacker().run().theSuccess );
}

TEST_F(AttackTestFixture, RandomFourByteSecrets)
{
	for (uint32_t seed = 1; seed <= 9; ++seed) {
		Core::Parameters parameters;
		parameters.seed = seed;
		std::unique_ptr<Wiring::Trial> trial(Wiring::initialize(parameters));
		nVictim::VictimBufferInspector inspector(trial->victim());

		AttackResult result = trial->attacker().run();
		ASSERT_TRUE( result.theSuccess ) << "Seed " << seed << ": " << result;
		ASSERT_EQ( result.theGuessesUsed, 1u ) << "Seed " << seed << " needed more than one guess. Failed!";
		ASSERT_TRUE( result.theSecret == inspector.secret() );
	}
}

TEST_F(AttackTestFixture, RandomEightByteSecrets)
{
	uint32_t firstGuess = 0;
	uint32_t secondGuess = 0;
	for (uint32_t seed = 1; seed <= 12; ++seed) {
		Core::Parameters parameters;
		parameters.secret_length = 8;
		parameters.seed = seed;
		std::unique_ptr<Wiring::Trial> trial(Wiring::initialize(parameters));
		nVictim::VictimBufferInspector inspector(trial->victim());

		AttackResult result = trial->attacker().run();
		ASSERT_TRUE( result.theSuccess ) << "Seed " << seed << ": " << result;
		ASSERT_LE( result.theGuessesUsed, 2u ) << "Seed " << seed << ". Failed!";
		ASSERT_TRUE( result.theSecret == inspector.secret() );
		ASSERT_EQ( trial->victim().guessCount(), result.theGuessesUsed );
		if (result.theGuessesUsed == 1) {
			++firstGuess;
		} else {
			++secondGuess;
		}
	}
	ASSERT_GT( firstGuess, 0u ) << "No secret was found in discovery order. Failed!";
	ASSERT_GT( secondGuess, 0u ) << "No secret needed the swapped guess. Failed!";
}
