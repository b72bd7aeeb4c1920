#include <components/Attacker/AttackStrings.hpp>
#include <components/Attacker/AttackerController.hpp>
#include <components/Victim/SecretGenerator.hpp>
#include <components/Victim/VictimBufferInspector.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <gtest/gtest.h>
#include <simulators/CompressedCacheAttack/wiring.hpp>
#include <sstream>
#include <string>

using namespace Safecracker;
using nAttacker::AttackResult;

// Create fixture for running whole attacks
class AttackTestFixture : public testing::Test
{
protected:
	static void SetUpTestCase()
	{
		Dbg::Debugger::constructDebugger();
		Dbg::Debugger::theDebugger->setMinSev(Dbg::SevCrit);
	}

	// Runs one attack against aSecret and checks that it recovered it
	AttackResult attack(std::vector<uint8_t> const& aSecret)
	{
		Core::Parameters parameters;
		parameters.secret_length = aSecret.size();
		std::unique_ptr<Wiring::Trial> trial(Wiring::initialize(parameters, aSecret));

		AttackResult result = trial->attacker().run();
		EXPECT_TRUE( result.theSuccess ) << "Attack failed: " << result;
		EXPECT_TRUE( result.theSecret == aSecret ) << "Wrong secret recovered. Failed!";
		EXPECT_EQ( trial->victim().guessCount(), result.theGuessesUsed ) << "Guesses not counted. Failed!";
		EXPECT_EQ( trial->attacker().phase(), nAttacker::kDone );

		nVictim::VictimBufferInspector inspector(trial->victim());
		EXPECT_TRUE( inspector.secret() == aSecret ) << "The attack changed the secret. Failed!";
		return result;
	}
};

#include "attackStringsTest.h"
#include "knownSecretTest.h"
#include "randomSecretTest.h"
