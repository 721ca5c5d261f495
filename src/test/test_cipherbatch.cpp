// Copyright (c) 2011-2017 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_cipherbatch.h"

#include "consensus/validation.h"
#include "init.h"
#include "logging.h"
#include "shutdown.h"
#include "state/settlementman.h"
#include "util/strprintf.h"
#include "util/system.h"
#include "utiltime.h"
#include "validationinterface.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

CActorID TestActor(unsigned int n)
{
    return CActorID(uint160S(strprintf("%040x", n)));
}

BasicTestingSetup::BasicTestingSetup() : nMockTime(TEST_START_TIME)
{
    static unsigned int nSetupCount = 0;
    m_path_root = fs::temp_directory_path() /
                  strprintf("test_cipherbatch_%d_%u", GetTimeMicros(), ++nSetupCount);
    fs::create_directories(m_path_root);

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-datadir", m_path_root.string());
    ClearDatadirCache();

    LogInstance().m_print_to_file = false;
    LogInstance().m_print_to_console = false;

    SetMockTime(nMockTime);
    AbortShutdown();
}

BasicTestingSetup::~BasicTestingSetup()
{
    AbortShutdown();
    SetMockTime(0);
    gArgs.ClearArgs();
    ClearDatadirCache();
    fs::remove_all(m_path_root);
}

void BasicTestingSetup::AdvanceTime(int64_t nSeconds)
{
    nMockTime += nSeconds;
    SetMockTime(nMockTime);
}

SettlementTestingSetup::SettlementTestingSetup()
    : admin(TestActor(1)),
      provider1(TestActor(2)),
      provider2(TestActor(3)),
      oracleActor(TestActor(4)),
      outsider(TestActor(5))
{
    gArgs.ForceSetArg("-admin", admin.GetHex());
    gArgs.ForceSetArg("-dbcache", "2");

    std::string strError;
    if (!InitSettlement(evaluator, &oracle, strError)) {
        throw std::runtime_error("InitSettlement failed: " + strError);
    }

    CValidationState state;
    if (!g_settlementman->AuthorizeProvider(admin, provider1, state) ||
        !g_settlementman->AuthorizeProvider(admin, provider2, state) ||
        !g_settlementman->SetDecryptionOracle(admin, oracleActor, state)) {
        throw std::runtime_error("registry setup failed: " + state.GetRejectReason());
    }
}

SettlementTestingSetup::~SettlementTestingSetup()
{
    UnregisterAllSettlementInterfaces();
    ShutdownSettlement();
}

bool SettlementTestingSetup::Reload(std::string& strError)
{
    ShutdownSettlement();
    return InitSettlement(evaluator, &oracle, strError);
}

bool SettlementTestingSetup::Submit(const CActorID& provider, CAmount cost, CAmount budget,
                                    const CCiphertextHandle& handle, CValidationState& state)
{
    Contribution contrib;
    return g_settlementman->SubmitContribution(provider, cost, budget, handle, contrib, state);
}

bool SettlementTestingSetup::DeliverResult(const uint256& token, CValidationState& state)
{
    const uint64_t nCleartext = oracle.Decrypt(token);
    return g_settlementman->OnDecryptionResult(oracleActor, token, nCleartext,
                                               oracle.MakeProof(token, nCleartext), state);
}
