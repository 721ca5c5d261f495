// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/aggregation.h"

#include "hash.h"
#include "test/test_cipherbatch.h"
#include "version.h"

#include <string>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(aggregation_tests, BasicTestingSetup)

static std::vector<Contribution> MakeContributions(const std::vector<CCiphertextHandle>& vHandles)
{
    std::vector<Contribution> vContributions;
    for (size_t i = 0; i < vHandles.size(); i++) {
        Contribution contrib;
        contrib.nBatchId = 1;
        contrib.nIndex = i;
        contrib.handle = vHandles[i];
        vContributions.push_back(contrib);
    }
    return vContributions;
}

BOOST_AUTO_TEST_CASE(fold_and_recompute)
{
    CMockEvaluator evaluator;
    CAggregationEngine engine(evaluator);

    const CCiphertextHandle h1 = CMockEvaluator::Encrypt(100, "h1");
    const CCiphertextHandle h2 = CMockEvaluator::Encrypt(30, "h2");
    const CCiphertextHandle h3 = CMockEvaluator::Encrypt(7, "h3");

    // The first handle becomes the aggregate without a coprocessor call
    BOOST_CHECK(engine.Fold(CCiphertextHandle(), h1) == h1);
    BOOST_CHECK_EQUAL(evaluator.nCalls, 0U);

    CCiphertextHandle running;
    running = engine.Fold(running, h1);
    running = engine.Fold(running, h2);
    running = engine.Fold(running, h3);
    BOOST_CHECK_EQUAL(evaluator.nCalls, 2U);
    BOOST_CHECK_EQUAL(CMockEvaluator::Decrypt(running), 137U);

    // Re-deriving from the contribution list gives the same handle bit for bit
    const CCiphertextHandle recomputed = engine.ComputeAggregate(MakeContributions({h1, h2, h3}));
    BOOST_CHECK(recomputed == running);

    BOOST_CHECK(engine.ComputeAggregate(std::vector<Contribution>()).IsNull());
    BOOST_CHECK(engine.ComputeAggregate(MakeContributions({h2})) == h2);
}

BOOST_AUTO_TEST_CASE(recompute_detects_coprocessor_change)
{
    CMockEvaluator evaluator;
    CAggregationEngine engine(evaluator);

    const std::vector<Contribution> vContributions = MakeContributions({
        CMockEvaluator::Encrypt(1, "a"), CMockEvaluator::Encrypt(2, "b")});

    const CCiphertextHandle before = engine.ComputeAggregate(vContributions);
    evaluator.nEpoch = 2;
    const CCiphertextHandle after = engine.ComputeAggregate(vContributions);
    BOOST_CHECK(before != after);
    BOOST_CHECK_EQUAL(CMockEvaluator::Decrypt(before), CMockEvaluator::Decrypt(after));
}

BOOST_AUTO_TEST_CASE(fold_propagates_coprocessor_errors)
{
    CMockEvaluator evaluator;
    CAggregationEngine engine(evaluator);
    evaluator.fThrow = true;

    const CCiphertextHandle h1 = CMockEvaluator::Encrypt(1, "a");
    BOOST_CHECK_NO_THROW(engine.Fold(CCiphertextHandle(), h1));
    BOOST_CHECK_THROW(engine.Fold(h1, h1), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(state_hash_commitment)
{
    const uint256 identity = GetDefaultSystemIdentity();
    const CCiphertextHandle h1 = CMockEvaluator::Encrypt(1000, "h1");
    const CCiphertextHandle h2 = CMockEvaluator::Encrypt(1500, "h2");
    const CCiphertextHandle h3 = CMockEvaluator::Encrypt(1500, "h3");

    const uint256 base = ComputeStateHash(identity, {h1, h2});
    BOOST_CHECK(!base.IsNull());
    BOOST_CHECK(base == ComputeStateHash(identity, {h1, h2}));

    // Reordering, replacing, adding and removing all change the commitment
    BOOST_CHECK(base != ComputeStateHash(identity, {h2, h1}));
    BOOST_CHECK(base != ComputeStateHash(identity, {h1, h3}));
    BOOST_CHECK(base != ComputeStateHash(identity, {h1, h2, h3}));
    BOOST_CHECK(base != ComputeStateHash(identity, {h1}));

    // Salted by the system identity
    BOOST_CHECK(base != ComputeStateHash(uint256S("01"), {h1, h2}));

    // Domain separated: not the plain hash of the same fields
    CHashWriter plain(SER_GETHASH, PROTOCOL_VERSION);
    plain << identity << std::vector<CCiphertextHandle>{h1, h2};
    BOOST_CHECK(base != plain.GetHash());

    CHashWriter tagged(SER_GETHASH, PROTOCOL_VERSION);
    tagged << std::string(STATE_HASH_DOMAIN_TAG) << identity << std::vector<CCiphertextHandle>{h1, h2};
    BOOST_CHECK(base == tagged.GetHash());

    // An empty batch still has a well defined commitment
    BOOST_CHECK(!ComputeStateHash(identity, {}).IsNull());
}

BOOST_AUTO_TEST_CASE(default_system_identity)
{
    const std::string strName = "cipherbatch";
    BOOST_CHECK(GetDefaultSystemIdentity() == Hash(strName.begin(), strName.end()));
}

BOOST_AUTO_TEST_SUITE_END()
