#include <gtest/gtest.h>
#include "Elector.hpp"
#include <chrono>
#include <vector>

using namespace shortgap;

static const MemberId ALICE(32, 'a');
static const MemberId BOB(32, 'b');
static const MemberId CAROL(32, 'c');

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static Member partyMember(const MemberId& id, uint64_t joinOrder, Clock::time_point lastSeen) {
    Member m;
    m.id = id;
    m.displayName = id.substr(0, 1);
    m.joinOrder = joinOrder;
    m.lastSeen = lastSeen;
    return m;
}

static void scoreMember(Member& m, uint32_t millis, Clock::time_point at) {
    m.pingScores[TransportKind::Tcp] = ScoreEntry{millis, at};
}

static Member joining(const MemberId& id) {
    Member m;
    m.id = id;
    m.displayName = id.substr(0, 1);
    return m;
}

static void ping(PeerRegistry& registry, const MemberId& id, uint32_t millis) {
    PingSample sample;
    sample.peerId = id;
    sample.roundTripMillis = millis;
    sample.measuredAt = Clock::now();
    registry.recordPing(id, TransportKind::Tcp, sample);
}

// -----------------------
// ELECTION ORDERING
// -----------------------
TEST(ElectorTest, LowestFreshScoreWins) {
    const auto now = Clock::now();
    Party party;
    party.members[ALICE] = partyMember(ALICE, 1, now);
    party.members[BOB] = partyMember(BOB, 2, now);
    party.members[CAROL] = partyMember(CAROL, 3, now);
    scoreMember(party.members[ALICE], 80, now);
    scoreMember(party.members[BOB], 20, now);

    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD), BOB);
}

TEST(ElectorTest, ScoreTieBreaksOnLastSeenThenId) {
    const auto now = Clock::now();
    Party party;
    party.members[ALICE] = partyMember(ALICE, 1, now);
    party.members[BOB] = partyMember(BOB, 2, now - std::chrono::seconds(3));
    scoreMember(party.members[ALICE], 30, now);
    scoreMember(party.members[BOB], 30, now);

    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD), BOB);

    party.members[BOB].lastSeen = now;
    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD), ALICE);
}

TEST(ElectorTest, WithoutFreshScoresEarliestJoinWins) {
    const auto now = Clock::now();
    Party party;
    party.members[ALICE] = partyMember(ALICE, 5, now);
    party.members[BOB] = partyMember(BOB, 2, now);
    scoreMember(party.members[ALICE], 1, now - std::chrono::minutes(30)); // stale

    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD), BOB);
}

TEST(ElectorTest, SkipsOfflineAndExcludedMembers) {
    const auto now = Clock::now();
    Party party;
    party.members[ALICE] = partyMember(ALICE, 1, now);
    party.members[BOB] = partyMember(BOB, 2, now);
    party.members[CAROL] = partyMember(CAROL, 3, now);
    party.members[ALICE].isOnline = false;

    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD), BOB);
    EXPECT_EQ(Elector::electHost(party, now, STALENESS_THRESHOLD, BOB), CAROL);

    party.members[BOB].isOnline = false;
    party.members[CAROL].isOnline = false;
    EXPECT_TRUE(Elector::electHost(party, now, STALENESS_THRESHOLD).empty());
}

TEST(ElectorTest, ElectionIsIndependentOfInsertionOrder) {
    const auto now = Clock::now();
    Party forward;
    Party backward;
    std::vector<MemberId> ids = {ALICE, BOB, CAROL};
    for (size_t i = 0; i < ids.size(); ++i) {
        forward.members[ids[i]] = partyMember(ids[i], 1, now);
        scoreMember(forward.members[ids[i]], 40, now);
    }
    for (size_t i = ids.size(); i-- > 0;) {
        backward.members[ids[i]] = partyMember(ids[i], 1, now);
        scoreMember(backward.members[ids[i]], 40, now);
    }

    EXPECT_EQ(Elector::electHost(forward, now, STALENESS_THRESHOLD), ALICE);
    EXPECT_EQ(Elector::electHost(backward, now, STALENESS_THRESHOLD), ALICE);
}

// -----------------------
// CLAIMS
// -----------------------
TEST(ElectorTest, ClaimCarriesMemberRanking) {
    const auto now = Clock::now();
    Party party;
    party.members[BOB] = partyMember(BOB, 4, now);
    scoreMember(party.members[BOB], 12, now);

    HostClaim claim = Elector::claimFor(party, BOB, 7, now, STALENESS_THRESHOLD);
    EXPECT_EQ(claim.hostId, BOB);
    EXPECT_EQ(claim.term, 7u);
    ASSERT_TRUE(claim.score.has_value());
    EXPECT_EQ(*claim.score, 12u);
    EXPECT_EQ(claim.joinOrder, 4u);
}

TEST(ElectorTest, HigherTermSupersedes) {
    HostClaim current{ALICE, 3, 10u, Clock::now(), 1};
    HostClaim older{BOB, 2, 1u, Clock::now(), 1};
    HostClaim newer{BOB, 4, 900u, Clock::now(), 9};

    EXPECT_FALSE(supersedes(older, current));
    EXPECT_TRUE(supersedes(newer, current));
    EXPECT_FALSE(supersedes(current, current));
    EXPECT_TRUE(supersedes(current, HostClaim{}));
    EXPECT_FALSE(supersedes(HostClaim{}, current));
}

TEST(ElectorTest, EqualTermsFallBackToElectionOrder) {
    const auto seen = Clock::now();
    HostClaim scored{BOB, 3, 50u, seen, 9};
    HostClaim unscored{ALICE, 3, std::nullopt, seen, 1};
    HostClaim better{CAROL, 3, 20u, seen, 5};

    EXPECT_TRUE(supersedes(scored, unscored));
    EXPECT_FALSE(supersedes(unscored, scored));
    EXPECT_TRUE(supersedes(better, scored));
}

// -----------------------
// INSTALLING HOSTS
// -----------------------
TEST(ElectorTest, RunElectionInstallsHostOnce) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    std::vector<std::pair<MemberId, MemberId>> changes;
    elector->setHostChangedHandler([&](const HostClaim& claim, const MemberId& previous) {
        changes.emplace_back(claim.hostId, previous);
    });

    elector->runElection(Clock::now());
    elector->runElection(Clock::now());

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].first, ALICE);
    EXPECT_TRUE(changes[0].second.empty());
    EXPECT_EQ(elector->state(), ElectorState::Stable);
    EXPECT_TRUE(elector->isLocalHost());
    EXPECT_EQ(registry.snapshot()->term, 1u);
}

TEST(ElectorTest, NoOnlineMembersMeansNoQuorum) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.markOffline(ALICE);

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    std::vector<ElectorState> states;
    elector->setStateHandler([&](ElectorState s) { states.push_back(s); });

    elector->runElection(Clock::now());
    EXPECT_EQ(elector->state(), ElectorState::NoQuorum);
    EXPECT_EQ(states.back(), ElectorState::NoQuorum);
    EXPECT_TRUE(registry.snapshot()->hostId.empty());
}

TEST(ElectorTest, ConsiderClaimRejectsOfflineMember) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    registry.markOffline(BOB);

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    HostClaim claim;
    claim.hostId = BOB;
    claim.term = 5;
    EXPECT_FALSE(elector->considerClaim(claim, Clock::now()));

    claim.hostId = CAROL; // unknown
    EXPECT_FALSE(elector->considerClaim(claim, Clock::now()));
    EXPECT_TRUE(registry.snapshot()->hostId.empty());
}

TEST(ElectorTest, ConsiderClaimReconcilesByTerm) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    elector->runElection(Clock::now());
    ASSERT_EQ(registry.snapshot()->hostId, ALICE);

    const auto now = Clock::now();
    HostClaim sameTerm = Elector::claimFor(*registry.snapshot(), BOB, 1, now, STALENESS_THRESHOLD);
    EXPECT_FALSE(elector->considerClaim(sameTerm, now));
    EXPECT_EQ(registry.snapshot()->hostId, ALICE);

    HostClaim nextTerm = Elector::claimFor(*registry.snapshot(), BOB, 2, now, STALENESS_THRESHOLD);
    EXPECT_TRUE(elector->considerClaim(nextTerm, now));
    EXPECT_EQ(registry.snapshot()->hostId, BOB);
    EXPECT_EQ(registry.snapshot()->term, 2u);
    EXPECT_FALSE(elector->isLocalHost());
}

TEST(ElectorTest, YieldHostPicksBestOtherMember) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    registry.join(joining(CAROL));
    ping(registry, CAROL, 15);

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    ASSERT_TRUE(registry.setHost(ALICE, 1));

    EXPECT_EQ(elector->yieldHost(Clock::now()), CAROL);
    EXPECT_EQ(registry.snapshot()->hostId, CAROL);
    EXPECT_EQ(registry.snapshot()->term, 2u);
}

TEST(ElectorTest, YieldHostAloneReturnsEmpty) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    elector->runElection(Clock::now());
    EXPECT_TRUE(elector->yieldHost(Clock::now()).empty());
    EXPECT_EQ(registry.snapshot()->hostId, ALICE);
}

// -----------------------
// CHALLENGES
// -----------------------
TEST(ElectorTest, LocalHostYieldsToBetterScoredMember) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    std::vector<MemberId> hosts;
    elector->setHostChangedHandler([&](const HostClaim& claim, const MemberId&) { hosts.push_back(claim.hostId); });

    elector->runElection(Clock::now());
    ASSERT_EQ(hosts.size(), 1u);

    ping(registry, ALICE, 80);
    ping(registry, BOB, 20);
    elector->onProbeRoundComplete(Clock::now());
    elector->onProbeRoundComplete(Clock::now());

    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[1], BOB);
    EXPECT_EQ(registry.snapshot()->term, 2u);
}

TEST(ElectorTest, MemberSendsChallengeToHost) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    ASSERT_TRUE(registry.setHost(ALICE, 1));
    ping(registry, ALICE, 80);
    ping(registry, BOB, 20);

    auto elector = std::make_shared<Elector>(io, registry, BOB, PartyConfig());
    std::vector<HostClaim> sent;
    int hostChanges = 0;
    elector->setChallengeSender([&](const HostClaim& claim) { sent.push_back(claim); });
    elector->setHostChangedHandler([&](const HostClaim&, const MemberId&) { ++hostChanges; });

    elector->checkChallenge(Clock::now());

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].hostId, BOB);
    EXPECT_EQ(sent[0].term, 2u);
    ASSERT_TRUE(sent[0].score.has_value());
    EXPECT_EQ(*sent[0].score, 20u);
    EXPECT_EQ(hostChanges, 0);
    EXPECT_EQ(registry.snapshot()->hostId, ALICE);
}

TEST(ElectorTest, HostAcceptsOnlyStrictlyBetterChallenge) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    ASSERT_TRUE(registry.setHost(ALICE, 1));
    ping(registry, ALICE, 50);

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());

    HostClaim equal{BOB, 2, 50u, Clock::now(), 2};
    EXPECT_FALSE(elector->considerChallenge(equal, Clock::now()));
    HostClaim unscored{BOB, 2, std::nullopt, Clock::now(), 2};
    EXPECT_FALSE(elector->considerChallenge(unscored, Clock::now()));
    EXPECT_EQ(registry.snapshot()->hostId, ALICE);

    HostClaim better{BOB, 2, 10u, Clock::now(), 2};
    EXPECT_TRUE(elector->considerChallenge(better, Clock::now()));
    EXPECT_EQ(registry.snapshot()->hostId, BOB);
}

// -----------------------
// FAILURE DETECTION
// -----------------------
TEST(ElectorTest, HealthCheckReplacesHostSilentPastThreshold) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    ASSERT_TRUE(registry.setHost(BOB, 1));
    const auto joinedAt = registry.member(BOB)->lastSeen;

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    int hostChanges = 0;
    elector->setHostChangedHandler([&](const HostClaim&, const MemberId&) { ++hostChanges; });

    elector->healthCheck(joinedAt + STALENESS_THRESHOLD - std::chrono::minutes(1));
    EXPECT_TRUE(registry.snapshot()->isOnline(BOB));
    EXPECT_EQ(registry.snapshot()->hostId, BOB);

    elector->healthCheck(joinedAt + STALENESS_THRESHOLD + std::chrono::minutes(1));

    auto party = registry.snapshot();
    EXPECT_FALSE(party->isOnline(BOB));
    EXPECT_EQ(party->hostId, ALICE);
    EXPECT_EQ(party->term, 2u);
    EXPECT_EQ(hostChanges, 1);
}

TEST(ElectorTest, FailedRoundsAloneKeepRecentlySeenMemberOnline) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));
    ASSERT_TRUE(registry.setHost(BOB, 1));
    registry.recordProbeFailure(BOB);
    registry.recordProbeFailure(BOB);
    registry.recordProbeFailure(BOB);

    const auto now = Clock::now();
    registry.touch(BOB, now);

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    elector->healthCheck(now);

    auto party = registry.snapshot();
    EXPECT_TRUE(party->isOnline(BOB));
    EXPECT_EQ(party->hostId, BOB);
    EXPECT_EQ(party->term, 1u);
}

TEST(ElectorTest, HealthCheckMarksSilentPeersOffline) {
    boost::asio::io_context io;
    PeerRegistry registry;
    registry.join(joining(ALICE));
    registry.join(joining(BOB));

    auto elector = std::make_shared<Elector>(io, registry, ALICE, PartyConfig());
    elector->runElection(Clock::now());

    elector->healthCheck(Clock::now() + std::chrono::minutes(11));

    auto party = registry.snapshot();
    EXPECT_TRUE(party->isOnline(ALICE));
    EXPECT_FALSE(party->isOnline(BOB));
    EXPECT_EQ(party->hostId, ALICE);
}
