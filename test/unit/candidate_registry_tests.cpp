// Unit tests for CandidateRegistry: introductions, deduplication, walk selection
#include <catch2/catch_test_macros.hpp>
#include "network/candidate_registry.hpp"
#include "network/protocol.hpp"
#include <optional>
#include <stdexcept>
#include <vector>

using namespace meshwalk::network;

namespace {

const double kNow = 1700000000.0;

std::vector<CandidatePtr> MakeLocalCandidates(CandidateRegistry& registry, int count) {
    std::vector<CandidatePtr> candidates;
    for (int i = 1; i <= count; ++i) {
        Address address("127.0.0.1", static_cast<uint16_t>(i));
        candidates.push_back(registry.create_candidate(address, false, address, address,
                                                       ConnectionType::UNKNOWN));
    }
    return candidates;
}

// Stumble each candidate in turn and record whom it would be introduced to
std::vector<std::optional<uint16_t>> StumbleAndIntroduce(CandidateRegistry& registry,
                                                         const std::vector<CandidatePtr>& order) {
    std::vector<std::optional<uint16_t>> got;
    for (const auto& candidate : order) {
        registry.stumble(candidate, kNow);
        CandidatePtr introduced = registry.introduce_candidate(candidate);
        if (introduced) {
            got.push_back(introduced->lan_address().port);
        } else {
            got.push_back(std::nullopt);
        }
    }
    return got;
}

std::vector<std::optional<uint16_t>> Ports(std::initializer_list<int> ports) {
    std::vector<std::optional<uint16_t>> result;
    for (int p : ports) {
        if (p == 0) {
            result.push_back(std::nullopt);
        } else {
            result.push_back(static_cast<uint16_t>(p));
        }
    }
    return result;
}

void CheckIntroductionOrder(CommunityPolicy policy) {
    CandidateRegistry first("community-1", policy);
    auto candidates = MakeLocalCandidates(first, 5);

    CHECK(StumbleAndIntroduce(first, candidates) == Ports({0, 1, 2, 3, 4}));

    // Ordering must not leak between communities
    CandidateRegistry second("community-2", policy);
    std::vector<CandidatePtr> reversed(candidates.rbegin(), candidates.rend());
    CHECK(StumbleAndIntroduce(second, reversed) == Ports({0, 5, 4, 3, 2}));
}

} // anonymous namespace

TEST_CASE("CandidateRegistry - introduction order (plain)", "[candidates][introduce]") {
    CheckIntroductionOrder(CommunityPolicy::PLAIN);
}

TEST_CASE("CandidateRegistry - introduction order (tracker)", "[candidates][introduce]") {
    CheckIntroductionOrder(CommunityPolicy::TRACKER);

    SECTION("Tracker does not favour walked candidates") {
        CandidateRegistry tracker("tracker", CommunityPolicy::TRACKER);
        auto candidates = MakeLocalCandidates(tracker, 5);
        StumbleAndIntroduce(tracker, candidates);

        tracker.walk(candidates[0], kNow, 10.5);
        tracker.walk_response(candidates[0], kNow);

        CHECK(StumbleAndIntroduce(tracker, candidates) == Ports({5, 1, 2, 3, 4}));
    }
}

TEST_CASE("CandidateRegistry - introduction list contents", "[candidates][introduce]") {
    CandidateRegistry registry("community");
    auto candidates = MakeLocalCandidates(registry, 4);

    SECTION("Candidates without activity are never offered") {
        registry.stumble(candidates[0], kNow);
        registry.stumble(candidates[1], kNow);
        auto list = registry.yield_introduce_candidates(candidates[1]);
        REQUIRE(list.size() == 1);
        CHECK(list[0] == candidates[0]);
    }

    SECTION("Requester is never offered to itself") {
        for (const auto& c : candidates) {
            registry.stumble(c, kNow);
        }
        for (const auto& requester : candidates) {
            for (const auto& offered : registry.yield_introduce_candidates(requester)) {
                CHECK(offered->address() != requester->address());
            }
        }
    }

    SECTION("Bootstrap candidates are never offered") {
        auto bootstrap = registry.create_candidate(Address("10.0.0.1", 6421), true,
                                                   Address("10.0.0.1", 6421),
                                                   Address("10.0.0.1", 6421),
                                                   ConnectionType::UNKNOWN);
        registry.stumble(bootstrap, kNow);
        registry.stumble(candidates[0], kNow);
        CHECK(registry.introduce_candidate(candidates[0]) == nullptr);
    }

    SECTION("Plain list is newest first and restartable") {
        for (const auto& c : candidates) {
            registry.stumble(c, kNow);
        }
        auto list = registry.yield_introduce_candidates(candidates[3]);
        REQUIRE(list.size() == 3);
        CHECK(list[0] == candidates[2]);
        CHECK(list[1] == candidates[1]);
        CHECK(list[2] == candidates[0]);
        CHECK(registry.yield_introduce_candidates(candidates[3]) == list);
    }

    SECTION("Plain list only holds older candidates") {
        for (const auto& c : candidates) {
            registry.stumble(c, kNow);
        }
        auto list = registry.yield_introduce_candidates(candidates[1]);
        REQUIRE(list.size() == 1);
        CHECK(list[0] == candidates[0]);
    }

    SECTION("Plain recency counts our own walks") {
        registry.stumble(candidates[0], kNow);
        registry.stumble(candidates[1], kNow);
        registry.walk(candidates[0], kNow, 10.5);
        // candidate 0 is now more recent than candidate 1
        CHECK(registry.introduce_candidate(candidates[1]) == nullptr);
        CHECK(registry.introduce_candidate(candidates[0]) == candidates[1]);
    }

    SECTION("Tracker wraps around to newer candidates") {
        CandidateRegistry tracker("tracker", CommunityPolicy::TRACKER);
        auto peers = MakeLocalCandidates(tracker, 3);
        for (const auto& c : peers) {
            tracker.stumble(c, kNow);
        }
        auto list = tracker.yield_introduce_candidates(peers[0]);
        REQUIRE(list.size() == 2);
        CHECK(list[0] == peers[2]);
        CHECK(list[1] == peers[1]);
    }

    SECTION("Tracker ignores our own walks") {
        CandidateRegistry tracker("tracker", CommunityPolicy::TRACKER);
        auto peers = MakeLocalCandidates(tracker, 2);
        tracker.walk(peers[0], kNow, 10.5);
        tracker.stumble(peers[1], kNow);
        // A walk alone is not activity in a tracker
        CHECK(tracker.yield_introduce_candidates(peers[1]).empty());
    }
}

TEST_CASE("CandidateRegistry - create_candidate", "[candidates]") {
    CandidateRegistry registry("community");
    Address address("1.2.3.4", 7000);

    auto first = registry.create_candidate(address, false, Address("192.168.1.2", 7000),
                                           address, ConnectionType::UNKNOWN);
    registry.stumble(first, kNow);

    auto second = registry.create_candidate(address, false, Address("192.168.1.3", 7000),
                                            address, ConnectionType::PUBLIC);

    CHECK(first == second);
    CHECK(registry.size() == 1);
    CHECK(second->lan_address() == Address("192.168.1.3", 7000));
    CHECK(second->connection_type() == ConnectionType::PUBLIC);
    REQUIRE(second->activity("community") != nullptr);
    CHECK(second->activity("community")->last_stumble == kNow);
}

TEST_CASE("CandidateRegistry - event hooks", "[candidates]") {
    CandidateRegistry registry("community");
    Address address("5.6.7.8", 1234);

    SECTION("Unregistered candidates are adopted") {
        auto outsider = std::make_shared<Candidate>(address, false, address, address,
                                                    ConnectionType::UNKNOWN);
        auto registered = registry.stumble(outsider, kNow);
        CHECK(registered == outsider);
        CHECK(registry.get(address) == outsider);
    }

    SECTION("Registered instance takes precedence") {
        auto registered = registry.create_candidate(address, false, address, address,
                                                    ConnectionType::UNKNOWN);
        auto copy = std::make_shared<Candidate>(address, false, address, address,
                                                ConnectionType::UNKNOWN);
        CHECK(registry.stumble(copy, kNow) == registered);
        CHECK(copy->activity("community") == nullptr);
    }

    SECTION("walk records a deadline that walk_response clears") {
        auto c = registry.create_candidate(address, false, address, address,
                                           ConnectionType::UNKNOWN);
        registry.walk(c, kNow, 10.5);
        REQUIRE(c->activity("community") != nullptr);
        CHECK(c->activity("community")->last_walk == kNow);
        CHECK(c->activity("community")->walk_deadline == kNow + 10.5);

        registry.walk_response(c, kNow + 1);
        CHECK(c->activity("community")->last_walk_response == kNow + 1);
        CHECK(c->activity("community")->walk_deadline == 0);
    }

    SECTION("Sequence numbers order events with equal timestamps") {
        auto a = registry.create_candidate(Address("1.1.1.1", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
        auto b = registry.create_candidate(Address("1.1.1.1", 2), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
        registry.stumble(a, kNow);
        registry.intro(b, kNow);
        CHECK(a->activity("community")->stumble_seq < b->activity("community")->intro_seq);
    }

    SECTION("Null candidates are rejected") {
        CHECK_THROWS_AS(registry.stumble(nullptr, kNow), std::invalid_argument);
        CHECK_THROWS_AS(registry.walk(nullptr, kNow, 1.0), std::invalid_argument);
        CHECK_THROWS_AS(registry.walk_response(nullptr, kNow), std::invalid_argument);
        CHECK_THROWS_AS(registry.intro(nullptr, kNow), std::invalid_argument);
    }

    SECTION("remove forgets the candidate and its activity here") {
        auto c = registry.create_candidate(address, false, address, address,
                                           ConnectionType::UNKNOWN);
        registry.stumble(c, kNow);
        CHECK(registry.remove(address));
        CHECK_FALSE(registry.remove(address));
        CHECK(registry.get(address) == nullptr);
        CHECK(c->activity("community") == nullptr);
    }
}

TEST_CASE("CandidateRegistry - filter_duplicate", "[candidates][dedup]") {
    CandidateRegistry registry("community");
    const Address lan("192.168.0.1", 1);

    SECTION("Symmetric NAT group folds into one candidate") {
        std::vector<CandidatePtr> group;
        group.push_back(registry.create_candidate(Address("1.1.1.1", 1), false, lan,
                                                  Address("1.1.1.1", 1), ConnectionType::UNKNOWN));
        group.push_back(registry.create_candidate(Address("1.1.1.1", 2), false, lan,
                                                  Address("1.1.1.1", 2),
                                                  ConnectionType::SYMMETRIC_NAT));
        group.push_back(registry.create_candidate(Address("1.1.1.1", 3), false, lan,
                                                  Address("1.1.1.1", 3),
                                                  ConnectionType::SYMMETRIC_NAT));
        group.push_back(registry.create_candidate(Address("1.1.1.1", 4), false, lan,
                                                  Address("1.1.1.1", 4), ConnectionType::UNKNOWN));

        CHECK(registry.filter_duplicate(group[0]) == 3);

        auto remaining = registry.candidates();
        REQUIRE(remaining.size() == 1);
        CHECK(remaining[0] == group[0]);
        CHECK(remaining[0]->wan_address() == Address("1.1.1.1", 1));
    }

    SECTION("Folded activity keeps the latest value of every field") {
        auto ref = registry.create_candidate(Address("2.2.2.2", 1), false, lan,
                                             Address("2.2.2.2", 1),
                                             ConnectionType::SYMMETRIC_NAT);
        auto dup = registry.create_candidate(Address("2.2.2.2", 9), false,
                                             Address("10.0.0.9", 9), Address("2.2.2.2", 9),
                                             ConnectionType::UNKNOWN);
        registry.stumble(ref, kNow);
        registry.walk(dup, kNow + 5, 10.5);
        registry.walk_response(dup, kNow + 6);

        CHECK(registry.filter_duplicate(ref) == 1);
        const CandidateActivity* activity = ref->activity("community");
        REQUIRE(activity != nullptr);
        CHECK(activity->last_stumble == kNow);
        CHECK(activity->last_walk == kNow + 5);
        CHECK(activity->last_walk_response == kNow + 6);
        CHECK(registry.get(Address("2.2.2.2", 9)) == nullptr);
    }

    SECTION("Same WAN IP and same LAN address fold without symmetric NAT") {
        auto ref = registry.create_candidate(Address("3.3.3.3", 1), false, lan,
                                             Address("3.3.3.3", 1), ConnectionType::UNKNOWN);
        registry.create_candidate(Address("3.3.3.3", 2), false, lan, Address("3.3.3.3", 2),
                                  ConnectionType::UNKNOWN);
        CHECK(registry.filter_duplicate(ref) == 1);
        CHECK(registry.size() == 1);
    }

    SECTION("Distinct peers behind one unknown NAT are kept") {
        auto ref = registry.create_candidate(Address("4.4.4.4", 1), false,
                                             Address("192.168.0.1", 1), Address("4.4.4.4", 1),
                                             ConnectionType::UNKNOWN);
        registry.create_candidate(Address("4.4.4.4", 2), false, Address("192.168.0.2", 1),
                                  Address("4.4.4.4", 2), ConnectionType::UNKNOWN);
        CHECK(registry.filter_duplicate(ref) == 0);
        CHECK(registry.size() == 2);
    }

    SECTION("A symmetric NAT peer does not fold unrelated cone NAT peers") {
        auto ref = registry.create_candidate(Address("9.9.9.9", 1), false,
                                             Address("192.168.0.10", 1), Address("9.9.9.9", 1),
                                             ConnectionType::UNKNOWN);
        auto other = registry.create_candidate(Address("9.9.9.9", 2), false,
                                               Address("192.168.0.20", 1),
                                               Address("9.9.9.9", 2), ConnectionType::UNKNOWN);
        registry.create_candidate(Address("9.9.9.9", 3), false, Address("192.168.0.30", 1),
                                  Address("9.9.9.9", 3), ConnectionType::SYMMETRIC_NAT);

        CHECK(registry.filter_duplicate(ref) == 1);
        CHECK(registry.size() == 2);
        CHECK(registry.get(Address("9.9.9.9", 1)) == ref);
        CHECK(registry.get(Address("9.9.9.9", 2)) == other);
        CHECK(registry.get(Address("9.9.9.9", 3)) == nullptr);
    }

    SECTION("A symmetric NAT reference folds every peer at its WAN IP") {
        auto ref = registry.create_candidate(Address("8.8.8.8", 1), false,
                                             Address("192.168.0.10", 1), Address("8.8.8.8", 1),
                                             ConnectionType::SYMMETRIC_NAT);
        registry.create_candidate(Address("8.8.8.8", 2), false, Address("192.168.0.20", 1),
                                  Address("8.8.8.8", 2), ConnectionType::UNKNOWN);
        registry.create_candidate(Address("8.8.8.8", 3), false, Address("192.168.0.30", 1),
                                  Address("8.8.8.8", 3), ConnectionType::PUBLIC);

        CHECK(registry.filter_duplicate(ref) == 2);
        CHECK(registry.size() == 1);
        CHECK(registry.get(Address("8.8.8.8", 1)) == ref);
    }

    SECTION("Other WAN IPs are untouched") {
        auto ref = registry.create_candidate(Address("5.5.5.5", 1), false, lan,
                                             Address("5.5.5.5", 1),
                                             ConnectionType::SYMMETRIC_NAT);
        registry.create_candidate(Address("6.6.6.6", 1), false, lan, Address("6.6.6.6", 1),
                                  ConnectionType::SYMMETRIC_NAT);
        CHECK(registry.filter_duplicate(ref) == 0);
        CHECK(registry.size() == 2);
    }
}

TEST_CASE("CandidateRegistry - categories", "[candidates][walk]") {
    CandidateRegistry registry("community");
    Address address("7.7.7.7", 1);
    auto c = registry.create_candidate(address, false, address, address,
                                       ConnectionType::UNKNOWN);

    SECTION("No activity is NONE") {
        CHECK(registry.category(*c, kNow) == CandidateCategory::NONE);
    }

    SECTION("Walk response lasts 57.5 seconds") {
        registry.walk_response(c, kNow);
        CHECK(registry.category(*c, kNow + 57.4) == CandidateCategory::WALK);
        CHECK(registry.category(*c, kNow + 57.5) == CandidateCategory::NONE);
    }

    SECTION("Stumble lasts 57.5 seconds") {
        registry.stumble(c, kNow);
        CHECK(registry.category(*c, kNow + 57.4) == CandidateCategory::STUMBLE);
        CHECK(registry.category(*c, kNow + 57.5) == CandidateCategory::NONE);
    }

    SECTION("Intro lasts 27.5 seconds") {
        registry.intro(c, kNow);
        CHECK(registry.category(*c, kNow + 27.4) == CandidateCategory::INTRO);
        CHECK(registry.category(*c, kNow + 27.5) == CandidateCategory::NONE);
    }

    SECTION("Category names") {
        CHECK(CandidateCategoryAsString(CandidateCategory::WALK) == "walk");
        CHECK(CandidateCategoryAsString(CandidateCategory::STUMBLE) == "stumble");
        CHECK(CandidateCategoryAsString(CandidateCategory::INTRO) == "intro");
        CHECK(CandidateCategoryAsString(CandidateCategory::NONE) == "none");
    }

    SECTION("Walk category wins over stumble") {
        registry.stumble(c, kNow);
        registry.walk_response(c, kNow);
        CHECK(registry.category(*c, kNow) == CandidateCategory::WALK);
    }

    SECTION("Bootstrap candidates are always NONE") {
        auto bootstrap = MakeBootstrapCandidate(Address("8.8.8.8", 6421));
        registry.walk_response(bootstrap, kNow);
        CHECK(registry.category(*bootstrap, kNow) == CandidateCategory::NONE);
    }
}

TEST_CASE("CandidateRegistry - walk eligibility", "[candidates][walk]") {
    CandidateRegistry registry("community");
    Address address("7.7.7.7", 1);
    auto c = registry.create_candidate(address, false, address, address,
                                       ConnectionType::UNKNOWN);

    SECTION("Inactive candidates are not eligible") {
        CHECK_FALSE(registry.is_eligible_for_walk(*c, kNow));
    }

    SECTION("Active, never walked candidates are eligible") {
        registry.stumble(c, kNow);
        CHECK(registry.is_eligible_for_walk(*c, kNow));
    }

    SECTION("A walk blocks the next one for 27.5 seconds") {
        registry.stumble(c, kNow);
        registry.walk(c, kNow, 10.5);
        CHECK_FALSE(registry.is_eligible_for_walk(*c, kNow + 27.4));
        CHECK(registry.is_eligible_for_walk(*c, kNow + 27.5));
    }

    SECTION("Bootstrap candidates wait 55 seconds between walks") {
        auto bootstrap = registry.create_candidate(Address("9.9.9.9", 6421), true,
                                                   Address("9.9.9.9", 6421),
                                                   Address("9.9.9.9", 6421),
                                                   ConnectionType::UNKNOWN);
        CHECK(registry.is_eligible_for_walk(*bootstrap, kNow));
        registry.walk(bootstrap, kNow, 10.5);
        CHECK_FALSE(registry.is_eligible_for_walk(*bootstrap, kNow + 54.9));
        CHECK(registry.is_eligible_for_walk(*bootstrap, kNow + 55.0));
    }
}

TEST_CASE("CandidateRegistry - select_walk_candidate", "[candidates][walk]") {
    CandidateRegistry registry("community");
    registry.seed(42);

    SECTION("Empty registry yields nothing") {
        CHECK(registry.select_walk_candidate(kNow) == nullptr);
    }

    SECTION("Falls back to whatever category has a candidate") {
        auto c = registry.create_candidate(Address("1.0.0.1", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
        registry.intro(c, kNow);
        for (int i = 0; i < 50; ++i) {
            CHECK(registry.select_walk_candidate(kNow) == c);
        }
    }

    SECTION("Bootstrap candidates are used when nothing else is eligible") {
        auto bootstrap = registry.create_candidate(Address("9.9.9.9", 6421), true,
                                                   Address("9.9.9.9", 6421),
                                                   Address("9.9.9.9", 6421),
                                                   ConnectionType::UNKNOWN);
        CHECK(registry.select_walk_candidate(kNow) == bootstrap);
        registry.walk(bootstrap, kNow, 10.5);
        CHECK(registry.select_walk_candidate(kNow + 1) == nullptr);
    }

    SECTION("Oldest walk wins within a category") {
        auto a = registry.create_candidate(Address("1.0.0.1", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
        auto b = registry.create_candidate(Address("1.0.0.2", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
        registry.stumble(a, kNow);
        registry.stumble(b, kNow);
        registry.walk(a, kNow - 40, 10.5);
        registry.walk(b, kNow - 30, 10.5);
        for (int i = 0; i < 20; ++i) {
            CHECK(registry.select_walk_candidate(kNow) == a);
        }
    }

    SECTION("Weights favour the walk category") {
        auto walked = registry.create_candidate(Address("1.0.0.1", 1), false, Address(),
                                                Address(), ConnectionType::UNKNOWN);
        auto stumbled = registry.create_candidate(Address("1.0.0.2", 1), false, Address(),
                                                  Address(), ConnectionType::UNKNOWN);
        registry.walk_response(walked, kNow);
        registry.stumble(stumbled, kNow);

        int walked_count = 0;
        const int rounds = 4000;
        for (int i = 0; i < rounds; ++i) {
            CandidatePtr selected = registry.select_walk_candidate(kNow);
            REQUIRE(selected != nullptr);
            if (selected == walked)
                ++walked_count;
        }
        // WALK is picked ~49.75% of the time, plus the intro and bootstrap
        // fallbacks (~25.4%) land on the walk category first
        CHECK(walked_count > rounds * 65 / 100);
        CHECK(walked_count < rounds * 85 / 100);
    }
}

TEST_CASE("CandidateRegistry - cleanup", "[candidates]") {
    CandidateRegistry registry("community");
    auto stale = registry.create_candidate(Address("1.0.0.1", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
    auto fresh = registry.create_candidate(Address("1.0.0.2", 1), false, Address(),
                                           Address(), ConnectionType::UNKNOWN);
    auto pending = registry.create_candidate(Address("1.0.0.3", 1), false, Address(),
                                             Address(), ConnectionType::UNKNOWN);
    auto bootstrap = registry.create_candidate(Address("9.9.9.9", 6421), true,
                                               Address("9.9.9.9", 6421),
                                               Address("9.9.9.9", 6421),
                                               ConnectionType::UNKNOWN);

    registry.stumble(stale, kNow - 100);
    registry.stumble(fresh, kNow);
    registry.walk(pending, kNow - 1, 10.5);

    CHECK(registry.cleanup(kNow) == 1);
    CHECK(registry.get(stale->address()) == nullptr);
    CHECK(registry.get(fresh->address()) == fresh);
    CHECK(registry.get(pending->address()) == pending);
    CHECK(registry.get(bootstrap->address()) == bootstrap);
}
