#include "heirloom/heirloom.hpp"
#include <doctest/doctest.h>

using namespace heirloom;
using namespace heirloom::escrow;

namespace {

    constexpr dp::u64 DAY = 24 * 60 * 60;
    constexpr dp::u64 T0 = 1700000000;

    CallContext as(const std::string &caller, dp::u64 now = T0) { return CallContext{caller, now}; }

} // namespace

TEST_SUITE("Beneficiary Update Tests") {
    TEST_CASE("Update replaces list and resyncs the index") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob", "carol"}, {60, 40}, 30 * DAY, "erin", "", 100).is_ok());

        REQUIRE(ledger.updateBeneficiaries(as("alice", T0 + DAY), {"carol", "dave"}, {30, 70}).is_ok());

        auto plan = ledger.getPlanDetails("alice").value();
        CHECK(plan.getBeneficiaries() == std::vector<std::string>{"carol", "dave"});
        CHECK(plan.getShares() == std::vector<dp::u32>{30, 70});
        CHECK(plan.isBeneficiary("dave"));
        CHECK_FALSE(plan.isBeneficiary("bob"));
        CHECK_FALSE(ledger.isAuthorizedBeneficiary("alice", "bob"));
        CHECK(ledger.isAuthorizedBeneficiary("alice", "carol"));
        CHECK(ledger.isAuthorizedBeneficiary("alice", "dave"));
        CHECK(ledger.getBeneficiaryShare("alice", "dave") == 70);
        CHECK(ledger.getBeneficiaryShare("alice", "bob") == 0);

        auto removed = ledger.claimInheritance(as("bob", T0 + 31 * DAY), "alice");
        REQUIRE(removed.is_err());
        CHECK(removed.error().code == ERR_UNAUTHORIZED_ACCESS);

        CHECK(ledger.claimInheritance(as("dave", T0 + 31 * DAY), "alice").value() == 70);
        CHECK(ledger.checkInvariants().is_ok());
    }

    TEST_CASE("Shares after an update apply to the remaining balance") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob", "carol"}, {60, 40}, 30 * DAY, "erin", "", 100).is_ok());
        CHECK(ledger.claimInheritance(as("bob", T0 + 30 * DAY), "alice").value() == 60);

        REQUIRE(ledger.updateBeneficiaries(as("alice", T0 + 31 * DAY), {"carol", "dave"}, {50, 50}).is_ok());

        auto plan = ledger.getPlanDetails("alice").value();
        CHECK(plan.claim_basis == 40);
        CHECK(plan.total_deposited == 100);
        CHECK(ledger.getEvents().back().amount == 40);

        CHECK(ledger.claimInheritance(as("carol", T0 + 31 * DAY), "alice").value() == 20);
        CHECK(ledger.getPlanDetails("alice").value().is_active);
        CHECK(ledger.claimInheritance(as("dave", T0 + 31 * DAY), "alice").value() == 20);

        auto drained = ledger.getPlanDetails("alice").value();
        CHECK(drained.total_amount == 0);
        CHECK_FALSE(drained.is_active);
        CHECK(ledger.getStats().total_claimed == 100);
        CHECK(ledger.checkInvariants().is_ok());
    }

    TEST_CASE("Top-up after an update grows the basis") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob", "carol"}, {50, 50}, 30 * DAY, "erin", "", 100).is_ok());
        REQUIRE(ledger.claimInheritance(as("bob", T0 + 30 * DAY), "alice").is_ok());
        REQUIRE(ledger.updateBeneficiaries(as("alice", T0 + 31 * DAY), {"carol", "dave"}, {50, 50}).is_ok());
        REQUIRE(ledger.addFunds(as("alice", T0 + 31 * DAY), 50).is_ok());

        CHECK(ledger.getPlanDetails("alice").value().claim_basis == 100);
        CHECK(ledger.claimInheritance(as("carol", T0 + 31 * DAY), "alice").value() == 50);
        CHECK(ledger.claimInheritance(as("dave", T0 + 31 * DAY), "alice").value() == 50);
        CHECK(ledger.checkInvariants().is_ok());
    }

    TEST_CASE("Update does not touch the countdown") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob"}, {100}, 30 * DAY, "erin", "", 100).is_ok());
        REQUIRE(ledger.updateBeneficiaries(as("alice", T0 + 20 * DAY), {"carol"}, {100}).is_ok());

        CHECK(ledger.getPlanDetails("alice").value().last_proof_of_life == T0);
        CHECK(ledger.timeUntilClaimable("alice", T0 + 20 * DAY).value() == 10 * DAY);
    }

    TEST_CASE("Update validation mirrors creation") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob"}, {100}, 30 * DAY, "erin", "", 100).is_ok());

        auto missing = ledger.updateBeneficiaries(as("zoe"), {"bob"}, {100});
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_INHERITANCE_NOT_FOUND);

        CHECK(ledger.updateBeneficiaries(as("alice"), {}, {}).error().code == ERR_INVALID_PARAMETERS);
        CHECK(ledger.updateBeneficiaries(as("alice"), {"bob", "carol"}, {50}).error().code == ERR_INVALID_PARAMETERS);
        CHECK(ledger.updateBeneficiaries(as("alice"), {"bob", "carol"}, {50, 49}).error().code ==
              ERR_INVALID_PARAMETERS);
        CHECK(ledger.updateBeneficiaries(as("alice"), {"bob", "bob"}, {50, 50}).error().code ==
              ERR_INVALID_PARAMETERS);
        CHECK(ledger.updateBeneficiaries(as("alice"), {"bob", "erin"}, {50, 50}).error().code ==
              ERR_INVALID_PARAMETERS);

        // Failed updates leave the plan as it was
        CHECK(ledger.getPlanDetails("alice").value().getBeneficiaries() == std::vector<std::string>{"bob"});
        CHECK(ledger.isAuthorizedBeneficiary("alice", "bob"));
        CHECK(ledger.getEvents().size() == 1);
    }

    TEST_CASE("Re-listed beneficiary who already claimed stays blocked") {
        EscrowConfig config;
        config.claim_policy = ClaimPolicy::PerPlan;
        EscrowLedger ledger(nullptr, config);
        REQUIRE(ledger.createPlan(as("alice"), {"bob", "carol"}, {50, 50}, 30 * DAY, "erin", "", 100).is_ok());
        REQUIRE(ledger.claimInheritance(as("bob", T0 + 30 * DAY), "alice").is_ok());

        REQUIRE(ledger.updateBeneficiaries(as("alice", T0 + 31 * DAY), {"bob", "carol"}, {20, 80}).is_ok());

        CHECK_FALSE(ledger.isAuthorizedBeneficiary("alice", "bob"));
        auto again = ledger.claimInheritance(as("bob", T0 + 31 * DAY), "alice");
        REQUIRE(again.is_err());
        CHECK(again.error().code == ERR_UNAUTHORIZED_ACCESS);
        CHECK(ledger.checkInvariants().is_ok());
    }

    TEST_CASE("Owners for a beneficiary follow updates") {
        EscrowLedger ledger;
        REQUIRE(ledger.createPlan(as("alice"), {"bob"}, {100}, 30 * DAY, "erin", "", 100).is_ok());
        REQUIRE(ledger.createPlan(as("frank"), {"bob", "carol"}, {50, 50}, 30 * DAY, "erin", "", 100).is_ok());

        CHECK(ledger.getPlansForBeneficiary("bob") == std::vector<std::string>{"alice", "frank"});

        REQUIRE(ledger.updateBeneficiaries(as("frank"), {"carol"}, {100}).is_ok());
        CHECK(ledger.getPlansForBeneficiary("bob") == std::vector<std::string>{"alice"});
        CHECK(ledger.getPlansForBeneficiary("carol") == std::vector<std::string>{"frank"});
    }
}
