#include <heirloom/heirloom.hpp>
#include <iostream>

using namespace heirloom;
using namespace heirloom::escrow;

namespace {

    constexpr dp::u64 T0 = 1700000000;

    void report(const std::string &label, const dp::Error &error) {
        std::cout << "   " << label << ": " << errorName(error.code) << " (" << error.message.c_str() << ")"
                  << std::endl;
    }

} // namespace

int main() {
    std::cout << "=== Heirloom Inheritance Demo ===" << std::endl;

    // Example 1: Setup ledger
    std::cout << "\n1. Setting up escrow ledger..." << std::endl;

    EscrowConfig config;
    config.verbose = true;

    auto vault = std::make_shared<InMemoryVault>();
    EscrowLedger ledger(vault, config);

    ledger.subscribe([](const EscrowEvent &event) {
        std::cout << "   [event #" << event.sequence << "] " << event.getTypeName() << " on " << event.getOwner()
                  << std::endl;
    });

    std::cout << "   Claim policy: " << claimPolicyToString(config.claim_policy) << std::endl;
    std::cout << "   Lock bounds: " << config.min_lock_duration / SECONDS_PER_DAY << " to "
              << config.max_lock_duration / SECONDS_PER_DAY << " days" << std::endl;

    // Example 2: Create plan
    std::cout << "\n2. Alice locks 1000 for Bob (60%) and Carol (40%)..." << std::endl;

    auto created = ledger.createPlan(CallContext{"alice", T0}, {"bob", "carol"}, {60, 40}, 30 * SECONDS_PER_DAY,
                                     "erin", "Family savings", 1000);
    if (!created.is_ok()) {
        std::cerr << "Failed to create plan: " << created.error().message.c_str() << std::endl;
        return 1;
    }

    auto wait = ledger.timeUntilClaimable("alice", T0);
    std::cout << "   Claimable in: " << wait.value() / SECONDS_PER_DAY << " days" << std::endl;

    // Example 3: Early claim is refused
    std::cout << "\n3. Bob tries to claim on day 10..." << std::endl;

    auto early = ledger.claimInheritance(CallContext{"bob", T0 + 10 * SECONDS_PER_DAY}, "alice");
    if (early.is_err()) {
        report("Refused", early.error());
    }

    // Example 4: Proof of life
    std::cout << "\n4. Alice checks in on day 25..." << std::endl;

    const dp::u64 check_in = T0 + 25 * SECONDS_PER_DAY;
    if (!ledger.submitProofOfLife(CallContext{"alice", check_in}).is_ok()) {
        std::cerr << "Failed to submit proof of life" << std::endl;
        return 1;
    }
    std::cout << "   Claimable in: " << ledger.timeUntilClaimable("alice", check_in).value() / SECONDS_PER_DAY
              << " days" << std::endl;

    // Example 5: Emergency freeze
    std::cout << "\n5. Erin freezes the plan, Alice lifts it..." << std::endl;

    if (!ledger.activateEmergencyRecovery(CallContext{"erin", check_in + SECONDS_PER_DAY}, "alice").is_ok()) {
        std::cerr << "Failed to activate emergency mode" << std::endl;
        return 1;
    }
    auto frozen = ledger.claimInheritance(CallContext{"bob", check_in + 40 * SECONDS_PER_DAY}, "alice");
    if (frozen.is_err()) {
        report("Refused", frozen.error());
    }
    if (!ledger.deactivateEmergencyRecovery(CallContext{"alice", check_in + 2 * SECONDS_PER_DAY}).is_ok()) {
        std::cerr << "Failed to deactivate emergency mode" << std::endl;
        return 1;
    }

    // Example 6: Claims after the lock expires
    std::cout << "\n6. Alice goes silent, heirs claim on day 60..." << std::endl;

    const dp::u64 later = T0 + 60 * SECONDS_PER_DAY;
    for (const std::string heir : {"bob", "carol"}) {
        auto claimed = ledger.claimInheritance(CallContext{heir, later}, "alice");
        if (claimed.is_ok()) {
            std::cout << "   " << heir << " received " << claimed.value() << std::endl;
        } else {
            report(heir + " refused", claimed.error());
        }
    }

    auto again = ledger.claimInheritance(CallContext{"bob", later}, "alice");
    if (again.is_err()) {
        report("Second claim", again.error());
    }

    // Example 7: Summary
    std::cout << "\n7. Final state..." << std::endl;

    auto stats = ledger.getStats();
    std::cout << "   Paid out: " << vault->getTotalPaid() << " in " << vault->getTransferCount() << " transfers"
              << std::endl;
    std::cout << "   Active plans: " << stats.active_plans << ", locked: " << stats.total_locked << std::endl;
    std::cout << "   Invariants: " << (ledger.checkInvariants().is_ok() ? "hold" : "VIOLATED") << std::endl;

    ledger.printLedgerSummary();

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
