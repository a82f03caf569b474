#include <algorithm>
#include <heirloom/escrow/ledger.hpp>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace heirloom::escrow {

    namespace {

        // Scope guard for the transaction nesting counter
        struct DepthGuard {
            size_t &depth;
            explicit DepthGuard(size_t &d) : depth(d) { ++depth; }
            ~DepthGuard() { --depth; }
        };

        // Scope guard marking an outbound transfer as running
        struct FlagGuard {
            bool &flag;
            explicit FlagGuard(bool &f) : flag(f) { flag = true; }
            ~FlagGuard() { flag = false; }
        };

        constexpr dp::u64 MAX_AMOUNT = std::numeric_limits<dp::u64>::max();

        dp::String message(const std::string &text) { return dp::String(text.c_str()); }

    } // namespace

    EscrowLedger::EscrowLedger(std::shared_ptr<FundsTransfer> transfer, const EscrowConfig &config)
        : config_(config), transfer_(std::move(transfer)) {
        auto valid = config_.validate();
        if (!valid.is_ok()) {
            throw std::invalid_argument(valid.error().message.c_str());
        }
        if (!transfer_) {
            transfer_ = std::make_shared<InMemoryVault>();
        }
    }

    // ===========================================
    // Transaction plumbing
    // ===========================================

    template <typename T, typename Fn> dp::Result<T, dp::Error> EscrowLedger::transact(Fn &&fn) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        if (depth_ == 0)
            commit_mark_ = log_.size();

        auto result = [&]() {
            DepthGuard guard(depth_);
            return fn();
        }();

        if (depth_ > 0)
            return result;

        if (!result.is_ok()) {
            log_.truncate(commit_mark_);
            return result;
        }

        const auto &events = log_.getEvents();
        std::vector<EscrowEvent> committed(events.begin() + static_cast<std::ptrdiff_t>(commit_mark_), events.end());
        auto listeners = listeners_;
        for (const auto &event : committed) {
            for (const auto &listener : listeners) {
                try {
                    listener(event);
                } catch (const std::exception &e) {
                    trace("Listener failed on " + event.getTypeName() + ": " + e.what());
                }
            }
        }
        return result;
    }

    template <typename T>
    dp::Result<T, dp::Error> EscrowLedger::reject(const std::string &operation, const dp::Error &error) const {
        if (config_.verbose) {
            std::cout << "[heirloom] " << operation << " rejected: " << errorName(error.code) << " ("
                      << error.message.c_str() << ")" << std::endl;
        }
        return dp::Result<T, dp::Error>::err(error);
    }

    void EscrowLedger::trace(const std::string &text) const {
        if (config_.verbose)
            std::cout << "[heirloom] " << text << std::endl;
    }

    dp::Result<void, dp::Error> EscrowLedger::record(EscrowEvent event) {
        auto appended = log_.append(std::move(event));
        if (!appended.is_ok())
            return dp::Result<void, dp::Error>::err(appended.error());
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Validation helpers
    // ===========================================

    dp::Result<void, dp::Error> EscrowLedger::validateBeneficiaries(const std::string &emergency_contact,
                                                                    const std::vector<std::string> &beneficiaries,
                                                                    const std::vector<dp::u32> &shares) const {
        if (beneficiaries.empty() || beneficiaries.size() > config_.max_beneficiaries) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Beneficiary count out of range"));
        }
        if (beneficiaries.size() != shares.size()) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Beneficiaries and shares length mismatch"));
        }

        std::unordered_set<std::string> seen;
        dp::u32 total = 0;
        for (size_t i = 0; i < beneficiaries.size(); ++i) {
            const auto &beneficiary = beneficiaries[i];
            if (beneficiary.empty()) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Null beneficiary"));
            }
            if (shares[i] == 0 || shares[i] > SHARE_TOTAL) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Share out of range"));
            }
            if (!seen.insert(beneficiary).second) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Duplicate beneficiary"));
            }
            if (beneficiary == emergency_contact) {
                return dp::Result<void, dp::Error>::err(
                    invalid_parameters("Emergency contact cannot be a beneficiary"));
            }
            total += shares[i];
        }

        if (total != SHARE_TOTAL) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Shares must total 100"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool EscrowLedger::claimedFromPlan(const std::string &owner, const std::string &beneficiary) const {
        auto it = state_.claimed_by_plan.find({owner, beneficiary});
        return it != state_.claimed_by_plan.end() && it->second > 0;
    }

    bool EscrowLedger::hasClaimed(const std::string &owner, const std::string &beneficiary) const {
        if (config_.claim_policy == ClaimPolicy::PerPlan)
            return claimedFromPlan(owner, beneficiary);

        auto it = state_.claimed_total.find(beneficiary);
        return it != state_.claimed_total.end() && it->second > 0;
    }

    // floor(basis * share / 100) without the 64-bit product
    dp::u64 EscrowLedger::computeShare(dp::u64 basis, dp::u32 share) {
        return (basis / SHARE_TOTAL) * share + (basis % SHARE_TOTAL) * share / SHARE_TOTAL;
    }

    // ===========================================
    // Plan lifecycle
    // ===========================================

    dp::Result<void, dp::Error> EscrowLedger::createPlan(const CallContext &ctx,
                                                         const std::vector<std::string> &beneficiaries,
                                                         const std::vector<dp::u32> &shares, dp::u64 lock_duration,
                                                         const std::string &emergency_contact,
                                                         const std::string &description, dp::u64 deposit) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "createPlan";

            if (deposit == 0) {
                return reject<void>(op, insufficient_funds("Deposit must be greater than zero"));
            }
            if (ctx.caller.empty()) {
                return reject<void>(op, invalid_parameters("Null owner"));
            }
            if (lock_duration < config_.min_lock_duration || lock_duration > config_.max_lock_duration) {
                return reject<void>(op, invalid_parameters("Lock duration out of range"));
            }
            if (emergency_contact.empty()) {
                return reject<void>(op, invalid_parameters("Null emergency contact"));
            }
            if (emergency_contact == ctx.caller) {
                return reject<void>(op, invalid_parameters("Owner cannot be the emergency contact"));
            }
            if (state_.plans.find(ctx.caller) != state_.plans.end()) {
                return reject<void>(op, invalid_parameters("Inheritance already exists"));
            }
            auto valid = validateBeneficiaries(emergency_contact, beneficiaries, shares);
            if (!valid.is_ok()) {
                return reject<void>(op, valid.error());
            }
            if (state_.stats.total_locked > MAX_AMOUNT - deposit || state_.balance > MAX_AMOUNT - deposit) {
                return reject<void>(op, invalid_parameters("Deposit overflows escrow balance"));
            }

            EscrowEvent event(EventType::InheritanceCreated, ctx.caller, ctx.caller, ctx.now);
            for (size_t i = 0; i < beneficiaries.size(); ++i) {
                event.addAccount(beneficiaries[i]);
                event.addValue(shares[i]);
            }
            event.amount = deposit;
            event.detail = lock_duration;
            auto recorded = record(event);
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            InheritancePlan plan;
            plan.owner = dp::String(ctx.caller.c_str());
            plan.setBeneficiaries(beneficiaries, shares);
            plan.lock_duration = lock_duration;
            plan.last_proof_of_life = ctx.now;
            plan.total_amount = deposit;
            plan.total_deposited = deposit;
            plan.claim_basis = deposit;
            plan.creation_time = ctx.now;
            plan.is_active = true;
            plan.emergency_mode = false;
            plan.emergency_contact = dp::String(emergency_contact.c_str());
            plan.description = dp::String(description.c_str());
            state_.plans[ctx.caller] = std::move(plan);

            for (const auto &beneficiary : beneficiaries)
                state_.index.grant(ctx.caller, beneficiary);

            state_.stats.active_plans++;
            state_.stats.total_plans++;
            state_.stats.total_locked += deposit;
            state_.balance += deposit;

            trace("Inheritance created by " + ctx.caller + " with " + std::to_string(beneficiaries.size()) +
                  " beneficiaries, deposit " + std::to_string(deposit));
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<void, dp::Error> EscrowLedger::submitProofOfLife(const CallContext &ctx) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "submitProofOfLife";

            auto it = state_.plans.find(ctx.caller);
            if (it == state_.plans.end()) {
                return reject<void>(op, inheritance_not_found());
            }
            auto &plan = it->second;
            if (!plan.is_active) {
                return reject<void>(op, invalid_parameters("Inheritance is not active"));
            }
            if (plan.emergency_mode) {
                return reject<void>(op, emergency_mode_active());
            }

            EscrowEvent event(EventType::ProofOfLifeSubmitted, ctx.caller, ctx.caller, ctx.now);
            event.detail = ctx.now;
            auto recorded = record(event);
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            plan.last_proof_of_life = ctx.now;

            trace("Proof of life from " + ctx.caller + " at " + std::to_string(ctx.now));
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<dp::u64, dp::Error> EscrowLedger::claimInheritance(const CallContext &ctx, const std::string &owner) {
        return transact<dp::u64>([&]() -> dp::Result<dp::u64, dp::Error> {
            const std::string op = "claimInheritance";

            if (transfer_in_flight_) {
                return reject<dp::u64>(op, unauthorized_access("Claim attempted during an outbound transfer"));
            }
            auto it = state_.plans.find(owner);
            if (it == state_.plans.end()) {
                return reject<dp::u64>(op, inheritance_not_found());
            }
            if (!state_.index.isAuthorized(owner, ctx.caller)) {
                return reject<dp::u64>(op, unauthorized_access("Caller is not a beneficiary of this inheritance"));
            }
            auto &plan = it->second;
            if (plan.emergency_mode) {
                return reject<dp::u64>(op, emergency_mode_active());
            }
            if (!plan.is_active) {
                return reject<dp::u64>(op, invalid_parameters("Inheritance is not active"));
            }
            if (!plan.isUnlocked(ctx.now)) {
                return reject<dp::u64>(op, time_lock_not_expired());
            }
            if (hasClaimed(owner, ctx.caller)) {
                return reject<dp::u64>(op, invalid_parameters("Beneficiary has already claimed"));
            }

            dp::u32 share = plan.shareOf(ctx.caller);
            if (share == 0) {
                return reject<dp::u64>(op, invalid_parameters("Authorized caller has no share"));
            }
            dp::u64 amount = std::min(computeShare(plan.claim_basis, share), plan.total_amount);
            if (amount == 0) {
                return reject<dp::u64>(op, insufficient_funds("Nothing to claim"));
            }

            LedgerState snapshot = state_;
            size_t log_mark = log_.size();

            EscrowEvent event(EventType::InheritanceClaimed, owner, ctx.caller, ctx.now);
            event.amount = amount;
            event.detail = plan.total_amount - amount;
            auto recorded = record(event);
            if (!recorded.is_ok()) {
                return reject<dp::u64>(op, recorded.error());
            }

            // Effects before the transfer
            state_.claimed_total[ctx.caller] += amount;
            state_.claimed_by_plan[{owner, ctx.caller}] += amount;
            plan.total_amount -= amount;
            state_.stats.total_locked -= amount;
            state_.stats.total_claimed += amount;
            state_.balance -= amount;
            state_.index.revoke(owner, ctx.caller);
            if (plan.total_amount == 0) {
                plan.is_active = false;
                state_.stats.active_plans--;
            }

            auto outcome = [&]() -> dp::Result<void, dp::Error> {
                FlagGuard in_flight(transfer_in_flight_);
                try {
                    return transfer_->transfer(ctx.caller, amount);
                } catch (const std::exception &e) {
                    return dp::Result<void, dp::Error>::err(insufficient_funds(message(e.what())));
                }
            }();

            if (!outcome.is_ok()) {
                state_ = std::move(snapshot);
                log_.truncate(log_mark);
                return reject<dp::u64>(
                    op, insufficient_funds(message("Transfer failed: " + std::string(outcome.error().message.c_str()))));
            }

            trace("Inheritance claimed from " + owner + " by " + ctx.caller + ": " + std::to_string(amount));
            return dp::Result<dp::u64, dp::Error>::ok(amount);
        });
    }

    dp::Result<void, dp::Error> EscrowLedger::addFunds(const CallContext &ctx, dp::u64 amount) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "addFunds";

            auto it = state_.plans.find(ctx.caller);
            if (it == state_.plans.end()) {
                return reject<void>(op, inheritance_not_found());
            }
            if (amount == 0) {
                return reject<void>(op, insufficient_funds("Amount must be greater than zero"));
            }
            auto &plan = it->second;
            if (!plan.is_active) {
                return reject<void>(op, invalid_parameters("Inheritance is not active"));
            }
            if (plan.total_deposited > MAX_AMOUNT - amount || plan.claim_basis > MAX_AMOUNT - amount ||
                state_.stats.total_locked > MAX_AMOUNT - amount ||
                state_.balance > MAX_AMOUNT - amount) {
                return reject<void>(op, invalid_parameters("Amount overflows escrow balance"));
            }

            EscrowEvent event(EventType::FundsAdded, ctx.caller, ctx.caller, ctx.now);
            event.amount = amount;
            event.detail = plan.total_amount + amount;
            auto recorded = record(event);
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            plan.total_amount += amount;
            plan.total_deposited += amount;
            plan.claim_basis += amount;
            state_.stats.total_locked += amount;
            state_.balance += amount;

            trace("Funds added by " + ctx.caller + ": " + std::to_string(amount));
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<void, dp::Error> EscrowLedger::updateBeneficiaries(const CallContext &ctx,
                                                                  const std::vector<std::string> &beneficiaries,
                                                                  const std::vector<dp::u32> &shares) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "updateBeneficiaries";

            auto it = state_.plans.find(ctx.caller);
            if (it == state_.plans.end()) {
                return reject<void>(op, inheritance_not_found());
            }
            auto &plan = it->second;
            if (plan.emergency_mode) {
                return reject<void>(op, emergency_mode_active());
            }
            auto valid = validateBeneficiaries(plan.getEmergencyContact(), beneficiaries, shares);
            if (!valid.is_ok()) {
                return reject<void>(op, valid.error());
            }

            EscrowEvent event(EventType::BeneficiariesUpdated, ctx.caller, ctx.caller, ctx.now);
            for (size_t i = 0; i < beneficiaries.size(); ++i) {
                event.addAccount(beneficiaries[i]);
                event.addValue(shares[i]);
            }
            event.amount = plan.total_amount;
            auto recorded = record(event);
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            state_.index.revokeAll(ctx.caller);
            plan.setBeneficiaries(beneficiaries, shares);
            plan.claim_basis = plan.total_amount;
            for (const auto &beneficiary : beneficiaries) {
                if (!claimedFromPlan(ctx.caller, beneficiary))
                    state_.index.grant(ctx.caller, beneficiary);
            }

            trace("Beneficiaries updated by " + ctx.caller + ": " + std::to_string(beneficiaries.size()) + " listed");
            return dp::Result<void, dp::Error>::ok();
        });
    }

    // ===========================================
    // Emergency gate
    // ===========================================

    dp::Result<void, dp::Error> EscrowLedger::activateEmergencyRecovery(const CallContext &ctx,
                                                                        const std::string &owner) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "activateEmergencyRecovery";

            auto it = state_.plans.find(owner);
            if (it == state_.plans.end()) {
                return reject<void>(op, inheritance_not_found());
            }
            auto &plan = it->second;
            if (ctx.caller.empty() || plan.getEmergencyContact() != ctx.caller) {
                return reject<void>(op, unauthorized_access("Caller is not the emergency contact"));
            }
            if (!plan.is_active) {
                return reject<void>(op, invalid_parameters("Inheritance is not active"));
            }
            if (plan.emergency_mode) {
                return reject<void>(op, emergency_mode_active("Emergency mode already active"));
            }

            auto recorded = record(EscrowEvent(EventType::EmergencyModeActivated, owner, ctx.caller, ctx.now));
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            plan.emergency_mode = true;

            trace("Emergency mode activated on " + owner + " by " + ctx.caller);
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<void, dp::Error> EscrowLedger::deactivateEmergencyRecovery(const CallContext &ctx) {
        return deactivateEmergencyRecovery(ctx, ctx.caller);
    }

    dp::Result<void, dp::Error> EscrowLedger::deactivateEmergencyRecovery(const CallContext &ctx,
                                                                          const std::string &owner) {
        return transact<void>([&]() -> dp::Result<void, dp::Error> {
            const std::string op = "deactivateEmergencyRecovery";

            auto it = state_.plans.find(owner);
            if (it == state_.plans.end()) {
                return reject<void>(op, inheritance_not_found());
            }
            auto &plan = it->second;
            if (ctx.caller.empty() || (plan.getOwner() != ctx.caller && plan.getEmergencyContact() != ctx.caller)) {
                return reject<void>(op, unauthorized_access("Caller is neither owner nor emergency contact"));
            }
            if (!plan.emergency_mode) {
                return reject<void>(op, invalid_parameters("Emergency mode not active"));
            }

            auto recorded = record(EscrowEvent(EventType::EmergencyModeDeactivated, owner, ctx.caller, ctx.now));
            if (!recorded.is_ok()) {
                return reject<void>(op, recorded.error());
            }

            plan.emergency_mode = false;

            trace("Emergency mode deactivated on " + owner + " by " + ctx.caller);
            return dp::Result<void, dp::Error>::ok();
        });
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<InheritancePlan, dp::Error> EscrowLedger::getPlanDetails(const std::string &owner) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.plans.find(owner);
        if (it == state_.plans.end()) {
            return dp::Result<InheritancePlan, dp::Error>::err(inheritance_not_found());
        }
        return dp::Result<InheritancePlan, dp::Error>::ok(it->second);
    }

    bool EscrowLedger::hasPlan(const std::string &owner) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.plans.find(owner) != state_.plans.end();
    }

    bool EscrowLedger::canClaim(const std::string &owner, dp::u64 now) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.plans.find(owner);
        if (it == state_.plans.end())
            return false;
        const auto &plan = it->second;
        return plan.is_active && !plan.emergency_mode && plan.total_amount > 0 && plan.isUnlocked(now);
    }

    dp::Result<dp::u64, dp::Error> EscrowLedger::timeUntilClaimable(const std::string &owner, dp::u64 now) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.plans.find(owner);
        if (it == state_.plans.end()) {
            return dp::Result<dp::u64, dp::Error>::err(inheritance_not_found());
        }
        const auto &plan = it->second;
        if (!plan.is_active || plan.isUnlocked(now)) {
            return dp::Result<dp::u64, dp::Error>::ok(0);
        }
        return dp::Result<dp::u64, dp::Error>::ok(plan.unlockTime() - now);
    }

    dp::u32 EscrowLedger::getBeneficiaryShare(const std::string &owner, const std::string &beneficiary) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.plans.find(owner);
        if (it == state_.plans.end())
            return 0;
        return it->second.shareOf(beneficiary);
    }

    LedgerStats EscrowLedger::getStats() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.stats;
    }

    bool EscrowLedger::isAuthorizedBeneficiary(const std::string &owner, const std::string &beneficiary) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.index.isAuthorized(owner, beneficiary);
    }

    dp::u64 EscrowLedger::getClaimedAmount(const std::string &beneficiary) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.claimed_total.find(beneficiary);
        return (it != state_.claimed_total.end()) ? it->second : 0;
    }

    dp::u64 EscrowLedger::getClaimedAmount(const std::string &owner, const std::string &beneficiary) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.claimed_by_plan.find({owner, beneficiary});
        return (it != state_.claimed_by_plan.end()) ? it->second : 0;
    }

    std::vector<std::string> EscrowLedger::getPlansForBeneficiary(const std::string &beneficiary) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.index.getOwnersFor(beneficiary);
    }

    dp::u64 EscrowLedger::getContractBalance() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.balance;
    }

    std::vector<EscrowEvent> EscrowLedger::getEvents() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return log_.getEvents();
    }

    std::vector<EscrowEvent> EscrowLedger::getEventsFor(const std::string &owner) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return log_.getEventsFor(owner);
    }

    bool EscrowLedger::verifyEventLog() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return log_.verify();
    }

    dp::Result<void, dp::Error> EscrowLedger::checkInvariants() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        dp::u64 active = 0;
        dp::u64 locked = 0;
        size_t expected_pairs = 0;

        for (const auto &[owner, plan] : state_.plans) {
            auto beneficiaries = plan.getBeneficiaries();
            auto shares = plan.getShares();
            if (beneficiaries.size() != shares.size()) {
                return dp::Result<void, dp::Error>::err(invalid_parameters(message("Share list mismatch: " + owner)));
            }
            dp::u32 total = 0;
            for (auto s : shares)
                total += s;
            if (total != SHARE_TOTAL) {
                return dp::Result<void, dp::Error>::err(invalid_parameters(message("Shares do not total 100: " + owner)));
            }
            if (plan.total_amount == 0 && plan.is_active) {
                return dp::Result<void, dp::Error>::err(invalid_parameters(message("Drained plan still active: " + owner)));
            }
            if (plan.total_amount > plan.total_deposited || plan.total_amount > plan.claim_basis) {
                return dp::Result<void, dp::Error>::err(
                    invalid_parameters(message("Balance exceeds deposits: " + owner)));
            }

            for (const auto &beneficiary : beneficiaries) {
                bool expected = !claimedFromPlan(owner, beneficiary);
                if (state_.index.isAuthorized(owner, beneficiary) != expected) {
                    return dp::Result<void, dp::Error>::err(
                        invalid_parameters(message("Index out of sync for " + owner + "/" + beneficiary)));
                }
                if (expected)
                    expected_pairs++;
            }

            if (plan.is_active)
                active++;
            locked += plan.total_amount;
        }

        if (state_.index.size() != expected_pairs) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Index holds unlisted beneficiaries"));
        }
        if (active != state_.stats.active_plans) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Active plan count out of sync"));
        }
        if (locked != state_.stats.total_locked || locked != state_.balance) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Total locked out of sync"));
        }
        if (state_.stats.total_plans != state_.plans.size()) {
            return dp::Result<void, dp::Error>::err(invalid_parameters("Plan count out of sync"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void EscrowLedger::subscribe(EventListener listener) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    void EscrowLedger::printLedgerSummary(std::ostream &out) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        out << "=== Escrow Ledger Summary ===" << std::endl;
        out << "Claim policy: " << claimPolicyToString(config_.claim_policy) << std::endl;
        out << "Plans: " << state_.stats.total_plans << " (active: " << state_.stats.active_plans << ")" << std::endl;
        out << "Total locked: " << state_.stats.total_locked << std::endl;
        out << "Total claimed: " << state_.stats.total_claimed << std::endl;

        std::vector<std::string> owners;
        for (const auto &entry : state_.plans)
            owners.push_back(entry.first);
        std::sort(owners.begin(), owners.end());

        for (const auto &owner : owners) {
            const auto &plan = state_.plans.at(owner);
            out << "  " << owner << ": " << plan.total_amount << "/" << plan.total_deposited
                << (plan.is_active ? " active" : " inactive") << (plan.emergency_mode ? " EMERGENCY" : "")
                << std::endl;
            auto beneficiaries = plan.getBeneficiaries();
            auto shares = plan.getShares();
            for (size_t i = 0; i < beneficiaries.size(); ++i) {
                out << "    " << beneficiaries[i] << " " << shares[i] << "%"
                    << (state_.index.isAuthorized(owner, beneficiaries[i]) ? "" : " (claimed)") << std::endl;
            }
        }
        out << "Events: " << log_.size() << " (chain " << (log_.verify() ? "valid" : "BROKEN") << ")" << std::endl;
    }

} // namespace heirloom::escrow
