#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "auth_index.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_log.hpp"
#include "heirloom/common/error.hpp"
#include "plan.hpp"
#include "transfer.hpp"

namespace heirloom::escrow {

    /// Authenticated caller and the time the call was received
    struct CallContext {
        std::string caller;
        dp::u64 now{0}; // Seconds
    };

    /// Time-locked inheritance escrow
    ///
    /// Owns every plan, the (owner, beneficiary) authorization index, the claim records
    /// and the audit log. Each public call is one atomic transaction: it either applies
    /// all of its effects or none of them. Claims mutate state before invoking the
    /// transfer primitive, so a reentrant call made by the transfer sees the post-claim
    /// state; a failed transfer rolls the whole transaction back. No claim may start
    /// while a transfer is running, since its payout could not be rolled back.
    class EscrowLedger {
      public:
        using EventListener = std::function<void(const EscrowEvent &)>;

        /// Throws std::invalid_argument when the config is rejected by EscrowConfig::validate()
        explicit EscrowLedger(std::shared_ptr<FundsTransfer> transfer = nullptr,
                              const EscrowConfig &config = EscrowConfig{});

        EscrowLedger(const EscrowLedger &) = delete;
        EscrowLedger &operator=(const EscrowLedger &) = delete;

        // ===========================================
        // Plan lifecycle
        // ===========================================

        dp::Result<void, dp::Error> createPlan(const CallContext &ctx, const std::vector<std::string> &beneficiaries,
                                               const std::vector<dp::u32> &shares, dp::u64 lock_duration,
                                               const std::string &emergency_contact, const std::string &description,
                                               dp::u64 deposit);

        dp::Result<void, dp::Error> submitProofOfLife(const CallContext &ctx);

        /// Pay the caller's share of the owner's plan, returns the amount transferred
        dp::Result<dp::u64, dp::Error> claimInheritance(const CallContext &ctx, const std::string &owner);

        dp::Result<void, dp::Error> addFunds(const CallContext &ctx, dp::u64 amount);

        dp::Result<void, dp::Error> updateBeneficiaries(const CallContext &ctx,
                                                        const std::vector<std::string> &beneficiaries,
                                                        const std::vector<dp::u32> &shares);

        // ===========================================
        // Emergency gate
        // ===========================================

        dp::Result<void, dp::Error> activateEmergencyRecovery(const CallContext &ctx, const std::string &owner);

        /// Clear the emergency flag on the caller's own plan
        dp::Result<void, dp::Error> deactivateEmergencyRecovery(const CallContext &ctx);

        /// Clear the emergency flag on the owner's plan; caller must be the owner or the emergency contact
        dp::Result<void, dp::Error> deactivateEmergencyRecovery(const CallContext &ctx, const std::string &owner);

        // ===========================================
        // Queries
        // ===========================================

        dp::Result<InheritancePlan, dp::Error> getPlanDetails(const std::string &owner) const;

        bool hasPlan(const std::string &owner) const;

        bool canClaim(const std::string &owner, dp::u64 now) const;

        dp::Result<dp::u64, dp::Error> timeUntilClaimable(const std::string &owner, dp::u64 now) const;

        dp::u32 getBeneficiaryShare(const std::string &owner, const std::string &beneficiary) const;

        LedgerStats getStats() const;

        bool isAuthorizedBeneficiary(const std::string &owner, const std::string &beneficiary) const;

        /// Cumulative amount claimed by a beneficiary across all plans
        dp::u64 getClaimedAmount(const std::string &beneficiary) const;

        /// Amount a beneficiary claimed from one owner's plan
        dp::u64 getClaimedAmount(const std::string &owner, const std::string &beneficiary) const;

        /// Owners whose plans the beneficiary may still claim from
        std::vector<std::string> getPlansForBeneficiary(const std::string &beneficiary) const;

        /// Funds held in escrow across all plans
        dp::u64 getContractBalance() const;

        std::vector<EscrowEvent> getEvents() const;

        std::vector<EscrowEvent> getEventsFor(const std::string &owner) const;

        bool verifyEventLog() const;

        /// Cross-check plans, index, claim records and aggregates
        dp::Result<void, dp::Error> checkInvariants() const;

        /// Receive every event once its transaction commits
        void subscribe(EventListener listener);

        inline const EscrowConfig &getConfig() const { return config_; }

        void printLedgerSummary(std::ostream &out = std::cout) const;

      private:
        struct LedgerState {
            std::unordered_map<std::string, InheritancePlan> plans;
            AuthorizationIndex index;
            std::unordered_map<std::string, dp::u64> claimed_total;
            std::map<std::pair<std::string, std::string>, dp::u64> claimed_by_plan;
            LedgerStats stats;
            dp::u64 balance{0};
        };

        template <typename T, typename Fn> dp::Result<T, dp::Error> transact(Fn &&fn);

        template <typename T>
        dp::Result<T, dp::Error> reject(const std::string &operation, const dp::Error &error) const;

        dp::Result<void, dp::Error> validateBeneficiaries(const std::string &emergency_contact,
                                                          const std::vector<std::string> &beneficiaries,
                                                          const std::vector<dp::u32> &shares) const;

        dp::Result<void, dp::Error> record(EscrowEvent event);

        bool hasClaimed(const std::string &owner, const std::string &beneficiary) const;

        bool claimedFromPlan(const std::string &owner, const std::string &beneficiary) const;

        void trace(const std::string &message) const;

        static dp::u64 computeShare(dp::u64 basis, dp::u32 share);

        EscrowConfig config_;
        std::shared_ptr<FundsTransfer> transfer_;
        LedgerState state_;
        EventLog log_;
        std::vector<EventListener> listeners_;
        size_t depth_{0};
        size_t commit_mark_{0}; // Log size when the outermost transaction opened
        bool transfer_in_flight_{false};
        mutable std::recursive_mutex mutex_;
    };

} // namespace heirloom::escrow
