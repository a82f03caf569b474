#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include "heirloom/common/error.hpp"

namespace heirloom::escrow {

    constexpr dp::u64 SECONDS_PER_DAY = 24 * 60 * 60;
    constexpr dp::u32 SHARE_TOTAL = 100;

    /// Scope of the once-only claim rule
    enum class ClaimPolicy : dp::u8 {
        GlobalOnce = 0, // A beneficiary who claimed from any plan may never claim again
        PerPlan = 1,    // Once-only per (owner, beneficiary) pair
    };

    inline std::string claimPolicyToString(ClaimPolicy policy) {
        switch (policy) {
        case ClaimPolicy::GlobalOnce:
            return "global-once";
        case ClaimPolicy::PerPlan:
            return "per-plan";
        default:
            return "unknown";
        }
    }

    /// Escrow ledger configuration
    struct EscrowConfig {
        // Lock duration bounds (seconds)
        dp::u64 min_lock_duration = 30 * SECONDS_PER_DAY;
        dp::u64 max_lock_duration = 10 * 365 * SECONDS_PER_DAY;

        // Beneficiary list bounds
        dp::usize max_beneficiaries = 20;

        ClaimPolicy claim_policy = ClaimPolicy::GlobalOnce;

        // Print state transitions and rejections to stdout
        bool verbose = false;

        /// Reject bounds that would make every plan invalid
        inline dp::Result<void, dp::Error> validate() const {
            if (min_lock_duration == 0 || min_lock_duration > max_lock_duration) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Lock duration bounds are inconsistent"));
            }
            if (max_beneficiaries == 0) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Beneficiary cap must be positive"));
            }
            return dp::Result<void, dp::Error>::ok();
        }
    };

} // namespace heirloom::escrow
