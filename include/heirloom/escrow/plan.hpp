#pragma once

#include <datapod/datapod.hpp>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace heirloom::escrow {

    /// Inheritance plan held in escrow for one depositor
    struct InheritancePlan {
        dp::String owner;
        dp::Vector<dp::String> beneficiaries;
        dp::Vector<dp::u32> shares; // Parallel to beneficiaries, percent
        dp::u64 lock_duration{0};   // Seconds
        dp::u64 last_proof_of_life{0};
        dp::u64 total_amount{0};    // Remaining unclaimed balance
        dp::u64 total_deposited{0}; // Creation deposit plus top-ups
        dp::u64 claim_basis{0};     // Amount shares apply to, reset on beneficiary update
        dp::u64 creation_time{0};
        bool is_active{false};
        bool emergency_mode{false};
        dp::String emergency_contact;
        dp::String description;

        InheritancePlan() = default;

        inline std::string getOwner() const { return std::string(owner.c_str()); }

        inline std::string getEmergencyContact() const { return std::string(emergency_contact.c_str()); }

        inline std::string getDescription() const { return std::string(description.c_str()); }

        inline std::vector<std::string> getBeneficiaries() const {
            std::vector<std::string> result;
            result.reserve(beneficiaries.size());
            for (const auto &b : beneficiaries) {
                result.push_back(std::string(b.c_str()));
            }
            return result;
        }

        inline std::vector<dp::u32> getShares() const { return std::vector<dp::u32>(shares.begin(), shares.end()); }

        /// Replace the beneficiary list (caller validates)
        inline void setBeneficiaries(const std::vector<std::string> &new_beneficiaries,
                                     const std::vector<dp::u32> &new_shares) {
            beneficiaries.clear();
            shares.clear();
            for (const auto &b : new_beneficiaries) {
                beneficiaries.push_back(dp::String(b.c_str()));
            }
            for (auto s : new_shares) {
                shares.push_back(s);
            }
        }

        /// Share of the first matching beneficiary, 0 if not listed
        inline dp::u32 shareOf(const std::string &beneficiary) const {
            for (dp::usize i = 0; i < beneficiaries.size() && i < shares.size(); ++i) {
                if (std::string(beneficiaries[i].c_str()) == beneficiary) {
                    return shares[i];
                }
            }
            return 0;
        }

        inline bool isBeneficiary(const std::string &identity) const {
            for (const auto &b : beneficiaries) {
                if (std::string(b.c_str()) == identity) {
                    return true;
                }
            }
            return false;
        }

        /// Earliest time at which claims open, saturating at the largest timestamp
        inline dp::u64 unlockTime() const {
            if (last_proof_of_life > std::numeric_limits<dp::u64>::max() - lock_duration)
                return std::numeric_limits<dp::u64>::max();
            return last_proof_of_life + lock_duration;
        }

        inline bool isUnlocked(dp::u64 now) const { return now >= unlockTime(); }

        inline dp::ByteBuf serialize() const {
            auto &self = const_cast<InheritancePlan &>(*this);
            return dp::serialize<dp::Mode::WITH_VERSION>(self);
        }

        inline static dp::Result<InheritancePlan, dp::Error> deserialize(const dp::ByteBuf &data) {
            try {
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, InheritancePlan>(data);
                return dp::Result<InheritancePlan, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<InheritancePlan, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        /// Serialization
        auto members() {
            return std::tie(owner, beneficiaries, shares, lock_duration, last_proof_of_life, total_amount,
                            total_deposited, claim_basis, creation_time, is_active, emergency_mode, emergency_contact,
                            description);
        }
        auto members() const {
            return std::tie(owner, beneficiaries, shares, lock_duration, last_proof_of_life, total_amount,
                            total_deposited, claim_basis, creation_time, is_active, emergency_mode, emergency_contact,
                            description);
        }
    };

    /// Aggregate ledger statistics
    struct LedgerStats {
        dp::u64 active_plans{0};
        dp::u64 total_locked{0};
        dp::u64 total_plans{0};
        dp::u64 total_claimed{0};
    };

} // namespace heirloom::escrow
