#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <unordered_map>

#include "heirloom/common/error.hpp"

namespace heirloom::escrow {

    /// Outbound funds-transfer primitive
    ///
    /// A transfer either fully succeeds or fully fails. Implementations may call back
    /// into the ledger; such calls run inside the claim's transaction.
    class FundsTransfer {
      public:
        virtual ~FundsTransfer() = default;

        virtual dp::Result<void, dp::Error> transfer(const std::string &recipient, dp::u64 amount) = 0;
    };

    /// In-process transfer target that records payouts per recipient
    class InMemoryVault : public FundsTransfer {
      public:
        InMemoryVault() = default;

        inline dp::Result<void, dp::Error> transfer(const std::string &recipient, dp::u64 amount) override {
            if (failing_) {
                return dp::Result<void, dp::Error>::err(insufficient_funds("Transfer rejected by vault"));
            }
            if (recipient.empty()) {
                return dp::Result<void, dp::Error>::err(invalid_parameters("Transfer to null identity"));
            }
            paid_[recipient] += amount;
            total_paid_ += amount;
            transfer_count_++;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Total paid out to a recipient
        inline dp::u64 getPaid(const std::string &recipient) const {
            auto it = paid_.find(recipient);
            return (it != paid_.end()) ? it->second : 0;
        }

        inline dp::u64 getTotalPaid() const { return total_paid_; }

        inline dp::u64 getTransferCount() const { return transfer_count_; }

        /// Make every subsequent transfer fail
        inline void setFailing(bool failing) { failing_ = failing; }

        inline bool isFailing() const { return failing_; }

      private:
        std::unordered_map<std::string, dp::u64> paid_;
        dp::u64 total_paid_{0};
        dp::u64 transfer_count_{0};
        bool failing_{false};
    };

} // namespace heirloom::escrow
