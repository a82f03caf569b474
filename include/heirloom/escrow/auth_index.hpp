#pragma once

#include <iostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace heirloom::escrow {

    /// Secondary index of (owner, beneficiary) claim authorizations
    ///
    /// An entry exists iff the beneficiary is listed in the owner's plan and has not
    /// yet claimed from it. Maintained by the ledger alongside the plan records.
    class AuthorizationIndex {
      private:
        std::unordered_map<std::string, std::unordered_set<std::string>> by_owner_;
        std::unordered_map<std::string, std::unordered_set<std::string>> by_beneficiary_;

      public:
        AuthorizationIndex() = default;

        void grant(const std::string &owner, const std::string &beneficiary);

        void revoke(const std::string &owner, const std::string &beneficiary);

        void revokeAll(const std::string &owner);

        bool isAuthorized(const std::string &owner, const std::string &beneficiary) const;

        std::vector<std::string> getAuthorized(const std::string &owner) const;

        /// Owners whose plans currently authorize this beneficiary
        std::vector<std::string> getOwnersFor(const std::string &beneficiary) const;

        size_t size() const;

        bool empty() const { return by_owner_.empty(); }

        void clear();

        void printIndexSummary(std::ostream &out = std::cout) const;
    };

} // namespace heirloom::escrow
