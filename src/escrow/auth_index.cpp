#include <algorithm>
#include <heirloom/escrow/auth_index.hpp>

namespace heirloom::escrow {

    void AuthorizationIndex::grant(const std::string &owner, const std::string &beneficiary) {
        by_owner_[owner].insert(beneficiary);
        by_beneficiary_[beneficiary].insert(owner);
    }

    void AuthorizationIndex::revoke(const std::string &owner, const std::string &beneficiary) {
        auto owner_it = by_owner_.find(owner);
        if (owner_it != by_owner_.end()) {
            owner_it->second.erase(beneficiary);
            if (owner_it->second.empty())
                by_owner_.erase(owner_it);
        }

        auto ben_it = by_beneficiary_.find(beneficiary);
        if (ben_it != by_beneficiary_.end()) {
            ben_it->second.erase(owner);
            if (ben_it->second.empty())
                by_beneficiary_.erase(ben_it);
        }
    }

    void AuthorizationIndex::revokeAll(const std::string &owner) {
        auto owner_it = by_owner_.find(owner);
        if (owner_it == by_owner_.end())
            return;

        auto beneficiaries = owner_it->second;
        for (const auto &beneficiary : beneficiaries)
            revoke(owner, beneficiary);
    }

    bool AuthorizationIndex::isAuthorized(const std::string &owner, const std::string &beneficiary) const {
        auto it = by_owner_.find(owner);
        if (it == by_owner_.end())
            return false;
        return it->second.find(beneficiary) != it->second.end();
    }

    std::vector<std::string> AuthorizationIndex::getAuthorized(const std::string &owner) const {
        auto it = by_owner_.find(owner);
        if (it == by_owner_.end())
            return {};

        std::vector<std::string> result(it->second.begin(), it->second.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<std::string> AuthorizationIndex::getOwnersFor(const std::string &beneficiary) const {
        auto it = by_beneficiary_.find(beneficiary);
        if (it == by_beneficiary_.end())
            return {};

        std::vector<std::string> result(it->second.begin(), it->second.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    size_t AuthorizationIndex::size() const {
        size_t total = 0;
        for (const auto &entry : by_owner_)
            total += entry.second.size();
        return total;
    }

    void AuthorizationIndex::clear() {
        by_owner_.clear();
        by_beneficiary_.clear();
    }

    void AuthorizationIndex::printIndexSummary(std::ostream &out) const {
        out << "=== Authorization Index ===" << std::endl;
        out << "Plans with claimants (" << by_owner_.size() << "):" << std::endl;
        for (const auto &entry : by_owner_) {
            out << "  " << entry.first << ": ";
            for (const auto &beneficiary : getAuthorized(entry.first))
                out << beneficiary << " ";
            out << std::endl;
        }
        out << "Authorized pairs: " << size() << std::endl;
    }

} // namespace heirloom::escrow
