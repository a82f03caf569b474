#pragma once

#include <datapod/datapod.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace heirloom::escrow {

    /// Audit event types emitted by the escrow ledger
    enum class EventType : dp::u8 {
        InheritanceCreated = 0,
        ProofOfLifeSubmitted = 1,
        InheritanceClaimed = 2,
        EmergencyModeActivated = 3,
        EmergencyModeDeactivated = 4,
        FundsAdded = 5,
        BeneficiariesUpdated = 6,
    };

    inline std::string eventTypeToString(EventType type) {
        switch (type) {
        case EventType::InheritanceCreated:
            return "InheritanceCreated";
        case EventType::ProofOfLifeSubmitted:
            return "ProofOfLifeSubmitted";
        case EventType::InheritanceClaimed:
            return "InheritanceClaimed";
        case EventType::EmergencyModeActivated:
            return "EmergencyModeActivated";
        case EventType::EmergencyModeDeactivated:
            return "EmergencyModeDeactivated";
        case EventType::FundsAdded:
            return "FundsAdded";
        case EventType::BeneficiariesUpdated:
            return "BeneficiariesUpdated";
        default:
            return "Unknown";
        }
    }

    /// Escrow audit record
    ///
    /// Field use per type:
    ///   InheritanceCreated       accounts=beneficiaries values=shares amount=deposit detail=lock duration
    ///   ProofOfLifeSubmitted     detail=new last proof of life
    ///   InheritanceClaimed       actor=beneficiary amount=claimed detail=plan remainder
    ///   EmergencyModeActivated   actor=emergency contact
    ///   EmergencyModeDeactivated actor=caller
    ///   FundsAdded               amount=top-up detail=plan total after top-up
    ///   BeneficiariesUpdated     accounts=beneficiaries values=shares amount=new claim basis
    struct EscrowEvent {
        dp::u64 sequence{0};
        dp::u8 event_type{0}; // EventType
        dp::String owner;
        dp::String actor;
        dp::Vector<dp::String> accounts;
        dp::Vector<dp::u64> values;
        dp::u64 amount{0};
        dp::u64 detail{0};
        dp::u64 timestamp{0};
        dp::String previous_hash;
        dp::String hash;

        EscrowEvent() = default;

        EscrowEvent(EventType type, const std::string &owner_id, const std::string &actor_id, dp::u64 ts)
            : event_type(static_cast<dp::u8>(type)), owner(dp::String(owner_id.c_str())),
              actor(dp::String(actor_id.c_str())), timestamp(ts) {}

        inline EventType getType() const { return static_cast<EventType>(event_type); }

        inline std::string getTypeName() const { return eventTypeToString(getType()); }

        inline std::string getOwner() const { return std::string(owner.c_str()); }

        inline std::string getActor() const { return std::string(actor.c_str()); }

        inline std::string getHash() const { return std::string(hash.c_str()); }

        inline std::string getPreviousHash() const { return std::string(previous_hash.c_str()); }

        inline std::vector<std::string> getAccounts() const {
            std::vector<std::string> result;
            for (const auto &a : accounts) {
                result.push_back(std::string(a.c_str()));
            }
            return result;
        }

        inline std::vector<dp::u64> getValues() const { return std::vector<dp::u64>(values.begin(), values.end()); }

        inline void addAccount(const std::string &account) { accounts.push_back(dp::String(account.c_str())); }

        inline void addValue(dp::u64 value) { values.push_back(value); }

        /// Encoding covered by the event hash (the hash field itself is blanked)
        inline std::vector<uint8_t> contentBytes() const {
            EscrowEvent copy = *this;
            copy.hash = dp::String();
            return copy.toBytes();
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<EscrowEvent &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<EscrowEvent, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, EscrowEvent>(buf);
                return dp::Result<EscrowEvent, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<EscrowEvent, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        /// Serialization
        auto members() {
            return std::tie(sequence, event_type, owner, actor, accounts, values, amount, detail, timestamp,
                            previous_hash, hash);
        }
        auto members() const {
            return std::tie(sequence, event_type, owner, actor, accounts, values, amount, detail, timestamp,
                            previous_hash, hash);
        }
    };

} // namespace heirloom::escrow
