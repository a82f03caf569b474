#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "event.hpp"

namespace heirloom::escrow {

    /// Append-only audit log of committed escrow events
    ///
    /// Each event carries the SHA-256 of its own encoding chained to the hash of the
    /// event before it, so any edit to a committed event breaks verification.
    class EventLog {
      private:
        std::vector<EscrowEvent> events_;

        std::string hashData(const std::vector<uint8_t> &data) const;

      public:
        static inline const std::string GENESIS_HASH = std::string(64, '0');

        EventLog() = default;

        /// Assign sequence and hashes, then append
        dp::Result<EscrowEvent, dp::Error> append(EscrowEvent event);

        const std::vector<EscrowEvent> &getEvents() const { return events_; }

        std::vector<EscrowEvent> getEventsFor(const std::string &owner) const;

        std::vector<EscrowEvent> getEventsOfType(EventType type) const;

        std::string getHeadHash() const;

        /// Recompute the hash chain from the genesis hash
        bool verify() const;

        size_t size() const { return events_.size(); }

        bool empty() const { return events_.empty(); }

        /// Drop every event past the first count (transaction rollback)
        void truncate(size_t count);

        /// Rebuild a log from previously exported events (verification left to the caller)
        static EventLog fromEvents(const std::vector<EscrowEvent> &events);
    };

} // namespace heirloom::escrow
