#include <heirloom/escrow/event_log.hpp>

namespace heirloom::escrow {

    std::string EventLog::hashData(const std::vector<uint8_t> &data) const {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(data);
        if (hash_result.success)
            return keylock::keylock::to_hex(hash_result.data);
        return "";
    }

    dp::Result<EscrowEvent, dp::Error> EventLog::append(EscrowEvent event) {
        event.sequence = static_cast<dp::u64>(events_.size());
        event.previous_hash = dp::String(getHeadHash().c_str());

        auto digest = hashData(event.contentBytes());
        if (digest.empty()) {
            return dp::Result<EscrowEvent, dp::Error>::err(dp::Error::io_error("Event hash computation failed"));
        }
        event.hash = dp::String(digest.c_str());

        events_.push_back(event);
        return dp::Result<EscrowEvent, dp::Error>::ok(event);
    }

    std::vector<EscrowEvent> EventLog::getEventsFor(const std::string &owner) const {
        std::vector<EscrowEvent> result;
        for (const auto &event : events_) {
            if (event.getOwner() == owner)
                result.push_back(event);
        }
        return result;
    }

    std::vector<EscrowEvent> EventLog::getEventsOfType(EventType type) const {
        std::vector<EscrowEvent> result;
        for (const auto &event : events_) {
            if (event.getType() == type)
                result.push_back(event);
        }
        return result;
    }

    std::string EventLog::getHeadHash() const {
        if (events_.empty())
            return GENESIS_HASH;
        return events_.back().getHash();
    }

    bool EventLog::verify() const {
        std::string previous = GENESIS_HASH;
        for (size_t i = 0; i < events_.size(); ++i) {
            const auto &event = events_[i];
            if (event.sequence != static_cast<dp::u64>(i))
                return false;
            if (event.getPreviousHash() != previous)
                return false;
            if (hashData(event.contentBytes()) != event.getHash())
                return false;
            previous = event.getHash();
        }
        return true;
    }

    void EventLog::truncate(size_t count) {
        if (count < events_.size())
            events_.resize(count);
    }

    EventLog EventLog::fromEvents(const std::vector<EscrowEvent> &events) {
        EventLog log;
        log.events_ = events;
        return log;
    }

} // namespace heirloom::escrow
