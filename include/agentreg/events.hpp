#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentreg
{
    /**
     * Structured notification emitted by a committed mutation. Fields carry
     * enough post-state for an observer to rebuild the registry without
     * reading storage.
     */
    struct Event
    {
        uint64_t sequence{0};
        std::string registry; // "identity", "reputation", "validation", "incident"
        std::string name;     // e.g. "Registered", "FeedbackRevoked"
        uint64_t timestamp{0};
        nlohmann::json fields;
        std::string previous_hash;
        std::string hash;

        /** Hashed body: everything except the hash itself */
        nlohmann::json body_json() const;
        nlohmann::json to_json() const;
        static Result<Event> from_json(const nlohmann::json &j);
    };

    /**
     * Append-only, hash-chained event ledger shared by the registries of one
     * suite. Each hash is SHA-256 over the canonical JSON of the event body,
     * which includes the previous hash.
     */
    class EventLog
    {
    public:
        using Listener = std::function<void(const Event &)>;

        EventLog();

        /** Append an event, returning the committed copy */
        const Event &emit(std::string registry,
                          std::string name,
                          uint64_t timestamp,
                          nlohmann::json fields);

        const std::vector<Event> &events() const { return events_; }

        std::size_t size() const { return events_.size(); }

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        /** Events with sequence >= from */
        std::vector<Event> since(uint64_t from) const;

        /** Events emitted by one registry with the given name */
        std::vector<Event> named(const std::string &registry, const std::string &name) const;

        /** Called synchronously after every append */
        void subscribe(Listener listener);

        /** Recompute every link of a chain */
        static Result<void> verify(const std::vector<Event> &chain);

        static std::string compute_hash(const Event &event);

    private:
        std::vector<Event> events_;
        std::vector<Listener> listeners_;
    };

    /** Writes ledger events as JSON lines through spdlog */
    class EventLogger
    {
    public:
        EventLogger();

        void log(const Event &event);

        /** Subscribe this logger to a ledger */
        void attach(EventLog &log);
    };

} // namespace agentreg
