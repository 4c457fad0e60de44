#pragma once

#include "config.hpp"
#include "events.hpp"
#include "types.hpp"
#include <memory>
#include <vector>

namespace agentreg
{

    /**
     * Abstract interface for durable event storage backends.
     * The ledger lives in memory while operations commit; a journal receives
     * the committed events afterwards, so a storage failure can never leave a
     * registry half-mutated.
     */
    class EventJournal
    {
    public:
        virtual ~EventJournal() = default;

        /**
         * Persist one committed event. Events must arrive in sequence order
         * starting at size().
         */
        virtual Result<void> append(const Event &event) = 0;

        /** All persisted events in sequence order */
        virtual Result<std::vector<Event>> load_all() = 0;

        /** Number of persisted events */
        virtual uint64_t size() = 0;
    };

    /**
     * Copy every event the journal has not seen yet. Returns how many were
     * written.
     */
    Result<uint64_t> persist(const EventLog &log, EventJournal &journal);

#ifdef AGENTREG_HAVE_ROCKSDB
    /**
     * RocksDB-backed journal keyed by zero-padded sequence number.
     */
    class RocksDbEventJournal : public EventJournal
    {
    public:
        explicit RocksDbEventJournal(const JournalConfig &cfg);
        ~RocksDbEventJournal() override;

        Result<void> append(const Event &event) override;
        Result<std::vector<Event>> load_all() override;
        uint64_t size() override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
#endif

    /** Open the configured backend; fails when journaling is unavailable */
    Result<std::unique_ptr<EventJournal>> open_journal(const JournalConfig &cfg);

} // namespace agentreg
