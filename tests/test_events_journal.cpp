#include <catch2/catch_test_macros.hpp>
#include "agentreg/events.hpp"
#include "agentreg/journal.hpp"

using namespace agentreg;

namespace
{
    class InMemoryJournal : public EventJournal
    {
    public:
        Result<void> append(const Event &event) override
        {
            if (event.sequence != events_.size())
                return std::unexpected(RegistryError::storage("out-of-order append"));
            events_.push_back(event);
            return {};
        }

        Result<std::vector<Event>> load_all() override { return events_; }

        uint64_t size() override { return events_.size(); }

    private:
        std::vector<Event> events_;
    };

    EventLog sample_log()
    {
        EventLog log;
        log.emit("identity", "Registered", 10, {{"agent_id", 1}});
        log.emit("identity", "Transfer", 11, {{"agent_id", 1}, {"to", "0x01"}});
        log.emit("reputation", "NewFeedback", 12, {{"agent_id", 1}, {"index", 0}});
        return log;
    }
}

TEST_CASE("Event ledger links each event to its predecessor", "[events]")
{
    auto log = sample_log();
    REQUIRE(log.size() == 3);

    const auto &events = log.events();
    REQUIRE(events[0].sequence == 0);
    REQUIRE(events[0].previous_hash.empty());
    REQUIRE(events[1].previous_hash == events[0].hash);
    REQUIRE(events[2].previous_hash == events[1].hash);
    REQUIRE(log.head() == events[2].hash);
    REQUIRE(EventLog::verify(events).has_value());

    REQUIRE(log.named("identity", "Transfer").size() == 1);
    REQUIRE(log.since(2).size() == 1);
    REQUIRE(log.since(5).empty());
}

TEST_CASE("Tampering breaks verification", "[events]")
{
    auto chain = sample_log().events();

    SECTION("Edited fields")
    {
        chain[1].fields["to"] = "0x02";
        auto res = EventLog::verify(chain);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::IntegrityViolation);
    }

    SECTION("Dropped event")
    {
        chain.erase(chain.begin() + 1);
        REQUIRE_FALSE(EventLog::verify(chain).has_value());
    }
}

TEST_CASE("Listeners observe committed events", "[events]")
{
    EventLog log;
    std::vector<std::string> seen;
    log.subscribe([&seen](const Event &e) { seen.push_back(e.name); });
    log.emit("incident", "IncidentReported", 1, nlohmann::json::object());
    REQUIRE(seen == std::vector<std::string>{"IncidentReported"});
}

TEST_CASE("Event echo tolerates undecodable text", "[events]")
{
    EventLog log;
    EventLogger logger;
    logger.attach(log);
    REQUIRE_NOTHROW(log.emit("identity", "Registered", 1, {{"agent_id", 1}, {"uri", "ipfs://\xff"}}));
    REQUIRE(log.size() == 1);
}

TEST_CASE("Event JSON round trip keeps the hash valid", "[events]")
{
    auto log = sample_log();
    std::vector<Event> restored;
    for (const auto &e : log.events())
    {
        auto parsed = Event::from_json(nlohmann::json::parse(e.to_json().dump()));
        REQUIRE(parsed.has_value());
        restored.push_back(*parsed);
    }
    REQUIRE(EventLog::verify(restored).has_value());

    auto bad = Event::from_json(nlohmann::json{{"sequence", "x"}});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ParsingError);
}

TEST_CASE("Persisting to a journal is incremental", "[journal]")
{
    auto log = sample_log();
    InMemoryJournal journal;

    auto first = persist(log, journal);
    REQUIRE(first.has_value());
    REQUIRE(*first == 3);

    log.emit("validation", "ValidationRequested", 13, {{"request_id", "0x00"}});
    auto second = persist(log, journal);
    REQUIRE(second.has_value());
    REQUIRE(*second == 1);
    REQUIRE(journal.size() == 4);

    auto loaded = journal.load_all();
    REQUIRE(loaded.has_value());
    REQUIRE(EventLog::verify(*loaded).has_value());

    SECTION("A journal ahead of the ledger is refused")
    {
        EventLog empty;
        auto res = persist(empty, journal);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::StorageError);
    }
}

TEST_CASE("Disabled journal cannot be opened", "[journal]")
{
    JournalConfig cfg;
    cfg.enabled = false;
    auto res = open_journal(cfg);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::ConfigError);
}
