#include "agentreg/events.hpp"
#include "agentreg/canonical_json.hpp"
#include "agentreg/crypto.hpp"
#include <format>
#include <spdlog/spdlog.h>

namespace agentreg
{

    nlohmann::json Event::body_json() const
    {
        return nlohmann::json{{"sequence", sequence},
                              {"registry", registry},
                              {"name", name},
                              {"timestamp", timestamp},
                              {"fields", fields},
                              {"previous_hash", previous_hash}};
    }

    nlohmann::json Event::to_json() const
    {
        auto j = body_json();
        j["hash"] = hash;
        return j;
    }

    Result<Event> Event::from_json(const nlohmann::json &j)
    {
        try
        {
            Event e;
            e.sequence = j.at("sequence").get<uint64_t>();
            e.registry = j.at("registry").get<std::string>();
            e.name = j.at("name").get<std::string>();
            e.timestamp = j.at("timestamp").get<uint64_t>();
            e.fields = j.at("fields");
            e.previous_hash = j.value("previous_hash", "");
            e.hash = j.at("hash").get<std::string>();
            return e;
        }
        catch (const nlohmann::json::exception &ex)
        {
            return std::unexpected(RegistryError::parsing(std::format("Malformed event: {}", ex.what())));
        }
    }

    EventLog::EventLog() = default;

    std::string EventLog::compute_hash(const Event &event)
    {
        auto canonical = json::Canonicalizer::canonicalize(event.body_json());
        return crypto::SHA256::hash(canonical).to_hex();
    }

    const Event &EventLog::emit(std::string registry,
                                std::string name,
                                uint64_t timestamp,
                                nlohmann::json fields)
    {
        Event event;
        event.sequence = events_.size();
        event.registry = std::move(registry);
        event.name = std::move(name);
        event.timestamp = timestamp;
        event.fields = std::move(fields);
        event.previous_hash = events_.empty() ? std::string() : events_.back().hash;
        event.hash = compute_hash(event);

        events_.push_back(std::move(event));
        const Event &committed = events_.back();
        for (const auto &listener : listeners_)
            listener(committed);
        return committed;
    }

    std::optional<std::string> EventLog::head() const
    {
        if (events_.empty())
            return std::nullopt;
        return events_.back().hash;
    }

    std::vector<Event> EventLog::since(uint64_t from) const
    {
        if (from >= events_.size())
            return {};
        return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(from), events_.end());
    }

    std::vector<Event> EventLog::named(const std::string &registry, const std::string &name) const
    {
        std::vector<Event> out;
        for (const auto &e : events_)
        {
            if (e.registry == registry && e.name == name)
                out.push_back(e);
        }
        return out;
    }

    void EventLog::subscribe(Listener listener)
    {
        listeners_.push_back(std::move(listener));
    }

    Result<void> EventLog::verify(const std::vector<Event> &chain)
    {
        std::string previous;
        for (std::size_t i = 0; i < chain.size(); ++i)
        {
            const auto &e = chain[i];
            if (i > 0 && e.sequence != chain[i - 1].sequence + 1)
            {
                return std::unexpected(RegistryError::integrity(
                    std::format("Sequence gap before event {}", e.sequence)));
            }
            if (i > 0 && e.previous_hash != previous)
            {
                return std::unexpected(RegistryError::integrity(
                    std::format("Broken link at event {}", e.sequence)));
            }
            if (compute_hash(e) != e.hash)
            {
                return std::unexpected(RegistryError::integrity(
                    std::format("Hash mismatch at event {}", e.sequence)));
            }
            previous = e.hash;
        }
        return {};
    }

    EventLogger::EventLogger() = default;

    void EventLogger::log(const Event &event)
    {
        spdlog::info(event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void EventLogger::attach(EventLog &log)
    {
        log.subscribe([this](const Event &e) { this->log(e); });
    }

} // namespace agentreg
