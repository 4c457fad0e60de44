#pragma once

#include "agent_directory.hpp"
#include "events.hpp"
#include "primitives.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentreg
{

    enum class IncidentStatus
    {
        Open,
        Responded,
        Resolved
    };

    /** None marks an unresolved incident and is never accepted by resolve() */
    enum class ResolutionCode
    {
        None,
        Acknowledged,
        Disputed,
        Fixed,
        NotABug,
        Duplicate
    };

    std::string incident_status_to_string(IncidentStatus s);
    std::string resolution_code_to_string(ResolutionCode c);
    Result<ResolutionCode> resolution_code_from_string(const std::string &s);

    struct Incident
    {
        IncidentId id{0};
        AgentId agent_id{0};
        Address reporter;
        std::string category;
        std::string report_uri;
        std::optional<Hash32> report_hash;
        uint64_t reported_at{0};
        IncidentStatus status{IncidentStatus::Open};

        std::string response_uri;
        std::optional<Hash32> response_hash;
        Address responder;
        uint64_t responded_at{0};

        ResolutionCode resolution{ResolutionCode::None};
        Address resolver;
        uint64_t resolved_at{0};

        nlohmann::json to_json() const;
    };

    struct IncidentSummary
    {
        uint64_t total{0};
        uint64_t open{0};
        uint64_t responded{0};
        uint64_t resolved{0};

        nlohmann::json to_json() const;
    };

    /**
     * Incident registry: Open -> Responded -> Resolved, strictly in order.
     * The agent's authority responds; only the reporter resolves.
     */
    class IncidentRegistry
    {
    public:
        IncidentRegistry(std::shared_ptr<const AgentDirectory> identity,
                         std::shared_ptr<EventLog> events);

        Result<IncidentId> report(const CallContext &ctx,
                                  AgentId agent_id,
                                  const std::string &report_uri,
                                  const std::optional<Hash32> &report_hash,
                                  const std::string &category);

        Result<void> respond(const CallContext &ctx,
                             IncidentId id,
                             const std::string &response_uri,
                             const std::optional<Hash32> &response_hash = std::nullopt);

        Result<void> resolve(const CallContext &ctx, IncidentId id, ResolutionCode code);

        Result<Incident> get_incident(IncidentId id) const;
        Result<std::vector<IncidentId>> agent_incidents(AgentId agent_id) const;
        std::vector<IncidentId> reporter_incidents(const Address &reporter) const;
        Result<uint64_t> incident_count(AgentId agent_id) const;
        Result<IncidentSummary> get_summary(AgentId agent_id) const;
        uint64_t total_incidents() const { return next_id_ - 1; }

    private:
        static constexpr const char *kRegistry = "incident";

        Result<Incident *> find(IncidentId id);

        std::shared_ptr<const AgentDirectory> identity_;
        std::shared_ptr<EventLog> events_;

        IncidentId next_id_{1};
        std::unordered_map<IncidentId, Incident> incidents_;
        std::unordered_map<AgentId, std::vector<IncidentId>> by_agent_;
        std::unordered_map<Address, std::vector<IncidentId>> by_reporter_;
    };

} // namespace agentreg
