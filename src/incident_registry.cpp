#include "agentreg/incident_registry.hpp"
#include "agentreg/checks.hpp"
#include "agentreg/limits.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentreg
{

    std::string incident_status_to_string(IncidentStatus s)
    {
        switch (s)
        {
        case IncidentStatus::Open:
            return "Open";
        case IncidentStatus::Responded:
            return "Responded";
        case IncidentStatus::Resolved:
            return "Resolved";
        }
        return "Unknown";
    }

    std::string resolution_code_to_string(ResolutionCode c)
    {
        switch (c)
        {
        case ResolutionCode::None:
            return "None";
        case ResolutionCode::Acknowledged:
            return "Acknowledged";
        case ResolutionCode::Disputed:
            return "Disputed";
        case ResolutionCode::Fixed:
            return "Fixed";
        case ResolutionCode::NotABug:
            return "NotABug";
        case ResolutionCode::Duplicate:
            return "Duplicate";
        }
        return "Unknown";
    }

    Result<ResolutionCode> resolution_code_from_string(const std::string &s)
    {
        for (auto code : {ResolutionCode::None, ResolutionCode::Acknowledged, ResolutionCode::Disputed,
                          ResolutionCode::Fixed, ResolutionCode::NotABug, ResolutionCode::Duplicate})
        {
            if (resolution_code_to_string(code) == s)
                return code;
        }
        return std::unexpected(RegistryError::invalid_input(std::format("Invalid resolution code: {}", s)));
    }

    nlohmann::json Incident::to_json() const
    {
        return {{"incident_id", id},
                {"agent_id", agent_id},
                {"reporter", reporter.to_hex()},
                {"category", category},
                {"report_uri", report_uri},
                {"report_hash", optional_hash_to_hex(report_hash)},
                {"reported_at", reported_at},
                {"status", incident_status_to_string(status)},
                {"response_uri", response_uri},
                {"response_hash", optional_hash_to_hex(response_hash)},
                {"responder", responder.to_hex()},
                {"responded_at", responded_at},
                {"resolution", resolution_code_to_string(resolution)},
                {"resolver", resolver.to_hex()},
                {"resolved_at", resolved_at}};
    }

    nlohmann::json IncidentSummary::to_json() const
    {
        return {{"total", total}, {"open", open}, {"responded", responded}, {"resolved", resolved}};
    }

    IncidentRegistry::IncidentRegistry(std::shared_ptr<const AgentDirectory> identity,
                                       std::shared_ptr<EventLog> events)
        : identity_(std::move(identity)), events_(std::move(events))
    {
        if (!identity_)
            throw std::invalid_argument("IncidentRegistry requires an agent directory");
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    Result<IncidentId> IncidentRegistry::report(const CallContext &ctx,
                                                AgentId agent_id,
                                                const std::string &report_uri,
                                                const std::optional<Hash32> &report_hash,
                                                const std::string &category)
    {
        if (auto r = checks::non_zero("reporter", ctx.sender); !r)
            return std::unexpected(r.error());
        if (!identity_->exists(agent_id))
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        if (auto r = checks::non_empty("category", category); !r)
            return std::unexpected(r.error());
        if (auto r = checks::text("category", category, limits::kMaxTagLength); !r)
            return std::unexpected(r.error());
        if (auto r = checks::text("report_uri", report_uri, limits::kMaxUriLength); !r)
            return std::unexpected(r.error());

        Incident incident;
        incident.id = next_id_;
        incident.agent_id = agent_id;
        incident.reporter = ctx.sender;
        incident.category = category;
        incident.report_uri = report_uri;
        incident.report_hash = report_hash;
        incident.reported_at = ctx.timestamp;

        const IncidentId id = incident.id;
        incidents_.emplace(id, std::move(incident));
        by_agent_[agent_id].push_back(id);
        by_reporter_[ctx.sender].push_back(id);
        ++next_id_;

        events_->emit(kRegistry, "IncidentReported", ctx.timestamp,
                      {{"incident_id", id},
                       {"agent_id", agent_id},
                       {"reporter", ctx.sender.to_hex()},
                       {"category", category},
                       {"report_uri", report_uri},
                       {"report_hash", optional_hash_to_hex(report_hash)}});
        spdlog::debug("incident: {} reported against agent {}", id, agent_id);
        return id;
    }

    Result<void> IncidentRegistry::respond(const CallContext &ctx,
                                           IncidentId id,
                                           const std::string &response_uri,
                                           const std::optional<Hash32> &response_hash)
    {
        auto incident = find(id);
        if (!incident)
            return std::unexpected(incident.error());

        auto authority = identity_->is_agent_authority((*incident)->agent_id, ctx.sender);
        if (!authority)
            return std::unexpected(authority.error());
        if (!*authority)
            return std::unexpected(RegistryError::unauthorized("only the agent owner or delegated wallet may respond"));
        if ((*incident)->status != IncidentStatus::Open)
        {
            return std::unexpected(RegistryError::transition(std::format("cannot respond to an incident in state {}",
                                                                         incident_status_to_string((*incident)->status))));
        }
        if (auto r = checks::text("response_uri", response_uri, limits::kMaxUriLength); !r)
            return r;

        Incident &stored = **incident;
        stored.status = IncidentStatus::Responded;
        stored.response_uri = response_uri;
        stored.response_hash = response_hash;
        stored.responder = ctx.sender;
        stored.responded_at = ctx.timestamp;

        events_->emit(kRegistry, "IncidentResponded", ctx.timestamp,
                      {{"incident_id", id},
                       {"agent_id", stored.agent_id},
                       {"responder", ctx.sender.to_hex()},
                       {"response_uri", response_uri},
                       {"response_hash", optional_hash_to_hex(response_hash)}});
        return {};
    }

    Result<void> IncidentRegistry::resolve(const CallContext &ctx, IncidentId id, ResolutionCode code)
    {
        auto incident = find(id);
        if (!incident)
            return std::unexpected(incident.error());
        if ((*incident)->reporter != ctx.sender)
            return std::unexpected(RegistryError::unauthorized("only the reporter may resolve an incident"));
        if ((*incident)->status != IncidentStatus::Responded)
        {
            return std::unexpected(RegistryError::transition(std::format("cannot resolve an incident in state {}",
                                                                         incident_status_to_string((*incident)->status))));
        }
        if (code == ResolutionCode::None)
            return std::unexpected(RegistryError::invalid_input("resolution code must not be None"));

        Incident &stored = **incident;
        stored.status = IncidentStatus::Resolved;
        stored.resolution = code;
        stored.resolver = ctx.sender;
        stored.resolved_at = ctx.timestamp;

        events_->emit(kRegistry, "IncidentResolved", ctx.timestamp,
                      {{"incident_id", id},
                       {"agent_id", stored.agent_id},
                       {"resolver", ctx.sender.to_hex()},
                       {"resolution", resolution_code_to_string(code)}});
        return {};
    }

    Result<Incident> IncidentRegistry::get_incident(IncidentId id) const
    {
        auto it = incidents_.find(id);
        if (it == incidents_.end())
        {
            return std::unexpected(RegistryError(ErrorCode::IncidentNotFound,
                                                 std::format("incident {} does not exist", id)));
        }
        return it->second;
    }

    Result<std::vector<IncidentId>> IncidentRegistry::agent_incidents(AgentId agent_id) const
    {
        if (!identity_->exists(agent_id))
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        auto it = by_agent_.find(agent_id);
        if (it == by_agent_.end())
            return std::vector<IncidentId>{};
        return it->second;
    }

    std::vector<IncidentId> IncidentRegistry::reporter_incidents(const Address &reporter) const
    {
        auto it = by_reporter_.find(reporter);
        return it == by_reporter_.end() ? std::vector<IncidentId>{} : it->second;
    }

    Result<uint64_t> IncidentRegistry::incident_count(AgentId agent_id) const
    {
        auto ids = agent_incidents(agent_id);
        if (!ids)
            return std::unexpected(ids.error());
        return static_cast<uint64_t>(ids->size());
    }

    Result<IncidentSummary> IncidentRegistry::get_summary(AgentId agent_id) const
    {
        auto ids = agent_incidents(agent_id);
        if (!ids)
            return std::unexpected(ids.error());

        IncidentSummary summary;
        for (IncidentId id : *ids)
        {
            ++summary.total;
            switch (incidents_.at(id).status)
            {
            case IncidentStatus::Open:
                ++summary.open;
                break;
            case IncidentStatus::Responded:
                ++summary.responded;
                break;
            case IncidentStatus::Resolved:
                ++summary.resolved;
                break;
            }
        }
        return summary;
    }

    Result<Incident *> IncidentRegistry::find(IncidentId id)
    {
        auto it = incidents_.find(id);
        if (it == incidents_.end())
        {
            return std::unexpected(RegistryError(ErrorCode::IncidentNotFound,
                                                 std::format("incident {} does not exist", id)));
        }
        return &it->second;
    }

} // namespace agentreg
