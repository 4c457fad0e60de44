#include "agentreg/validation_registry.hpp"
#include "agentreg/checks.hpp"
#include "agentreg/crypto.hpp"
#include "agentreg/limits.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace agentreg
{

    std::string validation_status_to_string(ValidationStatus s)
    {
        switch (s)
        {
        case ValidationStatus::Pending:
            return "Pending";
        case ValidationStatus::Completed:
            return "Completed";
        case ValidationStatus::Rejected:
            return "Rejected";
        case ValidationStatus::Cancelled:
            return "Cancelled";
        }
        return "Unknown";
    }

    nlohmann::json ValidationRequest::to_json() const
    {
        nlohmann::json j = {{"request_id", id.to_hex()},
                            {"requester", requester.to_hex()},
                            {"validator", validator.to_hex()},
                            {"agent_id", agent_id},
                            {"content_hash", content_hash.to_hex()},
                            {"request_uri", request_uri},
                            {"sequence", sequence},
                            {"created_at", created_at},
                            {"status", validation_status_to_string(status)},
                            {"response_uri", response_uri},
                            {"response_hash", optional_hash_to_hex(response_hash)},
                            {"tag", tag},
                            {"outcome_defaulted", outcome_defaulted},
                            {"completed_at", completed_at}};
        if (outcome)
            j["outcome"] = *outcome;
        else
            j["outcome"] = nullptr;
        return j;
    }

    nlohmann::json ValidationSummary::to_json() const
    {
        return {{"total", total},
                {"pending", pending},
                {"completed", completed},
                {"rejected", rejected},
                {"cancelled", cancelled},
                {"average_outcome", average_outcome}};
    }

    RequestId derive_request_id(const Address &requester,
                                const Address &validator,
                                AgentId agent_id,
                                const Hash32 &content_hash,
                                uint64_t sequence,
                                uint64_t chain_id,
                                const Address &registry)
    {
        return crypto::DigestBuilder("agentreg.validation.request-id.v1")
            .add(requester)
            .add(validator)
            .add(agent_id)
            .add(content_hash)
            .add(sequence)
            .add(chain_id)
            .add(registry)
            .finish();
    }

    Hash32 default_content_hash(const Address &requester,
                                const Address &validator,
                                AgentId agent_id,
                                const std::string &request_uri)
    {
        return crypto::DigestBuilder("agentreg.validation.content.v1")
            .add(requester)
            .add(validator)
            .add(agent_id)
            .add(std::string_view(request_uri))
            .finish();
    }

    ValidationRegistry::ValidationRegistry(Environment environment,
                                           std::shared_ptr<const AgentDirectory> identity,
                                           std::shared_ptr<EventLog> events)
        : environment_(std::move(environment)), identity_(std::move(identity)), events_(std::move(events))
    {
        if (!identity_)
            throw std::invalid_argument("ValidationRegistry requires an agent directory");
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    Result<RequestId> ValidationRegistry::request_validation(const CallContext &ctx,
                                                             const Address &validator,
                                                             AgentId agent_id,
                                                             const std::string &request_uri,
                                                             const std::optional<Hash32> &content_hash)
    {
        if (auto r = checks::non_zero("requester", ctx.sender); !r)
            return std::unexpected(r.error());
        if (auto r = checks::non_zero("validator", validator); !r)
            return std::unexpected(r.error());
        if (!identity_->exists(agent_id))
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        if (auto r = checks::text("request_uri", request_uri, limits::kMaxUriLength); !r)
            return std::unexpected(r.error());

        const Hash32 hash = content_hash ? *content_hash
                                         : default_content_hash(ctx.sender, validator, agent_id, request_uri);
        const uint64_t sequence = requester_sequence(ctx.sender);
        const RequestId id = derive_request_id(ctx.sender, validator, agent_id, hash, sequence,
                                               environment_.chain_id, environment_.validation_registry);

        if (requests_.contains(id))
        {
            spdlog::critical("validation: derived request id {} collides with an existing request", id.to_hex());
            return std::unexpected(RegistryError::integrity(std::format("derived request id collision: {}", id.to_hex())));
        }

        ValidationRequest request;
        request.id = id;
        request.requester = ctx.sender;
        request.validator = validator;
        request.agent_id = agent_id;
        request.content_hash = hash;
        request.request_uri = request_uri;
        request.sequence = sequence;
        request.created_at = ctx.timestamp;

        nlohmann::json fields = {{"request_id", id.to_hex()},
                                 {"requester", ctx.sender.to_hex()},
                                 {"validator", validator.to_hex()},
                                 {"agent_id", agent_id},
                                 {"content_hash", hash.to_hex()},
                                 {"request_uri", request_uri},
                                 {"sequence", sequence}};

        requests_.emplace(id, std::move(request));
        by_agent_[agent_id].push_back(id);
        by_validator_[validator].push_back(id);
        by_requester_[ctx.sender].push_back(id);
        sequences_[ctx.sender] = sequence + 1;

        events_->emit(kRegistry, "ValidationRequested", ctx.timestamp, std::move(fields));
        spdlog::debug("validation: request {} for agent {} (sequence {})", id.to_hex(), agent_id, sequence);
        return id;
    }

    Result<void> ValidationRegistry::complete(const CallContext &ctx,
                                              const RequestId &id,
                                              const ValidationResponse &response)
    {
        return decide(ctx, id, response, ValidationStatus::Completed);
    }

    Result<void> ValidationRegistry::reject(const CallContext &ctx,
                                            const RequestId &id,
                                            const ValidationResponse &response)
    {
        return decide(ctx, id, response, ValidationStatus::Rejected);
    }

    Result<void> ValidationRegistry::decide(const CallContext &ctx,
                                            const RequestId &id,
                                            const ValidationResponse &response,
                                            ValidationStatus terminal)
    {
        const char *action = terminal == ValidationStatus::Completed ? "complete" : "reject";
        auto request = find_pending(id, action);
        if (!request)
            return std::unexpected(request.error());
        if ((*request)->validator != ctx.sender)
            return std::unexpected(RegistryError::unauthorized(std::format("only the named validator may {}", action)));

        if (response.outcome && *response.outcome > limits::kMaxValidationOutcome)
        {
            return std::unexpected(RegistryError(ErrorCode::ScoreOutOfRange,
                                                 std::format("outcome must be within 0..{}", limits::kMaxValidationOutcome)));
        }
        if (auto r = checks::text("response_uri", response.response_uri, limits::kMaxUriLength); !r)
            return r;
        if (auto r = checks::text("tag", response.tag, limits::kMaxTagLength); !r)
            return r;

        const bool defaulted = !response.outcome.has_value();
        const uint8_t outcome = defaulted ? (terminal == ValidationStatus::Completed ? limits::kDefaultCompletionOutcome
                                                                                    : limits::kDefaultRejectionOutcome)
                                          : *response.outcome;

        ValidationRequest &stored = **request;
        stored.status = terminal;
        stored.outcome = outcome;
        stored.outcome_defaulted = defaulted;
        stored.response_uri = response.response_uri;
        stored.response_hash = response.response_hash;
        stored.tag = response.tag;
        stored.completed_at = ctx.timestamp;

        events_->emit(kRegistry,
                      terminal == ValidationStatus::Completed ? "ValidationCompleted" : "ValidationRejected",
                      ctx.timestamp,
                      {{"request_id", id.to_hex()},
                       {"validator", ctx.sender.to_hex()},
                       {"agent_id", stored.agent_id},
                       {"outcome", outcome},
                       {"outcome_defaulted", defaulted},
                       {"response_uri", stored.response_uri},
                       {"response_hash", optional_hash_to_hex(stored.response_hash)},
                       {"tag", stored.tag}});
        return {};
    }

    Result<void> ValidationRegistry::cancel(const CallContext &ctx, const RequestId &id)
    {
        auto request = find_pending(id, "cancel");
        if (!request)
            return std::unexpected(request.error());
        if ((*request)->requester != ctx.sender)
            return std::unexpected(RegistryError::unauthorized("only the requester may cancel"));

        (*request)->status = ValidationStatus::Cancelled;
        (*request)->completed_at = ctx.timestamp;
        events_->emit(kRegistry, "ValidationCancelled", ctx.timestamp,
                      {{"request_id", id.to_hex()},
                       {"requester", ctx.sender.to_hex()},
                       {"agent_id", (*request)->agent_id}});
        return {};
    }

    Result<ValidationRequest *> ValidationRegistry::find_pending(const RequestId &id, const char *action)
    {
        auto it = requests_.find(id);
        if (it == requests_.end())
            return std::unexpected(RegistryError(ErrorCode::RequestNotFound, std::format("unknown request {}", id.to_hex())));
        if (it->second.status != ValidationStatus::Pending)
        {
            return std::unexpected(RegistryError::transition(std::format("cannot {} a request in state {}", action,
                                                                         validation_status_to_string(it->second.status))));
        }
        return &it->second;
    }

    Result<ValidationRequest> ValidationRegistry::get_request(const RequestId &id) const
    {
        auto it = requests_.find(id);
        if (it == requests_.end())
            return std::unexpected(RegistryError(ErrorCode::RequestNotFound, std::format("unknown request {}", id.to_hex())));
        return it->second;
    }

    bool ValidationRegistry::request_exists(const RequestId &id) const
    {
        return requests_.contains(id);
    }

    Result<ValidationStatus> ValidationRegistry::get_status(const RequestId &id) const
    {
        auto request = get_request(id);
        if (!request)
            return std::unexpected(request.error());
        return request->status;
    }

    Result<std::vector<RequestId>> ValidationRegistry::agent_requests(AgentId agent_id) const
    {
        if (!identity_->exists(agent_id))
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        auto it = by_agent_.find(agent_id);
        if (it == by_agent_.end())
            return std::vector<RequestId>{};
        return it->second;
    }

    std::vector<RequestId> ValidationRegistry::validator_requests(const Address &validator) const
    {
        auto it = by_validator_.find(validator);
        return it == by_validator_.end() ? std::vector<RequestId>{} : it->second;
    }

    std::vector<RequestId> ValidationRegistry::requester_requests(const Address &requester) const
    {
        auto it = by_requester_.find(requester);
        return it == by_requester_.end() ? std::vector<RequestId>{} : it->second;
    }

    uint64_t ValidationRegistry::requester_sequence(const Address &requester) const
    {
        auto it = sequences_.find(requester);
        return it == sequences_.end() ? 0 : it->second;
    }

    Result<ValidationSummary> ValidationRegistry::get_summary(AgentId agent_id) const
    {
        return get_summary(agent_id, ValidationFilter{});
    }

    Result<ValidationSummary> ValidationRegistry::get_summary(AgentId agent_id, const ValidationFilter &filter) const
    {
        auto ids = agent_requests(agent_id);
        if (!ids)
            return std::unexpected(ids.error());

        ValidationSummary summary;
        uint64_t outcome_total = 0;
        uint64_t decided = 0;
        for (const auto &id : *ids)
        {
            const auto &request = requests_.at(id);
            if (!filter.validators.empty() &&
                std::find(filter.validators.begin(), filter.validators.end(), request.validator) ==
                    filter.validators.end())
                continue;
            if (!filter.tag.empty() && request.tag != filter.tag)
                continue;

            ++summary.total;
            switch (request.status)
            {
            case ValidationStatus::Pending:
                ++summary.pending;
                break;
            case ValidationStatus::Completed:
                ++summary.completed;
                break;
            case ValidationStatus::Rejected:
                ++summary.rejected;
                break;
            case ValidationStatus::Cancelled:
                ++summary.cancelled;
                break;
            }
            if (request.outcome)
            {
                outcome_total += *request.outcome;
                ++decided;
            }
        }
        if (decided > 0)
            summary.average_outcome = static_cast<double>(outcome_total) / static_cast<double>(decided);
        return summary;
    }

} // namespace agentreg
