#pragma once

#include "agent_directory.hpp"
#include "config.hpp"
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

    /**
     * Pending -> {Completed, Rejected, Cancelled}; terminal states are final.
     */
    enum class ValidationStatus
    {
        Pending,
        Completed,
        Rejected,
        Cancelled
    };

    std::string validation_status_to_string(ValidationStatus s);

    struct ValidationRequest
    {
        RequestId id;
        Address requester;
        Address validator;
        AgentId agent_id{0};
        Hash32 content_hash;
        std::string request_uri;
        uint64_t sequence{0}; // requester sequence number folded into id
        uint64_t created_at{0};

        ValidationStatus status{ValidationStatus::Pending};
        std::string response_uri;
        std::optional<Hash32> response_hash;
        std::string tag;
        std::optional<uint8_t> outcome;
        bool outcome_defaulted{false};
        uint64_t completed_at{0};

        nlohmann::json to_json() const;
    };

    /** Validator's answer. An omitted outcome takes the named default. */
    struct ValidationResponse
    {
        std::optional<uint8_t> outcome;
        std::string response_uri;
        std::optional<Hash32> response_hash;
        std::string tag;
    };

    /** Empty members match anything */
    struct ValidationFilter
    {
        std::vector<Address> validators;
        std::string tag;
    };

    struct ValidationSummary
    {
        uint64_t total{0};
        uint64_t pending{0};
        uint64_t completed{0};
        uint64_t rejected{0};
        uint64_t cancelled{0};

        // mean outcome over completed + rejected; 0 when none decided
        double average_outcome{0.0};

        nlohmann::json to_json() const;
    };

    /**
     * Deterministic request id. Pure function of its inputs; the sequence
     * number and environment make ids unique per requester and deployment.
     */
    RequestId derive_request_id(const Address &requester,
                                const Address &validator,
                                AgentId agent_id,
                                const Hash32 &content_hash,
                                uint64_t sequence,
                                uint64_t chain_id,
                                const Address &registry);

    /** Content hash used when a requester supplies none */
    Hash32 default_content_hash(const Address &requester,
                                const Address &validator,
                                AgentId agent_id,
                                const std::string &request_uri);

    class ValidationRegistry
    {
    public:
        ValidationRegistry(Environment environment,
                           std::shared_ptr<const AgentDirectory> identity,
                           std::shared_ptr<EventLog> events);

        Result<RequestId> request_validation(const CallContext &ctx,
                                             const Address &validator,
                                             AgentId agent_id,
                                             const std::string &request_uri,
                                             const std::optional<Hash32> &content_hash = std::nullopt);

        Result<void> complete(const CallContext &ctx, const RequestId &id, const ValidationResponse &response = {});
        Result<void> reject(const CallContext &ctx, const RequestId &id, const ValidationResponse &response = {});
        Result<void> cancel(const CallContext &ctx, const RequestId &id);

        Result<ValidationRequest> get_request(const RequestId &id) const;
        bool request_exists(const RequestId &id) const;
        Result<ValidationStatus> get_status(const RequestId &id) const;

        Result<std::vector<RequestId>> agent_requests(AgentId agent_id) const;
        std::vector<RequestId> validator_requests(const Address &validator) const;
        std::vector<RequestId> requester_requests(const Address &requester) const;

        /** Sequence number the requester's next request will use */
        uint64_t requester_sequence(const Address &requester) const;

        Result<ValidationSummary> get_summary(AgentId agent_id) const;
        Result<ValidationSummary> get_summary(AgentId agent_id, const ValidationFilter &filter) const;

    private:
        static constexpr const char *kRegistry = "validation";

        Result<void> decide(const CallContext &ctx,
                            const RequestId &id,
                            const ValidationResponse &response,
                            ValidationStatus terminal);
        Result<ValidationRequest *> find_pending(const RequestId &id, const char *action);

        Environment environment_;
        std::shared_ptr<const AgentDirectory> identity_;
        std::shared_ptr<EventLog> events_;

        std::unordered_map<RequestId, ValidationRequest> requests_;
        std::unordered_map<AgentId, std::vector<RequestId>> by_agent_;
        std::unordered_map<Address, std::vector<RequestId>> by_validator_;
        std::unordered_map<Address, std::vector<RequestId>> by_requester_;
        std::unordered_map<Address, uint64_t> sequences_;
    };

} // namespace agentreg
