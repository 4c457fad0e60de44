#pragma once

#include "agent_directory.hpp"
#include "events.hpp"
#include "primitives.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentreg
{

    enum class Sentiment
    {
        Positive,
        Neutral,
        Negative
    };

    std::string sentiment_to_string(Sentiment s);
    Result<Sentiment> sentiment_from_string(const std::string &s);

    /**
     * Signed fixed-point score: value / 10^decimals
     */
    struct Score
    {
        int64_t value{0};
        uint8_t decimals{0};

        double as_double() const;
    };

    struct FeedbackResponse
    {
        Address responder;
        std::string text;
        std::string uri;
        std::optional<Hash32> hash;
        uint64_t timestamp{0};

        nlohmann::json to_json() const;
    };

    struct Feedback
    {
        uint64_t index{0};
        Address author;
        std::string text;
        Sentiment sentiment{Sentiment::Neutral};
        std::optional<Score> score;
        std::string tag1;
        std::string tag2;
        std::string endpoint;
        std::string feedback_uri;
        std::optional<Hash32> feedback_hash;
        uint64_t created_at{0};
        bool revoked{false};
        uint64_t revoked_at{0};
        std::vector<FeedbackResponse> responses;

        nlohmann::json to_json() const;
    };

    /** Caller-supplied part of a feedback record */
    struct FeedbackInput
    {
        std::string text;
        Sentiment sentiment{Sentiment::Neutral};
        std::optional<Score> score;
        std::string tag1;
        std::string tag2;
        std::string endpoint;
        std::string feedback_uri;
        std::optional<Hash32> feedback_hash;
    };

    /**
     * Empty members match anything. tag1/tag2 are compared with the
     * feedback's tag1/tag2 respectively.
     */
    struct FeedbackFilter
    {
        std::vector<Address> authors;
        std::string tag1;
        std::string tag2;
    };

    struct ReputationSummary
    {
        uint64_t total{0};
        uint64_t active{0};
        uint64_t revoked{0};
        uint64_t positive{0};
        uint64_t neutral{0};
        uint64_t negative{0};

        // over active feedback carrying a score
        double score_sum{0.0};
        uint64_t score_count{0};

        nlohmann::json to_json() const;
    };

    /**
     * Reputation registry: append-only feedback per agent with author
     * revocation and agent-authority response threads.
     */
    class ReputationRegistry
    {
    public:
        ReputationRegistry(std::shared_ptr<const AgentDirectory> identity,
                           std::shared_ptr<EventLog> events);

        /** Returns the feedback index within the agent's ledger */
        Result<uint64_t> give_feedback(const CallContext &ctx, AgentId agent_id, const FeedbackInput &input);

        Result<uint64_t> give_feedback(const CallContext &ctx,
                                       AgentId agent_id,
                                       const std::string &text,
                                       Sentiment sentiment);

        Result<void> revoke_feedback(const CallContext &ctx, AgentId agent_id, uint64_t index);

        /** Returns the new thread length */
        Result<uint64_t> append_response(const CallContext &ctx,
                                         AgentId agent_id,
                                         uint64_t index,
                                         const std::string &text,
                                         const std::string &uri = {},
                                         const std::optional<Hash32> &hash = std::nullopt);

        Result<Feedback> get_feedback(AgentId agent_id, uint64_t index) const;
        Result<uint64_t> feedback_count(AgentId agent_id) const;
        Result<std::vector<FeedbackResponse>> get_responses(AgentId agent_id, uint64_t index) const;
        Result<uint64_t> response_count(AgentId agent_id, uint64_t index) const;

        /** Distinct authors in order of their first submission */
        Result<std::vector<Address>> get_authors(AgentId agent_id) const;

        /** Indices authored by `author` for this agent */
        Result<std::vector<uint64_t>> author_feedback(AgentId agent_id, const Address &author) const;

        Result<ReputationSummary> get_summary(AgentId agent_id) const;
        Result<ReputationSummary> get_summary(AgentId agent_id, const FeedbackFilter &filter) const;

        Result<std::vector<uint64_t>> read_matching(AgentId agent_id,
                                                    const FeedbackFilter &filter,
                                                    bool include_revoked) const;

        /** True when `who` is barred from reviewing the agent */
        Result<bool> is_self_feedback(AgentId agent_id, const Address &who) const;

    private:
        static constexpr const char *kRegistry = "reputation";

        struct AgentLedger
        {
            std::vector<Feedback> feedback;
            std::vector<Address> authors;
            std::unordered_set<Address> author_set;
        };

        Result<void> require_agent(AgentId agent_id) const;
        Result<const Feedback *> find(AgentId agent_id, uint64_t index) const;
        static bool matches(const Feedback &fb, const FeedbackFilter &filter);

        std::shared_ptr<const AgentDirectory> identity_;
        std::shared_ptr<EventLog> events_;
        std::unordered_map<AgentId, AgentLedger> ledgers_;
    };

} // namespace agentreg
