#include "agentreg/reputation_registry.hpp"
#include "agentreg/checks.hpp"
#include "agentreg/limits.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace agentreg
{

    std::string sentiment_to_string(Sentiment s)
    {
        switch (s)
        {
        case Sentiment::Positive:
            return "Positive";
        case Sentiment::Neutral:
            return "Neutral";
        case Sentiment::Negative:
            return "Negative";
        }
        return "Unknown";
    }

    Result<Sentiment> sentiment_from_string(const std::string &s)
    {
        if (s == "Positive")
            return Sentiment::Positive;
        if (s == "Neutral")
            return Sentiment::Neutral;
        if (s == "Negative")
            return Sentiment::Negative;
        return std::unexpected(RegistryError::invalid_input(std::format("Invalid sentiment: {}", s)));
    }

    double Score::as_double() const
    {
        return static_cast<double>(value) / std::pow(10.0, decimals);
    }

    nlohmann::json FeedbackResponse::to_json() const
    {
        return {{"responder", responder.to_hex()},
                {"text", text},
                {"uri", uri},
                {"hash", optional_hash_to_hex(hash)},
                {"timestamp", timestamp}};
    }

    nlohmann::json Feedback::to_json() const
    {
        nlohmann::json j = {{"index", index},
                            {"author", author.to_hex()},
                            {"text", text},
                            {"sentiment", sentiment_to_string(sentiment)},
                            {"tag1", tag1},
                            {"tag2", tag2},
                            {"endpoint", endpoint},
                            {"feedback_uri", feedback_uri},
                            {"feedback_hash", optional_hash_to_hex(feedback_hash)},
                            {"created_at", created_at},
                            {"revoked", revoked},
                            {"revoked_at", revoked_at}};
        if (score)
            j["score"] = {{"value", score->value}, {"decimals", score->decimals}};
        else
            j["score"] = nullptr;
        j["responses"] = nlohmann::json::array();
        for (const auto &r : responses)
            j["responses"].push_back(r.to_json());
        return j;
    }

    nlohmann::json ReputationSummary::to_json() const
    {
        return {{"total", total},
                {"active", active},
                {"revoked", revoked},
                {"positive", positive},
                {"neutral", neutral},
                {"negative", negative},
                {"score_sum", score_sum},
                {"score_count", score_count}};
    }

    ReputationRegistry::ReputationRegistry(std::shared_ptr<const AgentDirectory> identity,
                                           std::shared_ptr<EventLog> events)
        : identity_(std::move(identity)), events_(std::move(events))
    {
        if (!identity_)
            throw std::invalid_argument("ReputationRegistry requires an agent directory");
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    Result<bool> ReputationRegistry::is_self_feedback(AgentId agent_id, const Address &who) const
    {
        return identity_->is_agent_authority(agent_id, who);
    }

    Result<uint64_t> ReputationRegistry::give_feedback(const CallContext &ctx,
                                                       AgentId agent_id,
                                                       const std::string &text,
                                                       Sentiment sentiment)
    {
        FeedbackInput input;
        input.text = text;
        input.sentiment = sentiment;
        return give_feedback(ctx, agent_id, input);
    }

    Result<uint64_t> ReputationRegistry::give_feedback(const CallContext &ctx,
                                                       AgentId agent_id,
                                                       const FeedbackInput &input)
    {
        if (auto r = checks::non_zero("author", ctx.sender); !r)
            return std::unexpected(r.error());
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());

        auto self = is_self_feedback(agent_id, ctx.sender);
        if (!self)
            return std::unexpected(self.error());
        if (*self)
        {
            return std::unexpected(RegistryError(ErrorCode::SelfFeedback,
                                                 "owner or delegated wallet cannot review its own agent"));
        }

        for (auto check : {checks::text("text", input.text, limits::kMaxTextLength),
                           checks::text("tag1", input.tag1, limits::kMaxTagLength),
                           checks::text("tag2", input.tag2, limits::kMaxTagLength),
                           checks::text("endpoint", input.endpoint, limits::kMaxEndpointLength),
                           checks::text("feedback_uri", input.feedback_uri, limits::kMaxUriLength)})
        {
            if (!check)
                return std::unexpected(check.error());
        }
        if (input.score && input.score->decimals > limits::kMaxScoreDecimals)
        {
            return std::unexpected(RegistryError(ErrorCode::ScoreOutOfRange,
                                                 std::format("score decimals exceed {}", limits::kMaxScoreDecimals)));
        }

        auto &ledger = ledgers_[agent_id];
        Feedback fb;
        fb.index = ledger.feedback.size();
        fb.author = ctx.sender;
        fb.text = input.text;
        fb.sentiment = input.sentiment;
        fb.score = input.score;
        fb.tag1 = input.tag1;
        fb.tag2 = input.tag2;
        fb.endpoint = input.endpoint;
        fb.feedback_uri = input.feedback_uri;
        fb.feedback_hash = input.feedback_hash;
        fb.created_at = ctx.timestamp;

        const uint64_t index = fb.index;
        nlohmann::json fields = fb.to_json();
        fields.erase("responses");
        fields["agent_id"] = agent_id;

        ledger.feedback.push_back(std::move(fb));
        if (ledger.author_set.insert(ctx.sender).second)
            ledger.authors.push_back(ctx.sender);

        events_->emit(kRegistry, "NewFeedback", ctx.timestamp, std::move(fields));
        spdlog::debug("reputation: feedback {} on agent {} by {}", index, agent_id, ctx.sender.to_hex());
        return index;
    }

    Result<void> ReputationRegistry::revoke_feedback(const CallContext &ctx, AgentId agent_id, uint64_t index)
    {
        auto fb = find(agent_id, index);
        if (!fb)
            return std::unexpected(fb.error());
        if ((*fb)->author != ctx.sender)
            return std::unexpected(RegistryError::unauthorized("only the author may revoke feedback"));
        if ((*fb)->revoked)
            return std::unexpected(RegistryError(ErrorCode::AlreadyRevoked, "feedback already revoked"));

        auto &stored = ledgers_.at(agent_id).feedback[index];
        stored.revoked = true;
        stored.revoked_at = ctx.timestamp;
        events_->emit(kRegistry, "FeedbackRevoked", ctx.timestamp,
                      {{"agent_id", agent_id}, {"index", index}, {"author", ctx.sender.to_hex()}});
        return {};
    }

    Result<uint64_t> ReputationRegistry::append_response(const CallContext &ctx,
                                                         AgentId agent_id,
                                                         uint64_t index,
                                                         const std::string &text,
                                                         const std::string &uri,
                                                         const std::optional<Hash32> &hash)
    {
        auto fb = find(agent_id, index);
        if (!fb)
            return std::unexpected(fb.error());

        auto authority = identity_->is_agent_authority(agent_id, ctx.sender);
        if (!authority)
            return std::unexpected(authority.error());
        if (!*authority)
            return std::unexpected(RegistryError::unauthorized("only the agent owner or delegated wallet may respond"));

        if ((*fb)->revoked)
            return std::unexpected(RegistryError(ErrorCode::FeedbackRevoked, "cannot respond to revoked feedback"));
        if ((*fb)->responses.size() >= limits::kMaxResponsesPerFeedback)
        {
            return std::unexpected(RegistryError(ErrorCode::ThreadFull,
                                                 std::format("response thread is limited to {} entries",
                                                             limits::kMaxResponsesPerFeedback)));
        }
        if (auto r = checks::text("response text", text, limits::kMaxTextLength); !r)
            return std::unexpected(r.error());
        if (auto r = checks::text("response uri", uri, limits::kMaxUriLength); !r)
            return std::unexpected(r.error());

        FeedbackResponse response{ctx.sender, text, uri, hash, ctx.timestamp};
        nlohmann::json fields = response.to_json();
        fields["agent_id"] = agent_id;
        fields["index"] = index;

        auto &thread = ledgers_.at(agent_id).feedback[index].responses;
        thread.push_back(std::move(response));
        fields["response_index"] = thread.size() - 1;

        events_->emit(kRegistry, "ResponseAppended", ctx.timestamp, std::move(fields));
        return static_cast<uint64_t>(thread.size());
    }

    Result<Feedback> ReputationRegistry::get_feedback(AgentId agent_id, uint64_t index) const
    {
        auto fb = find(agent_id, index);
        if (!fb)
            return std::unexpected(fb.error());
        return **fb;
    }

    Result<uint64_t> ReputationRegistry::feedback_count(AgentId agent_id) const
    {
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());
        auto it = ledgers_.find(agent_id);
        return it == ledgers_.end() ? 0 : static_cast<uint64_t>(it->second.feedback.size());
    }

    Result<std::vector<FeedbackResponse>> ReputationRegistry::get_responses(AgentId agent_id, uint64_t index) const
    {
        auto fb = find(agent_id, index);
        if (!fb)
            return std::unexpected(fb.error());
        return (*fb)->responses;
    }

    Result<uint64_t> ReputationRegistry::response_count(AgentId agent_id, uint64_t index) const
    {
        auto fb = find(agent_id, index);
        if (!fb)
            return std::unexpected(fb.error());
        return static_cast<uint64_t>((*fb)->responses.size());
    }

    Result<std::vector<Address>> ReputationRegistry::get_authors(AgentId agent_id) const
    {
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());
        auto it = ledgers_.find(agent_id);
        if (it == ledgers_.end())
            return std::vector<Address>{};
        return it->second.authors;
    }

    Result<std::vector<uint64_t>> ReputationRegistry::author_feedback(AgentId agent_id, const Address &author) const
    {
        FeedbackFilter filter;
        filter.authors.push_back(author);
        return read_matching(agent_id, filter, true);
    }

    Result<ReputationSummary> ReputationRegistry::get_summary(AgentId agent_id) const
    {
        return get_summary(agent_id, FeedbackFilter{});
    }

    Result<ReputationSummary> ReputationRegistry::get_summary(AgentId agent_id, const FeedbackFilter &filter) const
    {
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());

        ReputationSummary summary;
        auto it = ledgers_.find(agent_id);
        if (it == ledgers_.end())
            return summary;

        for (const auto &fb : it->second.feedback)
        {
            if (!matches(fb, filter))
                continue;
            ++summary.total;
            if (fb.revoked)
            {
                ++summary.revoked;
                continue;
            }
            ++summary.active;
            switch (fb.sentiment)
            {
            case Sentiment::Positive:
                ++summary.positive;
                break;
            case Sentiment::Neutral:
                ++summary.neutral;
                break;
            case Sentiment::Negative:
                ++summary.negative;
                break;
            }
            if (fb.score)
            {
                summary.score_sum += fb.score->as_double();
                ++summary.score_count;
            }
        }
        return summary;
    }

    Result<std::vector<uint64_t>> ReputationRegistry::read_matching(AgentId agent_id,
                                                                    const FeedbackFilter &filter,
                                                                    bool include_revoked) const
    {
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());

        std::vector<uint64_t> out;
        auto it = ledgers_.find(agent_id);
        if (it == ledgers_.end())
            return out;
        for (const auto &fb : it->second.feedback)
        {
            if (fb.revoked && !include_revoked)
                continue;
            if (matches(fb, filter))
                out.push_back(fb.index);
        }
        return out;
    }

    Result<void> ReputationRegistry::require_agent(AgentId agent_id) const
    {
        if (!identity_->exists(agent_id))
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        return {};
    }

    Result<const Feedback *> ReputationRegistry::find(AgentId agent_id, uint64_t index) const
    {
        if (auto r = require_agent(agent_id); !r)
            return std::unexpected(r.error());
        auto it = ledgers_.find(agent_id);
        if (it == ledgers_.end() || index >= it->second.feedback.size())
        {
            return std::unexpected(RegistryError(ErrorCode::FeedbackNotFound,
                                                 std::format("agent {} has no feedback at index {}", agent_id, index)));
        }
        return &it->second.feedback[index];
    }

    bool ReputationRegistry::matches(const Feedback &fb, const FeedbackFilter &filter)
    {
        if (!filter.authors.empty() &&
            std::find(filter.authors.begin(), filter.authors.end(), fb.author) == filter.authors.end())
            return false;
        if (!filter.tag1.empty() && fb.tag1 != filter.tag1)
            return false;
        if (!filter.tag2.empty() && fb.tag2 != filter.tag2)
            return false;
        return true;
    }

} // namespace agentreg
