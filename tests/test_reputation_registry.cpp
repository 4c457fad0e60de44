#include <catch2/catch_test_macros.hpp>
#include "agentreg/identity_registry.hpp"
#include "agentreg/limits.hpp"
#include "agentreg/reputation_registry.hpp"
#include "test_support.hpp"

using namespace agentreg;
using agentreg::test::addr;
using agentreg::test::as;

namespace
{
    struct Fixture
    {
        std::shared_ptr<EventLog> events = std::make_shared<EventLog>();
        std::shared_ptr<IdentityRegistry> identity =
            std::make_shared<IdentityRegistry>(test::test_environment(), events);
        ReputationRegistry reputation{identity, events};

        Address owner = addr(1);
        AgentId agent = identity->register_agent(as(owner)).value();
    };

    FeedbackInput scored(const std::string &text, Sentiment s, int64_t value, uint8_t decimals,
                         const std::string &tag1 = {}, const std::string &tag2 = {})
    {
        FeedbackInput input;
        input.text = text;
        input.sentiment = s;
        input.score = Score{value, decimals};
        input.tag1 = tag1;
        input.tag2 = tag2;
        return input;
    }

    Result<void> delegate_wallet(IdentityRegistry &identity, const Address &owner, AgentId id, Address &wallet_out)
    {
        auto key = crypto::Ed25519KeyPair::generate().value();
        wallet_out = address_from_public_key(key.public_key);
        auto req = identity.delegation_request(id, wallet_out, 5000);
        if (!req)
            return std::unexpected(req.error());
        return identity.set_agent_wallet(as(owner), id, wallet_out, 5000, sign_delegation(*req, key));
    }
}

TEST_CASE("Feedback is appended with sequential indices", "[reputation]")
{
    Fixture f;
    auto first = f.reputation.give_feedback(as(addr(2)), f.agent, "great agent", Sentiment::Positive);
    auto second = f.reputation.give_feedback(as(addr(3)), f.agent, scored("slow", Sentiment::Negative, -15, 1));
    REQUIRE(first.value() == 0);
    REQUIRE(second.value() == 1);
    REQUIRE(f.reputation.feedback_count(f.agent).value() == 2);

    auto fb = f.reputation.get_feedback(f.agent, 1).value();
    REQUIRE(fb.author == addr(3));
    REQUIRE(fb.score->value == -15);
    REQUIRE(fb.score->as_double() == -1.5);
    REQUIRE_FALSE(fb.revoked);

    auto emitted = f.events->named("reputation", "NewFeedback");
    REQUIRE(emitted.size() == 2);
    REQUIRE(emitted[0].fields["agent_id"] == f.agent);
    REQUIRE(emitted[0].fields["sentiment"] == "Positive");
}

TEST_CASE("Feedback input validation", "[reputation]")
{
    Fixture f;

    REQUIRE(f.reputation.give_feedback(as(addr(2)), 99, "x", Sentiment::Neutral).error().code ==
            ErrorCode::AgentNotFound);
    REQUIRE(f.reputation.give_feedback(as(addr(2)), f.agent, std::string(limits::kMaxTextLength + 1, 'x'),
                                       Sentiment::Neutral)
                .error()
                .code == ErrorCode::FieldTooLong);
    REQUIRE(f.reputation.give_feedback(as(addr(2)), f.agent,
                                       scored("t", Sentiment::Neutral, 1, 0, std::string(limits::kMaxTagLength + 1, 't')))
                .error()
                .code == ErrorCode::FieldTooLong);
    REQUIRE(f.reputation.give_feedback(as(addr(2)), f.agent, scored("t", Sentiment::Neutral, 1, 19)).error().code ==
            ErrorCode::ScoreOutOfRange);

    FeedbackInput long_endpoint;
    long_endpoint.endpoint = std::string(limits::kMaxEndpointLength + 1, 'e');
    REQUIRE(f.reputation.give_feedback(as(addr(2)), f.agent, long_endpoint).error().code == ErrorCode::FieldTooLong);

    REQUIRE(f.reputation.feedback_count(f.agent).value() == 0);
    REQUIRE(f.events->named("reputation", "NewFeedback").empty());
}

TEST_CASE("Self-feedback is rejected for owner and delegated wallet", "[reputation][self]")
{
    Fixture f;
    Address wallet;
    REQUIRE(delegate_wallet(*f.identity, f.owner, f.agent, wallet).has_value());

    REQUIRE(f.reputation.is_self_feedback(f.agent, f.owner).value());
    REQUIRE(f.reputation.is_self_feedback(f.agent, wallet).value());
    REQUIRE_FALSE(f.reputation.is_self_feedback(f.agent, addr(2)).value());

    REQUIRE(f.reputation.give_feedback(as(f.owner), f.agent, "me", Sentiment::Positive).error().code ==
            ErrorCode::SelfFeedback);
    REQUIRE(f.reputation.give_feedback(as(wallet), f.agent, "me", Sentiment::Positive).error().code ==
            ErrorCode::SelfFeedback);
    REQUIRE(f.reputation.give_feedback(as(addr(2)), f.agent, "fine", Sentiment::Positive).has_value());

    SECTION("A cleared wallet may review again")
    {
        REQUIRE(f.identity->unset_agent_wallet(as(f.owner), f.agent).has_value());
        REQUIRE(f.reputation.give_feedback(as(wallet), f.agent, "ex-operator", Sentiment::Neutral).has_value());
    }
}

TEST_CASE("Revocation is author-only and one-way", "[reputation][revoke]")
{
    Fixture f;
    const Address author = addr(2);
    const auto index = f.reputation.give_feedback(as(author), f.agent, "meh", Sentiment::Neutral).value();

    REQUIRE(f.reputation.revoke_feedback(as(addr(3)), f.agent, index).error().code == ErrorCode::Unauthorized);
    REQUIRE(f.reputation.revoke_feedback(as(author), f.agent, 7).error().code == ErrorCode::FeedbackNotFound);
    REQUIRE(f.reputation.revoke_feedback(as(author), f.agent, index).has_value());
    REQUIRE(f.reputation.get_feedback(f.agent, index).value().revoked);

    auto again = f.reputation.revoke_feedback(as(author), f.agent, index);
    REQUIRE(again.error().code == ErrorCode::AlreadyRevoked);
    REQUIRE(f.reputation.get_feedback(f.agent, index).value().revoked);
    REQUIRE(f.events->named("reputation", "FeedbackRevoked").size() == 1);
}

TEST_CASE("Response threads", "[reputation][responses]")
{
    Fixture f;
    const auto index = f.reputation.give_feedback(as(addr(2)), f.agent, "question?", Sentiment::Neutral).value();

    REQUIRE(f.reputation.append_response(as(addr(3)), f.agent, index, "not mine").error().code ==
            ErrorCode::Unauthorized);

    auto len = f.reputation.append_response(as(f.owner), f.agent, index, "answer", "ipfs://answer");
    REQUIRE(len.value() == 1);
    auto thread = f.reputation.get_responses(f.agent, index).value();
    REQUIRE(thread[0].responder == f.owner);
    REQUIRE(thread[0].uri == "ipfs://answer");

    SECTION("Delegated wallet may respond")
    {
        Address wallet;
        REQUIRE(delegate_wallet(*f.identity, f.owner, f.agent, wallet).has_value());
        REQUIRE(f.reputation.append_response(as(wallet), f.agent, index, "from ops").value() == 2);
    }

    SECTION("Revoked feedback takes no responses")
    {
        REQUIRE(f.reputation.revoke_feedback(as(addr(2)), f.agent, index).has_value());
        REQUIRE(f.reputation.append_response(as(f.owner), f.agent, index, "late").error().code ==
                ErrorCode::FeedbackRevoked);
    }

    SECTION("Thread overflow leaves the thread unchanged")
    {
        for (std::size_t i = 1; i < limits::kMaxResponsesPerFeedback; ++i)
            REQUIRE(f.reputation.append_response(as(f.owner), f.agent, index, "r").has_value());
        REQUIRE(f.reputation.response_count(f.agent, index).value() == limits::kMaxResponsesPerFeedback);

        auto overflow = f.reputation.append_response(as(f.owner), f.agent, index, "one more");
        REQUIRE(overflow.error().code == ErrorCode::ThreadFull);
        REQUIRE(f.reputation.response_count(f.agent, index).value() == limits::kMaxResponsesPerFeedback);
    }
}

TEST_CASE("Summaries and filters", "[reputation][summary]")
{
    Fixture f;
    const Address alice = addr(2);
    const Address bob = addr(3);
    REQUIRE(f.reputation.give_feedback(as(alice), f.agent, scored("a", Sentiment::Positive, 90, 0, "speed")).has_value());
    REQUIRE(f.reputation.give_feedback(as(bob), f.agent, scored("b", Sentiment::Negative, 10, 0, "speed", "api")).has_value());
    REQUIRE(f.reputation.give_feedback(as(alice), f.agent, "c", Sentiment::Neutral).has_value());
    REQUIRE(f.reputation.give_feedback(as(bob), f.agent, scored("d", Sentiment::Positive, 50, 0)).has_value());
    REQUIRE(f.reputation.revoke_feedback(as(bob), f.agent, 3).has_value());

    auto all = f.reputation.get_summary(f.agent).value();
    REQUIRE(all.total == 4);
    REQUIRE(all.active == 3);
    REQUIRE(all.revoked == 1);
    REQUIRE(all.positive == 1);
    REQUIRE(all.neutral == 1);
    REQUIRE(all.negative == 1);
    REQUIRE(all.score_count == 2);
    REQUIRE(all.score_sum == 100.0);

    FeedbackFilter by_alice;
    by_alice.authors = {alice};
    auto alice_summary = f.reputation.get_summary(f.agent, by_alice).value();
    REQUIRE(alice_summary.total == 2);
    REQUIRE(alice_summary.positive == 1);

    FeedbackFilter speed_api;
    speed_api.tag1 = "speed";
    speed_api.tag2 = "api";
    REQUIRE(f.reputation.read_matching(f.agent, speed_api, false).value() == std::vector<uint64_t>{1});

    FeedbackFilter by_bob;
    by_bob.authors = {bob};
    REQUIRE(f.reputation.read_matching(f.agent, by_bob, false).value() == std::vector<uint64_t>{1});
    REQUIRE(f.reputation.read_matching(f.agent, by_bob, true).value() == std::vector<uint64_t>{1, 3});
    REQUIRE(f.reputation.author_feedback(f.agent, alice).value() == std::vector<uint64_t>{0, 2});

    REQUIRE(f.reputation.get_authors(f.agent).value() == std::vector<Address>{alice, bob});
    REQUIRE(f.reputation.get_summary(42).error().code == ErrorCode::AgentNotFound);
}
