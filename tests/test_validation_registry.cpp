#include <catch2/catch_test_macros.hpp>
#include "agentreg/identity_registry.hpp"
#include "agentreg/limits.hpp"
#include "agentreg/validation_registry.hpp"
#include "test_support.hpp"
#include <set>

using namespace agentreg;
using agentreg::test::addr;
using agentreg::test::as;

namespace
{
    struct Fixture
    {
        Environment env = test::test_environment();
        std::shared_ptr<EventLog> events = std::make_shared<EventLog>();
        std::shared_ptr<IdentityRegistry> identity = std::make_shared<IdentityRegistry>(env, events);
        ValidationRegistry validation{env, identity, events};

        Address owner = addr(1);
        Address requester = addr(2);
        Address validator = addr(3);
        AgentId agent = identity->register_agent(as(owner)).value();
    };

    Hash32 content(uint8_t tag)
    {
        Hash32 h;
        h.bytes[0] = tag;
        return h;
    }
}

TEST_CASE("Request ids are deterministic and domain separated", "[validation][ids]")
{
    const Address r = addr(2);
    const Address v = addr(3);
    const auto env = test::test_environment();
    const auto id = derive_request_id(r, v, 1, content(1), 0, env.chain_id, env.validation_registry);

    REQUIRE(id == derive_request_id(r, v, 1, content(1), 0, env.chain_id, env.validation_registry));

    std::set<RequestId> ids{id};
    ids.insert(derive_request_id(addr(4), v, 1, content(1), 0, env.chain_id, env.validation_registry));
    ids.insert(derive_request_id(r, addr(4), 1, content(1), 0, env.chain_id, env.validation_registry));
    ids.insert(derive_request_id(r, v, 2, content(1), 0, env.chain_id, env.validation_registry));
    ids.insert(derive_request_id(r, v, 1, content(2), 0, env.chain_id, env.validation_registry));
    ids.insert(derive_request_id(r, v, 1, content(1), 1, env.chain_id, env.validation_registry));
    ids.insert(derive_request_id(r, v, 1, content(1), 0, env.chain_id + 1, env.validation_registry));
    ids.insert(derive_request_id(r, v, 1, content(1), 0, env.chain_id, env.identity_registry));
    REQUIRE(ids.size() == 8);
}

TEST_CASE("Requesting a validation", "[validation]")
{
    Fixture f;

    REQUIRE(f.validation.request_validation(as(f.requester), Address::zero(), f.agent, "ipfs://req").error().code ==
            ErrorCode::ZeroAddress);
    REQUIRE(f.validation.request_validation(as(f.requester), f.validator, 77, "ipfs://req").error().code ==
            ErrorCode::AgentNotFound);
    REQUIRE(f.validation
                .request_validation(as(f.requester), f.validator, f.agent, std::string(limits::kMaxUriLength + 1, 'u'))
                .error()
                .code == ErrorCode::FieldTooLong);
    REQUIRE(f.validation.requester_sequence(f.requester) == 0);

    auto id = f.validation.request_validation(as(f.requester, 50), f.validator, f.agent, "ipfs://req");
    REQUIRE(id.has_value());
    REQUIRE(f.validation.request_exists(*id));
    REQUIRE(f.validation.requester_sequence(f.requester) == 1);

    auto record = f.validation.get_request(*id).value();
    REQUIRE(record.status == ValidationStatus::Pending);
    REQUIRE(record.created_at == 50);
    REQUIRE(record.sequence == 0);
    REQUIRE(record.content_hash == default_content_hash(f.requester, f.validator, f.agent, "ipfs://req"));
    REQUIRE(*id == derive_request_id(f.requester, f.validator, f.agent, record.content_hash, 0,
                                     f.env.chain_id, f.env.validation_registry));

    REQUIRE(f.validation.agent_requests(f.agent).value() == std::vector<RequestId>{*id});
    REQUIRE(f.validation.validator_requests(f.validator) == std::vector<RequestId>{*id});
    REQUIRE(f.validation.requester_requests(f.requester) == std::vector<RequestId>{*id});
    REQUIRE(f.events->named("validation", "ValidationRequested").size() == 1);

    REQUIRE(f.validation.get_request(content(9)).error().code == ErrorCode::RequestNotFound);
    REQUIRE_FALSE(f.validation.request_exists(content(9)));
}

TEST_CASE("Identical requests get distinct ids through the sequence number", "[validation][ids]")
{
    Fixture f;
    auto a = f.validation.request_validation(as(f.requester), f.validator, f.agent, "ipfs://x", content(1)).value();
    auto b = f.validation.request_validation(as(f.requester), f.validator, f.agent, "ipfs://x", content(1)).value();
    REQUIRE(a != b);
    REQUIRE(f.validation.get_request(b).value().sequence == 1);

    // a different requester starts its own sequence
    auto c = f.validation.request_validation(as(addr(4)), f.validator, f.agent, "ipfs://x", content(1)).value();
    REQUIRE(f.validation.get_request(c).value().sequence == 0);
    REQUIRE(c != a);
}

TEST_CASE("Validation state machine", "[validation][state]")
{
    Fixture f;
    auto id = f.validation.request_validation(as(f.requester), f.validator, f.agent, "ipfs://req").value();

    SECTION("Only the validator completes")
    {
        REQUIRE(f.validation.complete(as(f.requester), id).error().code == ErrorCode::Unauthorized);
        REQUIRE(f.validation.get_status(id).value() == ValidationStatus::Pending);
    }

    SECTION("Outcome is bounded")
    {
        ValidationResponse response;
        response.outcome = 101;
        REQUIRE(f.validation.complete(as(f.validator), id, response).error().code == ErrorCode::ScoreOutOfRange);
        REQUIRE(f.validation.get_status(id).value() == ValidationStatus::Pending);
    }

    SECTION("Explicit outcome and tag")
    {
        ValidationResponse response;
        response.outcome = 72;
        response.tag = "latency";
        response.response_uri = "ipfs://report";
        REQUIRE(f.validation.complete(as(f.validator, 2000), id, response).has_value());

        auto record = f.validation.get_request(id).value();
        REQUIRE(record.status == ValidationStatus::Completed);
        REQUIRE(*record.outcome == 72);
        REQUIRE_FALSE(record.outcome_defaulted);
        REQUIRE(record.tag == "latency");
        REQUIRE(record.completed_at == 2000);
    }

    SECTION("Defaults are recorded as defaults")
    {
        REQUIRE(f.validation.reject(as(f.validator), id).has_value());
        auto record = f.validation.get_request(id).value();
        REQUIRE(record.status == ValidationStatus::Rejected);
        REQUIRE(*record.outcome == limits::kDefaultRejectionOutcome);
        REQUIRE(record.outcome_defaulted);
    }

    SECTION("Only the requester cancels")
    {
        REQUIRE(f.validation.cancel(as(f.validator), id).error().code == ErrorCode::Unauthorized);
        REQUIRE(f.validation.cancel(as(f.requester), id).has_value());
        REQUIRE(f.validation.get_status(id).value() == ValidationStatus::Cancelled);
        REQUIRE_FALSE(f.validation.get_request(id).value().outcome.has_value());
    }

    SECTION("Terminal states are final")
    {
        REQUIRE(f.validation.complete(as(f.validator), id).has_value());
        REQUIRE(f.validation.complete(as(f.validator), id).error().code == ErrorCode::InvalidTransition);
        REQUIRE(f.validation.reject(as(f.validator), id).error().code == ErrorCode::InvalidTransition);
        REQUIRE(f.validation.cancel(as(f.requester), id).error().code == ErrorCode::InvalidTransition);
        REQUIRE(f.validation.get_status(id).value() == ValidationStatus::Completed);
        REQUIRE(f.events->named("validation", "ValidationCompleted").size() == 1);
    }
}

TEST_CASE("Validation summaries", "[validation][summary]")
{
    Fixture f;
    const Address other_validator = addr(5);
    auto a = f.validation.request_validation(as(f.requester), f.validator, f.agent, "1").value();
    auto b = f.validation.request_validation(as(f.requester), f.validator, f.agent, "2").value();
    auto c = f.validation.request_validation(as(f.requester), other_validator, f.agent, "3").value();
    auto d = f.validation.request_validation(as(f.requester), f.validator, f.agent, "4").value();
    f.validation.request_validation(as(f.requester), f.validator, f.agent, "5").value();

    ValidationResponse tagged;
    tagged.outcome = 80;
    tagged.tag = "safety";
    REQUIRE(f.validation.complete(as(f.validator), a, tagged).has_value());
    REQUIRE(f.validation.reject(as(f.validator), b).has_value());
    REQUIRE(f.validation.complete(as(other_validator), c).has_value());
    REQUIRE(f.validation.cancel(as(f.requester), d).has_value());

    auto all = f.validation.get_summary(f.agent).value();
    REQUIRE(all.total == 5);
    REQUIRE(all.pending == 1);
    REQUIRE(all.completed == 2);
    REQUIRE(all.rejected == 1);
    REQUIRE(all.cancelled == 1);
    REQUIRE(all.average_outcome == 60.0); // (80 + 0 + 100) / 3

    ValidationFilter only_main;
    only_main.validators = {f.validator};
    auto primary = f.validation.get_summary(f.agent, only_main).value();
    REQUIRE(primary.total == 4);
    REQUIRE(primary.completed == 1);
    REQUIRE(primary.average_outcome == 40.0);

    ValidationFilter by_tag;
    by_tag.tag = "safety";
    auto safety = f.validation.get_summary(f.agent, by_tag).value();
    REQUIRE(safety.total == 1);
    REQUIRE(safety.average_outcome == 80.0);

    REQUIRE(f.validation.get_summary(404).error().code == ErrorCode::AgentNotFound);
}
