#include <catch2/catch_test_macros.hpp>
#include "agentreg/identity_registry.hpp"
#include "agentreg/incident_registry.hpp"
#include "agentreg/limits.hpp"
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
        IncidentRegistry incidents{identity, events};

        Address owner = addr(1);
        Address reporter = addr(2);
        AgentId agent = identity->register_agent(as(owner)).value();
    };
}

TEST_CASE("Reporting incidents", "[incident]")
{
    Fixture f;

    REQUIRE(f.incidents.report(as(f.reporter), 9, "ipfs://evidence", std::nullopt, "outage").error().code ==
            ErrorCode::AgentNotFound);
    REQUIRE(f.incidents.report(as(f.reporter), f.agent, "ipfs://evidence", std::nullopt, "").error().code ==
            ErrorCode::InvalidInput);
    REQUIRE(f.incidents
                .report(as(f.reporter), f.agent, "ipfs://evidence", std::nullopt,
                        std::string(limits::kMaxTagLength + 1, 'c'))
                .error()
                .code == ErrorCode::FieldTooLong);
    REQUIRE(f.incidents.total_incidents() == 0);

    auto first = f.incidents.report(as(f.reporter, 10), f.agent, "ipfs://evidence", std::nullopt, "outage");
    auto second = f.incidents.report(as(addr(3)), f.agent, "ipfs://more", std::nullopt, "abuse");
    REQUIRE(first.value() == 1);
    REQUIRE(second.value() == 2);

    auto incident = f.incidents.get_incident(1).value();
    REQUIRE(incident.status == IncidentStatus::Open);
    REQUIRE(incident.reporter == f.reporter);
    REQUIRE(incident.category == "outage");
    REQUIRE(incident.reported_at == 10);
    REQUIRE(incident.resolution == ResolutionCode::None);

    REQUIRE(f.incidents.agent_incidents(f.agent).value() == std::vector<IncidentId>{1, 2});
    REQUIRE(f.incidents.reporter_incidents(f.reporter) == std::vector<IncidentId>{1});
    REQUIRE(f.incidents.incident_count(f.agent).value() == 2);
    REQUIRE(f.incidents.get_incident(3).error().code == ErrorCode::IncidentNotFound);
    REQUIRE(f.events->named("incident", "IncidentReported").size() == 2);
}

TEST_CASE("Incident lifecycle is strictly ordered", "[incident][state]")
{
    Fixture f;
    const auto id = f.incidents.report(as(f.reporter), f.agent, "ipfs://e", std::nullopt, "outage").value();

    SECTION("Resolve before a response fails")
    {
        REQUIRE(f.incidents.resolve(as(f.reporter), id, ResolutionCode::Fixed).error().code ==
                ErrorCode::InvalidTransition);
        REQUIRE(f.incidents.get_incident(id).value().status == IncidentStatus::Open);
    }

    SECTION("Only the agent authority responds")
    {
        REQUIRE(f.incidents.respond(as(f.reporter), id, "ipfs://r").error().code == ErrorCode::Unauthorized);
    }

    SECTION("Full path")
    {
        REQUIRE(f.incidents.respond(as(f.owner, 20), id, "ipfs://r").has_value());
        auto responded = f.incidents.get_incident(id).value();
        REQUIRE(responded.status == IncidentStatus::Responded);
        REQUIRE(responded.responder == f.owner);
        REQUIRE(responded.responded_at == 20);

        REQUIRE(f.incidents.respond(as(f.owner), id, "ipfs://again").error().code == ErrorCode::InvalidTransition);
        REQUIRE(f.incidents.resolve(as(f.owner), id, ResolutionCode::Fixed).error().code == ErrorCode::Unauthorized);
        REQUIRE(f.incidents.resolve(as(f.reporter), id, ResolutionCode::None).error().code ==
                ErrorCode::InvalidInput);

        REQUIRE(f.incidents.resolve(as(f.reporter, 30), id, ResolutionCode::Disputed).has_value());
        auto resolved = f.incidents.get_incident(id).value();
        REQUIRE(resolved.status == IncidentStatus::Resolved);
        REQUIRE(resolved.resolution == ResolutionCode::Disputed);
        REQUIRE(resolved.resolver == f.reporter);
        REQUIRE(resolved.resolved_at == 30);

        REQUIRE(f.incidents.resolve(as(f.reporter), id, ResolutionCode::Fixed).error().code ==
                ErrorCode::InvalidTransition);
        REQUIRE(f.incidents.respond(as(f.owner), id, "ipfs://late").error().code == ErrorCode::InvalidTransition);
    }
}

TEST_CASE("Incident summary", "[incident][summary]")
{
    Fixture f;
    for (int i = 0; i < 3; ++i)
        REQUIRE(f.incidents.report(as(f.reporter), f.agent, "", std::nullopt, "cat").has_value());
    REQUIRE(f.incidents.respond(as(f.owner), 2, "").has_value());
    REQUIRE(f.incidents.respond(as(f.owner), 3, "").has_value());
    REQUIRE(f.incidents.resolve(as(f.reporter), 3, ResolutionCode::Acknowledged).has_value());

    auto summary = f.incidents.get_summary(f.agent).value();
    REQUIRE(summary.total == 3);
    REQUIRE(summary.open == 1);
    REQUIRE(summary.responded == 1);
    REQUIRE(summary.resolved == 1);

    REQUIRE(f.incidents.get_summary(55).error().code == ErrorCode::AgentNotFound);
}

TEST_CASE("Resolution codes parse by name", "[incident]")
{
    REQUIRE(resolution_code_from_string("NotABug").value() == ResolutionCode::NotABug);
    REQUIRE(resolution_code_to_string(ResolutionCode::Duplicate) == "Duplicate");
    REQUIRE(resolution_code_from_string("Whatever").error().code == ErrorCode::InvalidInput);
}
