#pragma once

#include "config.hpp"
#include "events.hpp"
#include "identity_registry.hpp"
#include "incident_registry.hpp"
#include "proof_verifier.hpp"
#include "reputation_registry.hpp"
#include "validation_registry.hpp"
#include <memory>

namespace agentreg
{

    /**
     * One deployment of the four registries over a shared event ledger. The
     * identity registry doubles as the AgentDirectory handed to the others.
     */
    class RegistrySuite
    {
    public:
        explicit RegistrySuite(const Environment &environment,
                               std::shared_ptr<const ProofVerifier> verifier = nullptr,
                               std::shared_ptr<const ReceiverDirectory> receivers = nullptr);

        IdentityRegistry &identity() { return *identity_; }
        ReputationRegistry &reputation() { return *reputation_; }
        ValidationRegistry &validation() { return *validation_; }
        IncidentRegistry &incidents() { return *incidents_; }

        const IdentityRegistry &identity() const { return *identity_; }
        const ReputationRegistry &reputation() const { return *reputation_; }
        const ValidationRegistry &validation() const { return *validation_; }
        const IncidentRegistry &incidents() const { return *incidents_; }

        EventLog &events() { return *events_; }
        const EventLog &events() const { return *events_; }
        std::shared_ptr<EventLog> event_log() const { return events_; }

        const Environment &environment() const { return environment_; }

    private:
        Environment environment_;
        std::shared_ptr<EventLog> events_;
        std::shared_ptr<IdentityRegistry> identity_;
        std::unique_ptr<ReputationRegistry> reputation_;
        std::unique_ptr<ValidationRegistry> validation_;
        std::unique_ptr<IncidentRegistry> incidents_;
    };

} // namespace agentreg
