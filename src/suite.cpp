#include "agentreg/suite.hpp"
#include <spdlog/spdlog.h>

namespace agentreg
{

    RegistrySuite::RegistrySuite(const Environment &environment,
                                 std::shared_ptr<const ProofVerifier> verifier,
                                 std::shared_ptr<const ReceiverDirectory> receivers)
        : environment_(environment),
          events_(std::make_shared<EventLog>()),
          identity_(std::make_shared<IdentityRegistry>(environment, events_, std::move(verifier), std::move(receivers))),
          reputation_(std::make_unique<ReputationRegistry>(identity_, events_)),
          validation_(std::make_unique<ValidationRegistry>(environment, identity_, events_)),
          incidents_(std::make_unique<IncidentRegistry>(identity_, events_))
    {
        spdlog::debug("suite: chain {} identity={} reputation={} validation={} incident={}",
                      environment_.chain_id,
                      environment_.identity_registry.to_hex(),
                      environment_.reputation_registry.to_hex(),
                      environment_.validation_registry.to_hex(),
                      environment_.incident_registry.to_hex());
    }

} // namespace agentreg
