#pragma once

#include "crypto.hpp"
#include "primitives.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace agentreg
{

    /**
     * Statement a prospective agent wallet signs to prove it consents to
     * being delegated. Every field is bound into the signed message.
     */
    struct DelegationRequest
    {
        uint64_t chain_id{0};
        Address registry;
        AgentId agent_id{0};
        Address owner;
        Address wallet;
        uint64_t nonce{0};
        uint64_t deadline{0};

        nlohmann::json to_json() const;

        /** RFC 8785 canonical JSON of to_json() with a domain tag */
        Bytes canonical_message() const;
    };

    /**
     * Signature material supplied with set_agent_wallet. Kept as raw bytes so
     * malformed lengths are rejected by the verifier rather than truncated.
     */
    struct DelegationProof
    {
        Bytes public_key;
        Bytes signature;

        nlohmann::json to_json() const;
        static Result<DelegationProof> from_json(const nlohmann::json &j);
    };

    /**
     * Pluggable proof-of-control check. Implementations accept only when the
     * proof was produced by the key that controls request.wallet over
     * request.canonical_message().
     */
    class ProofVerifier
    {
    public:
        virtual ~ProofVerifier() = default;

        virtual Result<void> verify(const DelegationRequest &request,
                                    const DelegationProof &proof) const = 0;
    };

    /** Address controlled by an Ed25519 key: last 20 bytes of SHA-256(pk) */
    Address address_from_public_key(const crypto::Ed25519PublicKey &public_key);

    class Ed25519ProofVerifier : public ProofVerifier
    {
    public:
        Result<void> verify(const DelegationRequest &request,
                            const DelegationProof &proof) const override;
    };

    /** Produce the proof a wallet holder hands to the agent owner */
    DelegationProof sign_delegation(const DelegationRequest &request,
                                    const crypto::Ed25519KeyPair &wallet_key);

} // namespace agentreg
