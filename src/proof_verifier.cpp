#include "agentreg/proof_verifier.hpp"
#include "agentreg/canonical_json.hpp"
#include <format>
#include <algorithm>

namespace agentreg
{

    namespace
    {
        constexpr const char *kDelegationDomain = "agentreg.identity.agent-wallet.v1";
    }

    nlohmann::json DelegationRequest::to_json() const
    {
        return nlohmann::json{{"domain", kDelegationDomain},
                              {"chain_id", chain_id},
                              {"registry", registry.to_hex()},
                              {"agent_id", agent_id},
                              {"owner", owner.to_hex()},
                              {"wallet", wallet.to_hex()},
                              {"nonce", nonce},
                              {"deadline", deadline}};
    }

    Bytes DelegationRequest::canonical_message() const
    {
        return json::Canonicalizer::canonical_bytes(to_json());
    }

    nlohmann::json DelegationProof::to_json() const
    {
        return nlohmann::json{{"public_key", crypto::Base64::encode(public_key)},
                              {"signature", crypto::Base64::encode(signature)}};
    }

    Result<DelegationProof> DelegationProof::from_json(const nlohmann::json &j)
    {
        try
        {
            auto pk = crypto::Base64::decode(j.at("public_key").get<std::string>());
            if (!pk)
                return std::unexpected(pk.error());
            auto sig = crypto::Base64::decode(j.at("signature").get<std::string>());
            if (!sig)
                return std::unexpected(sig.error());
            return DelegationProof{std::move(*pk), std::move(*sig)};
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(std::format("Malformed delegation proof: {}", e.what())));
        }
    }

    Address address_from_public_key(const crypto::Ed25519PublicKey &public_key)
    {
        auto digest = crypto::SHA256::hash(Bytes(public_key.begin(), public_key.end()));
        Address a;
        std::copy_n(digest.bytes.begin() + (Hash32::kSize - Address::kSize), Address::kSize, a.bytes.begin());
        return a;
    }

    Result<void> Ed25519ProofVerifier::verify(const DelegationRequest &request,
                                              const DelegationProof &proof) const
    {
        if (proof.public_key.size() != 32)
            return std::unexpected(RegistryError(ErrorCode::InvalidSignature, "Invalid public key length (expected 32 bytes)"));
        if (proof.signature.size() != 64)
            return std::unexpected(RegistryError(ErrorCode::InvalidSignature, "Invalid signature length (expected 64 bytes)"));

        crypto::Ed25519PublicKey pub{};
        std::copy(proof.public_key.begin(), proof.public_key.end(), pub.begin());

        if (address_from_public_key(pub) != request.wallet)
            return std::unexpected(RegistryError(ErrorCode::InvalidSignature, "Proof key does not control the wallet address"));

        crypto::Ed25519Signature sig{};
        std::copy(proof.signature.begin(), proof.signature.end(), sig.begin());

        if (!crypto::Ed25519KeyPair::verify(request.canonical_message(), sig, pub))
            return std::unexpected(RegistryError(ErrorCode::InvalidSignature, "Delegation signature verification failed"));

        return {};
    }

    DelegationProof sign_delegation(const DelegationRequest &request,
                                    const crypto::Ed25519KeyPair &wallet_key)
    {
        auto sig = wallet_key.sign(request.canonical_message());
        return DelegationProof{Bytes(wallet_key.public_key.begin(), wallet_key.public_key.end()),
                               Bytes(sig.begin(), sig.end())};
    }

} // namespace agentreg
