#pragma once

#include "agent_directory.hpp"
#include "config.hpp"
#include "events.hpp"
#include "primitives.hpp"
#include "proof_verifier.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentreg
{

    struct MetadataEntry
    {
        std::string key;
        Bytes value;
    };

    struct Agent
    {
        AgentId id{0};
        Address owner;
        std::string uri;
        std::optional<Hash32> uri_hash; // integrity hash of the off-chain document
        std::map<std::string, Bytes> metadata;
        Address wallet;                 // zero when no wallet is delegated
        uint64_t wallet_nonce{0};       // consumed by each signed delegation
        bool active{true};
        uint64_t created_at{0};

        nlohmann::json to_json() const;
    };

    /**
     * Code deployed at a recipient address that must acknowledge
     * safe transfers.
     */
    class AgentReceiver
    {
    public:
        virtual ~AgentReceiver() = default;

        virtual bool on_agent_received(const Address &operator_address,
                                       const Address &from,
                                       AgentId agent_id,
                                       const Bytes &data) = 0;
    };

    /**
     * Lookup of receiver code by address. Addresses without an entry are
     * plain accounts and accept any transfer.
     */
    class ReceiverDirectory
    {
    public:
        virtual ~ReceiverDirectory() = default;

        virtual AgentReceiver *receiver_at(const Address &address) const = 0;
    };

    /**
     * Identity registry: mints agents, stores their URI and metadata, manages
     * delegated wallets, activation and ownership transfer.
     *
     * Every mutation validates all inputs before the first write and emits its
     * events only after the write, so a rejected call leaves no trace.
     */
    class IdentityRegistry : public AgentDirectory
    {
    public:
        IdentityRegistry(Environment environment,
                         std::shared_ptr<EventLog> events,
                         std::shared_ptr<const ProofVerifier> verifier = nullptr,
                         std::shared_ptr<const ReceiverDirectory> receivers = nullptr);

        // ---- registration -------------------------------------------------

        Result<AgentId> register_agent(const CallContext &ctx);

        Result<AgentId> register_agent(const CallContext &ctx, const std::string &uri);

        Result<AgentId> register_agent(const CallContext &ctx,
                                       const std::string &uri,
                                       const std::vector<MetadataEntry> &metadata);

        Result<AgentId> register_agent(const CallContext &ctx,
                                       const std::string &uri,
                                       const std::optional<Hash32> &uri_hash,
                                       const std::vector<MetadataEntry> &metadata);

        // ---- URI and metadata ---------------------------------------------

        Result<void> set_agent_uri(const CallContext &ctx,
                                   AgentId agent_id,
                                   const std::string &uri,
                                   const std::optional<Hash32> &uri_hash = std::nullopt);

        Result<void> set_metadata(const CallContext &ctx,
                                  AgentId agent_id,
                                  const std::string &key,
                                  const Bytes &value);

        /** Parallel arrays; mismatched lengths are rejected */
        Result<void> set_metadata_batch(const CallContext &ctx,
                                        AgentId agent_id,
                                        const std::vector<std::string> &keys,
                                        const std::vector<Bytes> &values);

        /** Missing keys read as empty; "agentWallet" reads the wallet bytes */
        Result<Bytes> get_metadata(AgentId agent_id, const std::string &key) const;

        // ---- delegated wallet ---------------------------------------------

        /**
         * Delegate `wallet` with a proof signed by the wallet's key over a
         * DelegationRequest bound to the current nonce and `deadline`.
         */
        Result<void> set_agent_wallet(const CallContext &ctx,
                                      AgentId agent_id,
                                      const Address &wallet,
                                      uint64_t deadline,
                                      const DelegationProof &proof);

        /** Clear-only path; needs no proof */
        Result<void> unset_agent_wallet(const CallContext &ctx, AgentId agent_id);

        /** Request the wallet holder must sign for the next delegation */
        Result<DelegationRequest> delegation_request(AgentId agent_id,
                                                     const Address &wallet,
                                                     uint64_t deadline) const;

        Result<uint64_t> wallet_nonce(AgentId agent_id) const;

        // ---- lifecycle ----------------------------------------------------

        Result<void> deactivate(const CallContext &ctx, AgentId agent_id);
        Result<void> reactivate(const CallContext &ctx, AgentId agent_id);
        Result<bool> is_active(AgentId agent_id) const;

        // ---- approvals and transfer ---------------------------------------

        Result<void> approve(const CallContext &ctx, const Address &to, AgentId agent_id);
        Result<void> set_approval_for_all(const CallContext &ctx, const Address &operator_address, bool approved);
        Result<Address> get_approved(AgentId agent_id) const;
        bool is_approved_for_all(const Address &owner, const Address &operator_address) const;

        Result<void> transfer_from(const CallContext &ctx,
                                   const Address &from,
                                   const Address &to,
                                   AgentId agent_id);

        Result<void> safe_transfer_from(const CallContext &ctx,
                                        const Address &from,
                                        const Address &to,
                                        AgentId agent_id,
                                        const Bytes &data = {});

        // ---- queries ------------------------------------------------------

        bool exists(AgentId agent_id) const override;
        Result<Address> owner_of(AgentId agent_id) const override;
        Result<Address> agent_wallet(AgentId agent_id) const override;

        Result<Agent> agent(AgentId agent_id) const;
        Result<std::string> agent_uri(AgentId agent_id) const;
        Result<std::optional<Hash32>> uri_hash(AgentId agent_id) const;
        Result<uint64_t> balance_of(const Address &owner) const;
        std::vector<AgentId> agents_of(const Address &owner) const;
        uint64_t total_agents() const { return next_id_ - 1; }

        const Environment &environment() const { return environment_; }

    private:
        static constexpr const char *kRegistry = "identity";

        Result<const Agent *> find(AgentId agent_id) const;
        bool is_owner_or_operator(const Agent &agent, const Address &who) const;
        bool is_approved_or_owner(const Agent &agent, const Address &who) const;
        Result<Agent *> require_controller(const CallContext &ctx, AgentId agent_id);
        Result<void> check_transfer(const CallContext &ctx,
                                    const Address &from,
                                    const Address &to,
                                    AgentId agent_id) const;
        void commit_transfer(const CallContext &ctx, const Address &from, const Address &to, AgentId agent_id);
        void emit(const CallContext &ctx, const char *name, nlohmann::json fields);

        Environment environment_;
        std::shared_ptr<EventLog> events_;
        std::shared_ptr<const ProofVerifier> verifier_;
        std::shared_ptr<const ReceiverDirectory> receivers_;

        AgentId next_id_{1};
        std::unordered_map<AgentId, Agent> agents_;
        std::unordered_map<Address, std::vector<AgentId>> owned_;
        std::unordered_map<AgentId, Address> token_approvals_;
        std::unordered_map<Address, std::unordered_set<Address>> operator_approvals_;
    };

} // namespace agentreg
