#include "agentreg/identity_registry.hpp"
#include "agentreg/checks.hpp"
#include "agentreg/limits.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentreg
{

    namespace
    {
        Result<void> check_metadata_entry(const std::string &key, const Bytes &value)
        {
            if (auto r = checks::non_empty("metadata key", key); !r)
                return r;
            if (auto r = checks::text("metadata key", key, limits::kMaxMetadataKeyLength); !r)
                return r;
            if (key == limits::kAgentWalletKey)
            {
                return std::unexpected(RegistryError(ErrorCode::ReservedKey,
                                                     "metadata key 'agentWallet' is managed by the delegation paths"));
            }
            if (value.size() > limits::kMaxMetadataValueLength)
                return std::unexpected(RegistryError::too_long("metadata value", limits::kMaxMetadataValueLength));
            return {};
        }

        nlohmann::json metadata_fields(AgentId id, const std::string &key, const Bytes &value)
        {
            return {{"agent_id", id}, {"key", key}, {"value", hex::encode(value)}};
        }
    } // namespace

    nlohmann::json Agent::to_json() const
    {
        nlohmann::json meta = nlohmann::json::object();
        for (const auto &[k, v] : metadata)
            meta[k] = hex::encode(v);
        return {{"agent_id", id},
                {"owner", owner.to_hex()},
                {"uri", uri},
                {"uri_hash", optional_hash_to_hex(uri_hash)},
                {"metadata", meta},
                {"wallet", wallet.to_hex()},
                {"wallet_nonce", wallet_nonce},
                {"active", active},
                {"created_at", created_at}};
    }

    IdentityRegistry::IdentityRegistry(Environment environment,
                                       std::shared_ptr<EventLog> events,
                                       std::shared_ptr<const ProofVerifier> verifier,
                                       std::shared_ptr<const ReceiverDirectory> receivers)
        : environment_(std::move(environment)),
          events_(std::move(events)),
          verifier_(verifier ? std::move(verifier) : std::make_shared<Ed25519ProofVerifier>()),
          receivers_(std::move(receivers))
    {
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    // ========================================================================
    // Registration
    // ========================================================================

    Result<AgentId> IdentityRegistry::register_agent(const CallContext &ctx)
    {
        return register_agent(ctx, std::string(), std::nullopt, {});
    }

    Result<AgentId> IdentityRegistry::register_agent(const CallContext &ctx, const std::string &uri)
    {
        return register_agent(ctx, uri, std::nullopt, {});
    }

    Result<AgentId> IdentityRegistry::register_agent(const CallContext &ctx,
                                                     const std::string &uri,
                                                     const std::vector<MetadataEntry> &metadata)
    {
        return register_agent(ctx, uri, std::nullopt, metadata);
    }

    Result<AgentId> IdentityRegistry::register_agent(const CallContext &ctx,
                                                     const std::string &uri,
                                                     const std::optional<Hash32> &uri_hash,
                                                     const std::vector<MetadataEntry> &metadata)
    {
        if (auto r = checks::non_zero("owner", ctx.sender); !r)
            return std::unexpected(r.error());
        if (auto r = checks::text("uri", uri, limits::kMaxUriLength); !r)
            return std::unexpected(r.error());
        for (const auto &entry : metadata)
        {
            if (auto r = check_metadata_entry(entry.key, entry.value); !r)
                return std::unexpected(r.error());
        }

        Agent agent;
        agent.id = next_id_;
        agent.owner = ctx.sender;
        agent.uri = uri;
        agent.uri_hash = uri_hash;
        agent.created_at = ctx.timestamp;
        for (const auto &entry : metadata)
            agent.metadata[entry.key] = entry.value;

        const AgentId id = agent.id;
        agents_.emplace(id, std::move(agent));
        owned_[ctx.sender].push_back(id);
        ++next_id_;

        emit(ctx, "Transfer", {{"from", Address::zero().to_hex()}, {"to", ctx.sender.to_hex()}, {"agent_id", id}});
        emit(ctx, "Registered", {{"agent_id", id}, {"uri", uri}, {"uri_hash", optional_hash_to_hex(uri_hash)}, {"owner", ctx.sender.to_hex()}});
        for (const auto &entry : metadata)
            emit(ctx, "MetadataSet", metadata_fields(id, entry.key, entry.value));

        spdlog::debug("identity: registered agent {} for {}", id, ctx.sender.to_hex());
        return id;
    }

    // ========================================================================
    // URI and metadata
    // ========================================================================

    Result<void> IdentityRegistry::set_agent_uri(const CallContext &ctx,
                                                 AgentId agent_id,
                                                 const std::string &uri,
                                                 const std::optional<Hash32> &uri_hash)
    {
        auto agent = require_controller(ctx, agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if (auto r = checks::text("uri", uri, limits::kMaxUriLength); !r)
            return r;

        (*agent)->uri = uri;
        (*agent)->uri_hash = uri_hash;
        emit(ctx, "UriUpdated", {{"agent_id", agent_id}, {"uri", uri}, {"uri_hash", optional_hash_to_hex(uri_hash)}, {"updated_by", ctx.sender.to_hex()}});
        return {};
    }

    Result<void> IdentityRegistry::set_metadata(const CallContext &ctx,
                                                AgentId agent_id,
                                                const std::string &key,
                                                const Bytes &value)
    {
        return set_metadata_batch(ctx, agent_id, {key}, {value});
    }

    Result<void> IdentityRegistry::set_metadata_batch(const CallContext &ctx,
                                                      AgentId agent_id,
                                                      const std::vector<std::string> &keys,
                                                      const std::vector<Bytes> &values)
    {
        auto agent = require_controller(ctx, agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if (keys.size() != values.size())
        {
            return std::unexpected(RegistryError(ErrorCode::LengthMismatch,
                                                 "metadata keys and values differ in length"));
        }
        for (std::size_t i = 0; i < keys.size(); ++i)
        {
            if (auto r = check_metadata_entry(keys[i], values[i]); !r)
                return r;
        }

        for (std::size_t i = 0; i < keys.size(); ++i)
        {
            (*agent)->metadata[keys[i]] = values[i];
            emit(ctx, "MetadataSet", metadata_fields(agent_id, keys[i], values[i]));
        }
        return {};
    }

    Result<Bytes> IdentityRegistry::get_metadata(AgentId agent_id, const std::string &key) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());

        if (key == limits::kAgentWalletKey)
        {
            const auto &wallet = (*agent)->wallet;
            if (wallet.is_zero())
                return Bytes{};
            return Bytes(wallet.bytes.begin(), wallet.bytes.end());
        }

        auto it = (*agent)->metadata.find(key);
        if (it == (*agent)->metadata.end())
            return Bytes{};
        return it->second;
    }

    // ========================================================================
    // Delegated wallet
    // ========================================================================

    Result<DelegationRequest> IdentityRegistry::delegation_request(AgentId agent_id,
                                                                   const Address &wallet,
                                                                   uint64_t deadline) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());

        DelegationRequest request;
        request.chain_id = environment_.chain_id;
        request.registry = environment_.identity_registry;
        request.agent_id = agent_id;
        request.owner = (*agent)->owner;
        request.wallet = wallet;
        request.nonce = (*agent)->wallet_nonce;
        request.deadline = deadline;
        return request;
    }

    Result<void> IdentityRegistry::set_agent_wallet(const CallContext &ctx,
                                                    AgentId agent_id,
                                                    const Address &wallet,
                                                    uint64_t deadline,
                                                    const DelegationProof &proof)
    {
        auto agent = require_controller(ctx, agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if (auto r = checks::non_zero("wallet", wallet); !r)
            return r;
        if (ctx.timestamp > deadline)
        {
            return std::unexpected(RegistryError(ErrorCode::DelegationExpired,
                                                 std::format("delegation proof expired at {}", deadline)));
        }

        auto request = delegation_request(agent_id, wallet, deadline);
        if (!request)
            return std::unexpected(request.error());
        if (auto verified = verifier_->verify(*request, proof); !verified)
        {
            spdlog::debug("identity: rejected wallet proof for agent {}: {}", agent_id, verified.error().what());
            return verified;
        }

        (*agent)->wallet = wallet;
        ++(*agent)->wallet_nonce;
        emit(ctx, "AgentWalletSet", {{"agent_id", agent_id}, {"wallet", wallet.to_hex()}, {"nonce", request->nonce}, {"set_by", ctx.sender.to_hex()}});
        return {};
    }

    Result<void> IdentityRegistry::unset_agent_wallet(const CallContext &ctx, AgentId agent_id)
    {
        auto agent = require_controller(ctx, agent_id);
        if (!agent)
            return std::unexpected(agent.error());

        const Address previous = (*agent)->wallet;
        (*agent)->wallet = Address::zero();
        emit(ctx, "AgentWalletUnset", {{"agent_id", agent_id}, {"previous_wallet", previous.to_hex()}, {"reason", "owner"}});
        return {};
    }

    Result<uint64_t> IdentityRegistry::wallet_nonce(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->wallet_nonce;
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    Result<void> IdentityRegistry::deactivate(const CallContext &ctx, AgentId agent_id)
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if ((*agent)->owner != ctx.sender)
            return std::unexpected(RegistryError::unauthorized("only the owner may deactivate an agent"));
        if (!(*agent)->active)
            return std::unexpected(RegistryError(ErrorCode::AlreadyInactive, "agent is already inactive"));

        agents_.at(agent_id).active = false;
        emit(ctx, "AgentDeactivated", {{"agent_id", agent_id}, {"owner", ctx.sender.to_hex()}});
        return {};
    }

    Result<void> IdentityRegistry::reactivate(const CallContext &ctx, AgentId agent_id)
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if ((*agent)->owner != ctx.sender)
            return std::unexpected(RegistryError::unauthorized("only the owner may reactivate an agent"));
        if ((*agent)->active)
            return std::unexpected(RegistryError(ErrorCode::AlreadyActive, "agent is already active"));

        agents_.at(agent_id).active = true;
        emit(ctx, "AgentReactivated", {{"agent_id", agent_id}, {"owner", ctx.sender.to_hex()}});
        return {};
    }

    Result<bool> IdentityRegistry::is_active(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->active;
    }

    // ========================================================================
    // Approvals and transfer
    // ========================================================================

    Result<void> IdentityRegistry::approve(const CallContext &ctx, const Address &to, AgentId agent_id)
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if (!is_owner_or_operator(**agent, ctx.sender))
            return std::unexpected(RegistryError::unauthorized("caller is neither owner nor operator"));
        if (to == (*agent)->owner)
            return std::unexpected(RegistryError::invalid_input("cannot approve the current owner"));

        // approving the zero address clears the approval
        if (to.is_zero())
            token_approvals_.erase(agent_id);
        else
            token_approvals_[agent_id] = to;
        emit(ctx, "Approval", {{"owner", (*agent)->owner.to_hex()}, {"approved", to.to_hex()}, {"agent_id", agent_id}});
        return {};
    }

    Result<void> IdentityRegistry::set_approval_for_all(const CallContext &ctx,
                                                        const Address &operator_address,
                                                        bool approved)
    {
        if (auto r = checks::non_zero("operator", operator_address); !r)
            return r;
        if (operator_address == ctx.sender)
            return std::unexpected(RegistryError::invalid_input("cannot approve yourself as operator"));

        if (approved)
            operator_approvals_[ctx.sender].insert(operator_address);
        else if (auto it = operator_approvals_.find(ctx.sender); it != operator_approvals_.end())
            it->second.erase(operator_address);

        emit(ctx, "ApprovalForAll", {{"owner", ctx.sender.to_hex()}, {"operator", operator_address.to_hex()}, {"approved", approved}});
        return {};
    }

    Result<Address> IdentityRegistry::get_approved(AgentId agent_id) const
    {
        if (auto agent = find(agent_id); !agent)
            return std::unexpected(agent.error());
        auto it = token_approvals_.find(agent_id);
        return it == token_approvals_.end() ? Address::zero() : it->second;
    }

    bool IdentityRegistry::is_approved_for_all(const Address &owner, const Address &operator_address) const
    {
        auto it = operator_approvals_.find(owner);
        return it != operator_approvals_.end() && it->second.contains(operator_address);
    }

    Result<void> IdentityRegistry::transfer_from(const CallContext &ctx,
                                                 const Address &from,
                                                 const Address &to,
                                                 AgentId agent_id)
    {
        if (auto r = check_transfer(ctx, from, to, agent_id); !r)
            return r;
        commit_transfer(ctx, from, to, agent_id);
        return {};
    }

    Result<void> IdentityRegistry::safe_transfer_from(const CallContext &ctx,
                                                      const Address &from,
                                                      const Address &to,
                                                      AgentId agent_id,
                                                      const Bytes &data)
    {
        if (auto r = check_transfer(ctx, from, to, agent_id); !r)
            return r;

        if (receivers_)
        {
            if (AgentReceiver *receiver = receivers_->receiver_at(to))
            {
                if (!receiver->on_agent_received(ctx.sender, from, agent_id, data))
                {
                    return std::unexpected(RegistryError(ErrorCode::TransferRejected,
                                                         std::format("recipient {} did not acknowledge the transfer", to.to_hex())));
                }
                // the hook runs foreign code; the preconditions must still hold
                if (auto r = check_transfer(ctx, from, to, agent_id); !r)
                    return r;
            }
        }

        commit_transfer(ctx, from, to, agent_id);
        return {};
    }

    Result<void> IdentityRegistry::check_transfer(const CallContext &ctx,
                                                  const Address &from,
                                                  const Address &to,
                                                  AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        if (auto r = checks::non_zero("recipient", to); !r)
            return r;
        if ((*agent)->owner != from)
            return std::unexpected(RegistryError::unauthorized("from is not the current owner"));
        if (!is_approved_or_owner(**agent, ctx.sender))
            return std::unexpected(RegistryError::unauthorized("caller is not owner, approved or operator"));
        return {};
    }

    void IdentityRegistry::commit_transfer(const CallContext &ctx,
                                           const Address &from,
                                           const Address &to,
                                           AgentId agent_id)
    {
        Agent &agent = agents_.at(agent_id);
        const Address previous_wallet = agent.wallet;

        agent.owner = to;
        agent.wallet = Address::zero();
        token_approvals_.erase(agent_id);

        auto &from_list = owned_[from];
        from_list.erase(std::remove(from_list.begin(), from_list.end(), agent_id), from_list.end());
        if (from_list.empty())
            owned_.erase(from);
        owned_[to].push_back(agent_id);

        if (!previous_wallet.is_zero())
        {
            emit(ctx, "AgentWalletUnset", {{"agent_id", agent_id}, {"previous_wallet", previous_wallet.to_hex()}, {"reason", "transfer"}});
        }
        emit(ctx, "Transfer", {{"from", from.to_hex()}, {"to", to.to_hex()}, {"agent_id", agent_id}});
        spdlog::debug("identity: agent {} transferred {} -> {}", agent_id, from.to_hex(), to.to_hex());
    }

    // ========================================================================
    // Queries
    // ========================================================================

    bool IdentityRegistry::exists(AgentId agent_id) const
    {
        return agents_.contains(agent_id);
    }

    Result<Address> IdentityRegistry::owner_of(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->owner;
    }

    Result<Address> IdentityRegistry::agent_wallet(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->wallet;
    }

    Result<Agent> IdentityRegistry::agent(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return **agent;
    }

    Result<std::string> IdentityRegistry::agent_uri(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->uri;
    }

    Result<std::optional<Hash32>> IdentityRegistry::uri_hash(AgentId agent_id) const
    {
        auto agent = find(agent_id);
        if (!agent)
            return std::unexpected(agent.error());
        return (*agent)->uri_hash;
    }

    Result<uint64_t> IdentityRegistry::balance_of(const Address &owner) const
    {
        if (auto r = checks::non_zero("owner", owner); !r)
            return std::unexpected(r.error());
        auto it = owned_.find(owner);
        return it == owned_.end() ? 0 : static_cast<uint64_t>(it->second.size());
    }

    std::vector<AgentId> IdentityRegistry::agents_of(const Address &owner) const
    {
        auto it = owned_.find(owner);
        if (it == owned_.end())
            return {};
        return it->second;
    }

    // ========================================================================
    // Internals
    // ========================================================================

    Result<const Agent *> IdentityRegistry::find(AgentId agent_id) const
    {
        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        return &it->second;
    }

    bool IdentityRegistry::is_owner_or_operator(const Agent &agent, const Address &who) const
    {
        return agent.owner == who || is_approved_for_all(agent.owner, who);
    }

    bool IdentityRegistry::is_approved_or_owner(const Agent &agent, const Address &who) const
    {
        if (is_owner_or_operator(agent, who))
            return true;
        auto it = token_approvals_.find(agent.id);
        return it != token_approvals_.end() && it->second == who;
    }

    Result<Agent *> IdentityRegistry::require_controller(const CallContext &ctx, AgentId agent_id)
    {
        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            return std::unexpected(RegistryError::agent_not_found(agent_id));
        if (!is_approved_or_owner(it->second, ctx.sender))
            return std::unexpected(RegistryError::unauthorized("caller is not owner or approved operator"));
        return &it->second;
    }

    void IdentityRegistry::emit(const CallContext &ctx, const char *name, nlohmann::json fields)
    {
        events_->emit(kRegistry, name, ctx.timestamp, std::move(fields));
    }

} // namespace agentreg
