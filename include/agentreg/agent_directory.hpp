#pragma once

#include "primitives.hpp"
#include "types.hpp"

namespace agentreg
{

    /**
     * Read-only view of agent control that the dependent registries hold.
     * The identity registry implements it; nothing behind this interface
     * ever calls back into a dependent.
     */
    class AgentDirectory
    {
    public:
        virtual ~AgentDirectory() = default;

        virtual bool exists(AgentId agent_id) const = 0;

        /** Current owner; AgentNotFound for unknown ids */
        virtual Result<Address> owner_of(AgentId agent_id) const = 0;

        /** Delegated wallet, or the zero address when none is set */
        virtual Result<Address> agent_wallet(AgentId agent_id) const = 0;

        /**
         * True when `who` is the agent's owner or its delegated wallet.
         * The zero address is never an authority.
         */
        Result<bool> is_agent_authority(AgentId agent_id, const Address &who) const
        {
            auto owner = owner_of(agent_id);
            if (!owner)
                return std::unexpected(owner.error());
            if (who.is_zero())
                return false;
            if (*owner == who)
                return true;
            auto wallet = agent_wallet(agent_id);
            if (!wallet)
                return std::unexpected(wallet.error());
            return !wallet->is_zero() && *wallet == who;
        }
    };

} // namespace agentreg
