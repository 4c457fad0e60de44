#pragma once

#include "suite.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentreg
{

    nlohmann::json error_to_json(const RegistryError &error);

    /**
     * Applies JSON-encoded operations to a RegistrySuite.
     *
     * An operation is {"op": name, "sender": hex, "timestamp": n, "args": {...}}.
     * Each one commits or fails on its own; a failure is reported in its
     * result entry and the script continues with the next operation.
     */
    class Dispatcher
    {
    public:
        using Handler = std::function<Result<nlohmann::json>(const CallContext &, const nlohmann::json &)>;

        explicit Dispatcher(RegistrySuite &suite);

        /** {"op", "ok": true, "result"} or {"op", "ok": false, "error": {...}} */
        nlohmann::json apply(const nlohmann::json &operation);

        /**
         * Run an array of operations (or {"operations": [...]}). The output
         * carries one result per operation, the events they emitted and the
         * ledger head.
         */
        Result<nlohmann::json> run_script(const nlohmann::json &script);

        std::vector<std::string> operations() const;

    private:
        Result<nlohmann::json> dispatch(const nlohmann::json &operation);
        void register_identity_ops();
        void register_reputation_ops();
        void register_validation_ops();
        void register_incident_ops();

        RegistrySuite &suite_;
        std::map<std::string, Handler> handlers_;
    };

} // namespace agentreg
