#include "agentreg/dispatcher.hpp"
#include <cstdint>
#include <format>
#include <limits>
#include <spdlog/spdlog.h>

namespace agentreg
{

    using nlohmann::json;

    namespace
    {
        template <typename T, typename F>
        Result<json> encode(Result<T> r, F &&fn)
        {
            if (!r)
                return std::unexpected(r.error());
            return json(fn(*r));
        }

        Result<json> done(const Result<void> &r)
        {
            if (!r)
                return std::unexpected(r.error());
            return json(nullptr);
        }

        Result<Address> address_arg(const json &args, const char *key)
        {
            if (!args.contains(key))
                return std::unexpected(RegistryError::parsing(std::format("missing argument '{}'", key)));
            return Address::from_hex(args.at(key).get<std::string>());
        }

        Result<std::optional<Hash32>> hash_arg(const json &args, const char *key)
        {
            std::string text = args.value(key, std::string());
            if (text.empty())
                return std::optional<Hash32>{};
            auto hash = Hash32::from_hex(text);
            if (!hash)
                return std::unexpected(hash.error());
            return std::optional<Hash32>(*hash);
        }

        Result<RequestId> request_arg(const json &args)
        {
            return Hash32::from_hex(args.at("request_id").get<std::string>());
        }

        Result<std::vector<Address>> address_list(const json &args, const char *key)
        {
            std::vector<Address> out;
            if (!args.contains(key))
                return out;
            for (const auto &item : args.at(key))
            {
                auto a = Address::from_hex(item.get<std::string>());
                if (!a)
                    return std::unexpected(a.error());
                out.push_back(*a);
            }
            return out;
        }

        Bytes text_bytes(const std::string &s)
        {
            return Bytes(s.begin(), s.end());
        }

        // JSON floats and out-of-range integers are refused rather than truncated or wrapped
        Result<int64_t> signed_arg(const json &value, const char *key)
        {
            if (!value.is_number_integer())
                return std::unexpected(RegistryError::invalid_input(std::format("{} must be an integer", key)));
            if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return std::unexpected(RegistryError(ErrorCode::ScoreOutOfRange, std::format("{} is out of range", key)));
            return value.get<int64_t>();
        }

        Result<uint8_t> small_unsigned_arg(const json &value, const char *key)
        {
            if (!value.is_number_integer())
                return std::unexpected(RegistryError::invalid_input(std::format("{} must be an integer", key)));
            if (!value.is_number_unsigned() || value.get<uint64_t>() > 255)
                return std::unexpected(RegistryError(ErrorCode::ScoreOutOfRange, std::format("{} is out of range", key)));
            return static_cast<uint8_t>(value.get<uint64_t>());
        }

        Result<std::optional<uint8_t>> outcome_arg(const json &args)
        {
            if (!args.contains("outcome") || args.at("outcome").is_null())
                return std::optional<uint8_t>{};
            auto value = small_unsigned_arg(args.at("outcome"), "outcome");
            if (!value)
                return std::unexpected(value.error());
            return std::optional<uint8_t>(*value);
        }

        json id_list(const std::vector<RequestId> &ids)
        {
            json out = json::array();
            for (const auto &id : ids)
                out.push_back(id.to_hex());
            return out;
        }

        json address_list_json(const std::vector<Address> &addresses)
        {
            json out = json::array();
            for (const auto &a : addresses)
                out.push_back(a.to_hex());
            return out;
        }
    } // namespace

    json error_to_json(const RegistryError &error)
    {
        return {{"code", error_code_to_string(error.code)}, {"message", error.what()}};
    }

    Dispatcher::Dispatcher(RegistrySuite &suite)
        : suite_(suite)
    {
        register_identity_ops();
        register_reputation_ops();
        register_validation_ops();
        register_incident_ops();
    }

    std::vector<std::string> Dispatcher::operations() const
    {
        std::vector<std::string> names;
        for (const auto &[name, handler] : handlers_)
            names.push_back(name);
        return names;
    }

    json Dispatcher::apply(const json &operation)
    {
        std::string name;
        if (operation.is_object() && operation.contains("op") && operation.at("op").is_string())
            name = operation.at("op").get<std::string>();
        auto result = dispatch(operation);
        if (!result)
        {
            spdlog::debug("dispatch: {} rejected: {}", name, result.error().what());
            return {{"op", name}, {"ok", false}, {"error", error_to_json(result.error())}};
        }
        return {{"op", name}, {"ok", true}, {"result", *result}};
    }

    Result<json> Dispatcher::dispatch(const json &operation)
    {
        try
        {
            if (!operation.is_object())
                return std::unexpected(RegistryError::parsing("operation must be a JSON object"));
            auto name = operation.at("op").get<std::string>();
            auto it = handlers_.find(name);
            if (it == handlers_.end())
                return std::unexpected(RegistryError::invalid_input(std::format("unknown operation: {}", name)));

            CallContext ctx;
            auto sender = operation.value("sender", std::string());
            if (!sender.empty())
            {
                auto parsed = Address::from_hex(sender);
                if (!parsed)
                    return std::unexpected(parsed.error());
                ctx.sender = *parsed;
            }
            ctx.timestamp = operation.value("timestamp", uint64_t{0});

            const json args = operation.contains("args") ? operation.at("args") : json::object();
            return it->second(ctx, args);
        }
        catch (const json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(std::format("malformed operation: {}", e.what())));
        }
    }

    Result<json> Dispatcher::run_script(const json &script)
    {
        const json *ops = &script;
        if (script.is_object() && script.contains("operations"))
            ops = &script.at("operations");
        if (!ops->is_array())
            return std::unexpected(RegistryError::parsing("script must be an array of operations"));

        const uint64_t first = suite_.events().size();
        json results = json::array();
        for (const auto &op : *ops)
            results.push_back(apply(op));

        json events = json::array();
        for (const auto &event : suite_.events().since(first))
            events.push_back(event.to_json());

        auto head = suite_.events().head();
        return json{{"results", results},
                    {"events", events},
                    {"head", head ? json(*head) : json(nullptr)}};
    }

    // ========================================================================
    // Identity
    // ========================================================================

    void Dispatcher::register_identity_ops()
    {
        auto &identity = suite_.identity();

        handlers_["register"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            std::vector<MetadataEntry> metadata;
            if (args.contains("metadata"))
            {
                for (const auto &[key, value] : args.at("metadata").items())
                    metadata.push_back({key, text_bytes(value.get<std::string>())});
            }
            auto uri_hash = hash_arg(args, "uri_hash");
            if (!uri_hash)
                return std::unexpected(uri_hash.error());
            return encode(identity.register_agent(ctx, args.value("uri", std::string()), *uri_hash, metadata),
                          [](AgentId id) { return json{{"agent_id", id}}; });
        };

        handlers_["set_uri"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto uri_hash = hash_arg(args, "uri_hash");
            if (!uri_hash)
                return std::unexpected(uri_hash.error());
            return done(identity.set_agent_uri(ctx, args.at("agent_id").get<AgentId>(),
                                               args.value("uri", std::string()), *uri_hash));
        };

        handlers_["set_metadata"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            return done(identity.set_metadata(ctx, args.at("agent_id").get<AgentId>(),
                                              args.at("key").get<std::string>(),
                                              text_bytes(args.value("value", std::string()))));
        };

        handlers_["set_metadata_batch"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto keys = args.at("keys").get<std::vector<std::string>>();
            std::vector<Bytes> values;
            for (const auto &v : args.at("values"))
                values.push_back(text_bytes(v.get<std::string>()));
            return done(identity.set_metadata_batch(ctx, args.at("agent_id").get<AgentId>(), keys, values));
        };

        handlers_["get_metadata"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.get_metadata(args.at("agent_id").get<AgentId>(), args.at("key").get<std::string>()),
                          [](const Bytes &value) { return json{{"value", hex::encode(value)}}; });
        };

        handlers_["delegation_request"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            auto wallet = address_arg(args, "wallet");
            if (!wallet)
                return std::unexpected(wallet.error());
            return encode(identity.delegation_request(args.at("agent_id").get<AgentId>(), *wallet,
                                                      args.at("deadline").get<uint64_t>()),
                          [](const DelegationRequest &req) { return req.to_json(); });
        };

        handlers_["set_wallet"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto wallet = address_arg(args, "wallet");
            if (!wallet)
                return std::unexpected(wallet.error());
            auto proof = DelegationProof::from_json(args.at("proof"));
            if (!proof)
                return std::unexpected(proof.error());
            return done(identity.set_agent_wallet(ctx, args.at("agent_id").get<AgentId>(), *wallet,
                                                  args.at("deadline").get<uint64_t>(), *proof));
        };

        handlers_["unset_wallet"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            return done(identity.unset_agent_wallet(ctx, args.at("agent_id").get<AgentId>()));
        };

        handlers_["deactivate"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            return done(identity.deactivate(ctx, args.at("agent_id").get<AgentId>()));
        };

        handlers_["reactivate"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            return done(identity.reactivate(ctx, args.at("agent_id").get<AgentId>()));
        };

        handlers_["approve"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto to = address_arg(args, "to");
            if (!to)
                return std::unexpected(to.error());
            return done(identity.approve(ctx, *to, args.at("agent_id").get<AgentId>()));
        };

        handlers_["set_approval_for_all"] = [&identity](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto op = address_arg(args, "operator");
            if (!op)
                return std::unexpected(op.error());
            return done(identity.set_approval_for_all(ctx, *op, args.at("approved").get<bool>()));
        };

        auto transfer = [&identity](bool safe)
        {
            return [&identity, safe](const CallContext &ctx, const json &args) -> Result<json>
            {
                auto from = address_arg(args, "from");
                if (!from)
                    return std::unexpected(from.error());
                auto to = address_arg(args, "to");
                if (!to)
                    return std::unexpected(to.error());
                const auto id = args.at("agent_id").get<AgentId>();
                if (safe)
                    return done(identity.safe_transfer_from(ctx, *from, *to, id));
                return done(identity.transfer_from(ctx, *from, *to, id));
            };
        };
        handlers_["transfer"] = transfer(false);
        handlers_["safe_transfer"] = transfer(true);

        handlers_["get_agent"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.agent(args.at("agent_id").get<AgentId>()),
                          [](const Agent &agent) { return agent.to_json(); });
        };

        handlers_["owner_of"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.owner_of(args.at("agent_id").get<AgentId>()),
                          [](const Address &owner) { return json{{"owner", owner.to_hex()}}; });
        };

        handlers_["agent_wallet"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.agent_wallet(args.at("agent_id").get<AgentId>()),
                          [](const Address &wallet) { return json{{"wallet", wallet.to_hex()}}; });
        };

        handlers_["balance_of"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            auto owner = address_arg(args, "owner");
            if (!owner)
                return std::unexpected(owner.error());
            return encode(identity.balance_of(*owner), [](uint64_t n) { return json{{"balance", n}}; });
        };

        handlers_["agents_of"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            auto owner = address_arg(args, "owner");
            if (!owner)
                return std::unexpected(owner.error());
            return json(identity.agents_of(*owner));
        };

        handlers_["is_active"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.is_active(args.at("agent_id").get<AgentId>()),
                          [](bool active) { return json{{"active", active}}; });
        };

        handlers_["wallet_nonce"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.wallet_nonce(args.at("agent_id").get<AgentId>()),
                          [](uint64_t nonce) { return json{{"nonce", nonce}}; });
        };

        handlers_["get_approved"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            return encode(identity.get_approved(args.at("agent_id").get<AgentId>()),
                          [](const Address &approved) { return json{{"approved", approved.to_hex()}}; });
        };

        handlers_["is_approved_for_all"] = [&identity](const CallContext &, const json &args) -> Result<json>
        {
            auto owner = address_arg(args, "owner");
            if (!owner)
                return std::unexpected(owner.error());
            auto op = address_arg(args, "operator");
            if (!op)
                return std::unexpected(op.error());
            return json{{"approved", identity.is_approved_for_all(*owner, *op)}};
        };
    }

    // ========================================================================
    // Reputation
    // ========================================================================

    void Dispatcher::register_reputation_ops()
    {
        auto &reputation = suite_.reputation();

        handlers_["give_feedback"] = [&reputation](const CallContext &ctx, const json &args) -> Result<json>
        {
            FeedbackInput input;
            input.text = args.value("text", std::string());
            auto sentiment = sentiment_from_string(args.value("sentiment", std::string("Neutral")));
            if (!sentiment)
                return std::unexpected(sentiment.error());
            input.sentiment = *sentiment;
            if (args.contains("score") && !args.at("score").is_null())
            {
                const auto &score = args.at("score");
                auto value = signed_arg(score.at("value"), "score value");
                if (!value)
                    return std::unexpected(value.error());
                uint8_t decimals = 0;
                if (score.contains("decimals"))
                {
                    auto parsed = small_unsigned_arg(score.at("decimals"), "score decimals");
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    decimals = *parsed;
                }
                input.score = Score{*value, decimals};
            }
            input.tag1 = args.value("tag1", std::string());
            input.tag2 = args.value("tag2", std::string());
            input.endpoint = args.value("endpoint", std::string());
            input.feedback_uri = args.value("feedback_uri", std::string());
            auto hash = hash_arg(args, "feedback_hash");
            if (!hash)
                return std::unexpected(hash.error());
            input.feedback_hash = *hash;
            return encode(reputation.give_feedback(ctx, args.at("agent_id").get<AgentId>(), input),
                          [](uint64_t index) { return json{{"index", index}}; });
        };

        handlers_["revoke_feedback"] = [&reputation](const CallContext &ctx, const json &args) -> Result<json>
        {
            return done(reputation.revoke_feedback(ctx, args.at("agent_id").get<AgentId>(),
                                                   args.at("index").get<uint64_t>()));
        };

        handlers_["append_response"] = [&reputation](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto hash = hash_arg(args, "hash");
            if (!hash)
                return std::unexpected(hash.error());
            return encode(reputation.append_response(ctx, args.at("agent_id").get<AgentId>(),
                                                     args.at("index").get<uint64_t>(),
                                                     args.value("text", std::string()),
                                                     args.value("uri", std::string()), *hash),
                          [](uint64_t length) { return json{{"responses", length}}; });
        };

        handlers_["get_feedback"] = [&reputation](const CallContext &, const json &args) -> Result<json>
        {
            return encode(reputation.get_feedback(args.at("agent_id").get<AgentId>(), args.at("index").get<uint64_t>()),
                          [](const Feedback &fb) { return fb.to_json(); });
        };

        handlers_["get_authors"] = [&reputation](const CallContext &, const json &args) -> Result<json>
        {
            return encode(reputation.get_authors(args.at("agent_id").get<AgentId>()),
                          [](const std::vector<Address> &authors) { return address_list_json(authors); });
        };

        handlers_["feedback_count"] = [&reputation](const CallContext &, const json &args) -> Result<json>
        {
            return encode(reputation.feedback_count(args.at("agent_id").get<AgentId>()),
                          [](uint64_t count) { return json{{"count", count}}; });
        };

        handlers_["get_responses"] = [&reputation](const CallContext &, const json &args) -> Result<json>
        {
            return encode(reputation.get_responses(args.at("agent_id").get<AgentId>(), args.at("index").get<uint64_t>()),
                          [](const std::vector<FeedbackResponse> &responses)
                          {
                              json out = json::array();
                              for (const auto &r : responses)
                                  out.push_back(r.to_json());
                              return out;
                          });
        };

        handlers_["author_feedback"] = [&reputation](const CallContext &, const json &args) -> Result<json>
        {
            auto author = address_arg(args, "author");
            if (!author)
                return std::unexpected(author.error());
            return encode(reputation.author_feedback(args.at("agent_id").get<AgentId>(), *author),
                          [](const std::vector<uint64_t> &indices) { return json(indices); });
        };

        auto filter_of = [](const json &args) -> Result<FeedbackFilter>
        {
            auto authors = address_list(args, "authors");
            if (!authors)
                return std::unexpected(authors.error());
            FeedbackFilter filter;
            filter.authors = *authors;
            filter.tag1 = args.value("tag1", std::string());
            filter.tag2 = args.value("tag2", std::string());
            return filter;
        };

        handlers_["reputation_summary"] = [&reputation, filter_of](const CallContext &, const json &args) -> Result<json>
        {
            auto filter = filter_of(args);
            if (!filter)
                return std::unexpected(filter.error());
            return encode(reputation.get_summary(args.at("agent_id").get<AgentId>(), *filter),
                          [](const ReputationSummary &s) { return s.to_json(); });
        };

        handlers_["read_feedback"] = [&reputation, filter_of](const CallContext &, const json &args) -> Result<json>
        {
            auto filter = filter_of(args);
            if (!filter)
                return std::unexpected(filter.error());
            return encode(reputation.read_matching(args.at("agent_id").get<AgentId>(), *filter,
                                                   args.value("include_revoked", false)),
                          [](const std::vector<uint64_t> &indices) { return json(indices); });
        };
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void Dispatcher::register_validation_ops()
    {
        auto &validation = suite_.validation();

        handlers_["request_validation"] = [&validation](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto validator = address_arg(args, "validator");
            if (!validator)
                return std::unexpected(validator.error());
            auto hash = hash_arg(args, "content_hash");
            if (!hash)
                return std::unexpected(hash.error());
            return encode(validation.request_validation(ctx, *validator, args.at("agent_id").get<AgentId>(),
                                                        args.value("request_uri", std::string()), *hash),
                          [](const RequestId &id) { return json{{"request_id", id.to_hex()}}; });
        };

        auto decide = [&validation](bool complete)
        {
            return [&validation, complete](const CallContext &ctx, const json &args) -> Result<json>
            {
                auto id = request_arg(args);
                if (!id)
                    return std::unexpected(id.error());
                auto outcome = outcome_arg(args);
                if (!outcome)
                    return std::unexpected(outcome.error());
                auto hash = hash_arg(args, "response_hash");
                if (!hash)
                    return std::unexpected(hash.error());
                ValidationResponse response{*outcome, args.value("response_uri", std::string()), *hash,
                                            args.value("tag", std::string())};
                return done(complete ? validation.complete(ctx, *id, response) : validation.reject(ctx, *id, response));
            };
        };
        handlers_["complete_validation"] = decide(true);
        handlers_["reject_validation"] = decide(false);

        handlers_["cancel_validation"] = [&validation](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto id = request_arg(args);
            if (!id)
                return std::unexpected(id.error());
            return done(validation.cancel(ctx, *id));
        };

        handlers_["get_validation"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto id = request_arg(args);
            if (!id)
                return std::unexpected(id.error());
            return encode(validation.get_request(*id), [](const ValidationRequest &r) { return r.to_json(); });
        };

        handlers_["agent_validations"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            return encode(validation.agent_requests(args.at("agent_id").get<AgentId>()),
                          [](const std::vector<RequestId> &ids) { return id_list(ids); });
        };

        handlers_["get_status"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto id = request_arg(args);
            if (!id)
                return std::unexpected(id.error());
            return encode(validation.get_status(*id),
                          [](ValidationStatus status) { return json{{"status", validation_status_to_string(status)}}; });
        };

        handlers_["request_exists"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto id = request_arg(args);
            if (!id)
                return std::unexpected(id.error());
            return json{{"exists", validation.request_exists(*id)}};
        };

        handlers_["validator_requests"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto validator = address_arg(args, "validator");
            if (!validator)
                return std::unexpected(validator.error());
            return id_list(validation.validator_requests(*validator));
        };

        handlers_["requester_requests"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto requester = address_arg(args, "requester");
            if (!requester)
                return std::unexpected(requester.error());
            return json{{"requests", id_list(validation.requester_requests(*requester))},
                        {"sequence", validation.requester_sequence(*requester)}};
        };

        handlers_["validation_summary"] = [&validation](const CallContext &, const json &args) -> Result<json>
        {
            auto validators = address_list(args, "validators");
            if (!validators)
                return std::unexpected(validators.error());
            ValidationFilter filter{*validators, args.value("tag", std::string())};
            return encode(validation.get_summary(args.at("agent_id").get<AgentId>(), filter),
                          [](const ValidationSummary &s) { return s.to_json(); });
        };
    }

    // ========================================================================
    // Incident
    // ========================================================================

    void Dispatcher::register_incident_ops()
    {
        auto &incidents = suite_.incidents();

        handlers_["report_incident"] = [&incidents](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto hash = hash_arg(args, "report_hash");
            if (!hash)
                return std::unexpected(hash.error());
            return encode(incidents.report(ctx, args.at("agent_id").get<AgentId>(),
                                           args.value("report_uri", std::string()), *hash,
                                           args.value("category", std::string())),
                          [](IncidentId id) { return json{{"incident_id", id}}; });
        };

        handlers_["respond_incident"] = [&incidents](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto hash = hash_arg(args, "response_hash");
            if (!hash)
                return std::unexpected(hash.error());
            return done(incidents.respond(ctx, args.at("incident_id").get<IncidentId>(),
                                          args.value("response_uri", std::string()), *hash));
        };

        handlers_["resolve_incident"] = [&incidents](const CallContext &ctx, const json &args) -> Result<json>
        {
            auto code = resolution_code_from_string(args.at("resolution").get<std::string>());
            if (!code)
                return std::unexpected(code.error());
            return done(incidents.resolve(ctx, args.at("incident_id").get<IncidentId>(), *code));
        };

        handlers_["get_incident"] = [&incidents](const CallContext &, const json &args) -> Result<json>
        {
            return encode(incidents.get_incident(args.at("incident_id").get<IncidentId>()),
                          [](const Incident &incident) { return incident.to_json(); });
        };

        handlers_["agent_incidents"] = [&incidents](const CallContext &, const json &args) -> Result<json>
        {
            return encode(incidents.agent_incidents(args.at("agent_id").get<AgentId>()),
                          [](const std::vector<IncidentId> &ids) { return json(ids); });
        };

        handlers_["reporter_incidents"] = [&incidents](const CallContext &, const json &args) -> Result<json>
        {
            auto reporter = address_arg(args, "reporter");
            if (!reporter)
                return std::unexpected(reporter.error());
            return json(incidents.reporter_incidents(*reporter));
        };

        handlers_["incident_count"] = [&incidents](const CallContext &, const json &args) -> Result<json>
        {
            return encode(incidents.incident_count(args.at("agent_id").get<AgentId>()),
                          [](uint64_t count) { return json{{"count", count}}; });
        };

        handlers_["incident_summary"] = [&incidents](const CallContext &, const json &args) -> Result<json>
        {
            return encode(incidents.get_summary(args.at("agent_id").get<AgentId>()),
                          [](const IncidentSummary &s) { return s.to_json(); });
        };
    }

} // namespace agentreg
