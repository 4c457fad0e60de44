#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace agentreg::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS)
     *
     * Deterministic serialization used wherever bytes are signed or hashed:
     * delegation proofs and the event hash chain.
     *
     * - Lexicographic key sorting (UTF-8 byte order)
     * - No insignificant whitespace
     * - Minimal string escaping, \u00XX for remaining control characters
     * - Shortest round-trip number formatting
     */
    class Canonicalizer
    {
    public:
        static std::string canonicalize(const nlohmann::json &value);

        /** Canonical form as raw bytes, ready to sign or hash */
        static Bytes canonical_bytes(const nlohmann::json &value);

        static Result<std::string> canonicalize_string(const std::string &json_str);

    private:
        static void write_value(const nlohmann::json &value, std::string &out);
        static void write_string(const std::string &str, std::string &out);
        static void write_number(const nlohmann::json &num, std::string &out);
        static void write_object(const nlohmann::json &obj, std::string &out);
        static void write_array(const nlohmann::json &arr, std::string &out);
    };

} // namespace agentreg::json
