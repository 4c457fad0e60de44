#include "agentreg/canonical_json.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace agentreg::json
{

    std::string Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string out;
        write_value(value, out);
        return out;
    }

    Bytes Canonicalizer::canonical_bytes(const nlohmann::json &value)
    {
        auto text = canonicalize(value);
        return Bytes(text.begin(), text.end());
    }

    Result<std::string> Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        try
        {
            return canonicalize(nlohmann::json::parse(json_str));
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(std::format("JSON parse error: {}", e.what())));
        }
    }

    void Canonicalizer::write_value(const nlohmann::json &value, std::string &out)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::boolean:
            out += value.get<bool>() ? "true" : "false";
            break;

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            write_number(value, out);
            break;

        case nlohmann::json::value_t::string:
            write_string(value.get_ref<const std::string &>(), out);
            break;

        case nlohmann::json::value_t::array:
            write_array(value, out);
            break;

        case nlohmann::json::value_t::object:
            write_object(value, out);
            break;

        default:
            // null, discarded and binary values all canonicalize to null
            out += "null";
            break;
        }
    }

    void Canonicalizer::write_string(const std::string &str, std::string &out)
    {
        out += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    out += std::format("\\u{:04x}", static_cast<int>(ch));
                }
                else
                {
                    out += static_cast<char>(ch);
                }
                break;
            }
        }
        out += '"';
    }

    void Canonicalizer::write_number(const nlohmann::json &num, std::string &out)
    {
        if (num.is_number_unsigned())
        {
            out += std::to_string(num.get<uint64_t>());
            return;
        }
        if (num.is_number_integer())
        {
            out += std::to_string(num.get<int64_t>());
            return;
        }

        double value = num.get<double>();
        if (!std::isfinite(value))
        {
            out += "null";
            return;
        }
        if (value == 0.0)
        {
            out += "0";
            return;
        }

        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        if (ec != std::errc())
        {
            out += "null";
            return;
        }
        out.append(buf, end);
    }

    void Canonicalizer::write_object(const nlohmann::json &obj, std::string &out)
    {
        std::vector<const std::string *> keys;
        keys.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
            keys.push_back(&it.key());
        std::sort(keys.begin(), keys.end(), [](const std::string *a, const std::string *b) { return *a < *b; });

        out += '{';
        for (std::size_t i = 0; i < keys.size(); ++i)
        {
            if (i != 0)
                out += ',';
            write_string(*keys[i], out);
            out += ':';
            write_value(obj.at(*keys[i]), out);
        }
        out += '}';
    }

    void Canonicalizer::write_array(const nlohmann::json &arr, std::string &out)
    {
        out += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
                out += ',';
            first = false;
            write_value(item, out);
        }
        out += ']';
    }

} // namespace agentreg::json
