#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Parameter table of the `user` tool. Callers see only a single `input`
// object in the tool listing; this is the schema that applies inside it.
class ToolSchema {
public:
    enum class ParamType { String, Integer, Number, Boolean, Object };

    struct Param {
        std::string              name;
        ParamType                type;
        std::string              description;
        nlohmann::json           defaultValue;   // null = no default
        std::vector<std::string> allowed;        // enum values, empty = any
    };

    struct ValidationResult {
        bool           valid = false;
        nlohmann::json params;          // input plus defaults
        std::string    error;
        bool           withDocs = false; // mistake shows the caller lacks the docs
    };

    static constexpr const char* toolName = "user";

    static const std::vector<Param>& parameters();
    static std::vector<std::string> operationNames();

    // Unexpected names, missing required, type and enum checks.
    // readme needs only `operation`; everything else also needs the token.
    static ValidationResult validate(const nlohmann::json& input);

    // Full schema; the token description embeds the current token
    static nlohmann::json toJson(const std::string& token);

    // Single-`input` schema advertised in the tool listing
    static nlohmann::json listingParameters();

    static const char* typeName(ParamType t);
};
