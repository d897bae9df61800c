#pragma once
#include <string>

// Identity triple the unlock token is derived from.
struct ToolIdentity {
    std::string fileIdentity;     // installation-specific (settings store id)
    std::string userIdentity;     // OS account running the bridge
    std::string versionIdentity;  // tool code version
};

// Stateless capability-token check.
// Tokens are never stored: the expected token is recomputed from the
// identity triple on every call.
class TokenValidator {
public:
    enum class Result { Valid, Invalid };

    static constexpr size_t tokenLength = 24;   // hex chars

    // Expected direct token: HMAC-SHA256(key = file identity,
    // msg = user identity '\n' version identity), lowercase hex, truncated.
    static std::string expectedToken(const std::string& fileIdentity,
                                     const std::string& userIdentity,
                                     const std::string& versionIdentity);

    static std::string expectedToken(const ToolIdentity& id) {
        return expectedToken(id.fileIdentity, id.userIdentity,
                             id.versionIdentity);
    }

    // Accepts the direct token, or a composite "-{caller}-{target}" token
    // whose target part is the direct token. The caller part is opaque.
    static Result validate(const std::string& presented,
                           const std::string& fileIdentity,
                           const std::string& userIdentity,
                           const std::string& versionIdentity);

    static Result validate(const std::string& presented,
                           const ToolIdentity& id) {
        return validate(presented, id.fileIdentity, id.userIdentity,
                        id.versionIdentity);
    }

    // Caller half of a composite token, empty for direct tokens.
    static std::string callerPart(const std::string& presented);

private:
    static bool constantTimeEquals(const std::string& a, const std::string& b);
};
