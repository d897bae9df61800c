#include "token/TokenValidator.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

std::string TokenValidator::expectedToken(const std::string& fileIdentity,
                                          const std::string& userIdentity,
                                          const std::string& versionIdentity)
{
    std::string message = userIdentity + '\n' + versionIdentity;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    HMAC(EVP_sha256(),
         fileIdentity.data(), static_cast<int>(fileIdentity.size()),
         reinterpret_cast<const unsigned char*>(message.data()),
         message.size(), digest, &digestLen);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; i++) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    out.resize(tokenLength);
    return out;
}

TokenValidator::Result TokenValidator::validate(
    const std::string& presented,
    const std::string& fileIdentity,
    const std::string& userIdentity,
    const std::string& versionIdentity)
{
    if (presented.empty()) return Result::Invalid;

    std::string expected = expectedToken(fileIdentity, userIdentity,
                                         versionIdentity);

    // Composite inter-tool token: "-{callerToken}-{targetToken}".
    // The target part follows the last '-' (expected tokens are hex).
    if (presented.front() == '-') {
        auto sep = presented.rfind('-');
        if (sep == 0) return Result::Invalid;
        std::string target = presented.substr(sep + 1);
        return constantTimeEquals(target, expected) ? Result::Valid
                                                     : Result::Invalid;
    }

    return constantTimeEquals(presented, expected) ? Result::Valid
                                                    : Result::Invalid;
}

std::string TokenValidator::callerPart(const std::string& presented) {
    if (presented.empty() || presented.front() != '-') return "";
    auto sep = presented.rfind('-');
    if (sep == 0) return "";
    return presented.substr(1, sep - 1);
}

bool TokenValidator::constantTimeEquals(const std::string& a,
                                        const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
