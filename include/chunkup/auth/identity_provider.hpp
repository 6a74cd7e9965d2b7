#pragma once

#include "chunkup/core/result.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace chunkup::auth {

/**
 * @brief Resolves a bearer token to the owner id it authenticates
 */
class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;

    /// @retval ErrorCode::Unauthorized unknown or empty token
    virtual Result<std::string> authenticate(const std::string& bearer_token) const = 0;
};

/**
 * @brief Fixed token table loaded once from a JSON file
 *
 * File format, token to owner id:
 * @code
 * { "tokens": { "3f9c...": "user-1", "a71e...": "user-2" } }
 * @endcode
 * A bare top-level object of the same shape is accepted as well.
 */
class TokenFileIdentityProvider : public IdentityProvider {
public:
    explicit TokenFileIdentityProvider(std::unordered_map<std::string, std::string> tokens);

    /// @retval ErrorCode::Validation unreadable file, bad JSON, or empty token/owner
    static Result<std::unique_ptr<TokenFileIdentityProvider>> load(const std::string& path);

    Result<std::string> authenticate(const std::string& bearer_token) const override;

    std::size_t size() const { return tokens_.size(); }

private:
    std::unordered_map<std::string, std::string> tokens_;
};

} // namespace chunkup::auth
