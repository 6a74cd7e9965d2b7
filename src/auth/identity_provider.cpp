#include "chunkup/auth/identity_provider.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace chunkup::auth {

using json = nlohmann::json;

TokenFileIdentityProvider::TokenFileIdentityProvider(std::unordered_map<std::string, std::string> tokens)
    : tokens_(std::move(tokens)) {
}

Result<std::unique_ptr<TokenFileIdentityProvider>> TokenFileIdentityProvider::load(const std::string& path) {
    using ResultType = std::unique_ptr<TokenFileIdentityProvider>;

    std::ifstream input(path);
    if (!input) {
        return Err<ResultType>(Error::validation("Cannot open tokens file: " + path));
    }
    std::stringstream contents;
    contents << input.rdbuf();

    auto document = json::parse(contents.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<ResultType>(Error::validation("Tokens file is not a JSON object: " + path));
    }

    const json& table = document.contains("tokens") ? document["tokens"] : document;
    if (!table.is_object()) {
        return Err<ResultType>(Error::validation("\"tokens\" must be an object in " + path));
    }

    std::unordered_map<std::string, std::string> tokens;
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (it.key().empty() || !it.value().is_string() || it.value().get<std::string>().empty()) {
            return Err<ResultType>(Error::validation(
                "Tokens file entries must map a non-empty token to a non-empty owner id: " + path));
        }
        tokens.emplace(it.key(), it.value().get<std::string>());
    }

    spdlog::info("Loaded {} API token(s) from {}", tokens.size(), path);
    return Ok(std::make_unique<TokenFileIdentityProvider>(std::move(tokens)));
}

Result<std::string> TokenFileIdentityProvider::authenticate(const std::string& bearer_token) const {
    if (bearer_token.empty()) {
        return Err<std::string>(Error::unauthorized("Missing bearer token"));
    }
    auto it = tokens_.find(bearer_token);
    if (it == tokens_.end()) {
        return Err<std::string>(Error::unauthorized("Invalid bearer token"));
    }
    return Ok(it->second);
}

} // namespace chunkup::auth
