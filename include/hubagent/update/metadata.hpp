#pragma once

#include "hubagent/hub/http.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace hubagent {

inline constexpr const char* kHeaderBinaryVersion = "X-Binary-Version";
inline constexpr const char* kHeaderBinaryDigest = "X-Binary-Digest";
inline constexpr const char* kHeaderBinarySignature = "X-Binary-Signature";

// Integrity metadata published by the hub next to every binary.
struct UpdateMetadata {
    std::string version;
    std::string digest;    // hex SHA-256 of the binary
    std::string signature; // standard base64, DER ECDSA over the raw digest

    static UpdateMetadata FromHeaders(const hub::Headers& headers);
};

void to_json(nlohmann::json& j, const UpdateMetadata& m);
// Missing keys stay empty; a non-string value throws nlohmann::json::type_error.
void from_json(const nlohmann::json& j, UpdateMetadata& m);

} // namespace hubagent
