#include "hubagent/update/metadata.hpp"

namespace hubagent {

namespace {

std::string HeaderValue(const hub::Headers& headers, const char* name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
}

void GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = it->get<std::string>();
}

} // namespace

UpdateMetadata UpdateMetadata::FromHeaders(const hub::Headers& headers) {
    return UpdateMetadata{
        .version = HeaderValue(headers, kHeaderBinaryVersion),
        .digest = HeaderValue(headers, kHeaderBinaryDigest),
        .signature = HeaderValue(headers, kHeaderBinarySignature),
    };
}

void to_json(nlohmann::json& j, const UpdateMetadata& m) {
    j = nlohmann::json{{"version", m.version}, {"digest", m.digest}, {"signature", m.signature}};
}

void from_json(const nlohmann::json& j, UpdateMetadata& m) {
    m = UpdateMetadata{};
    GetStringIfPresent(j, "version", m.version);
    GetStringIfPresent(j, "digest", m.digest);
    GetStringIfPresent(j, "signature", m.signature);
}

} // namespace hubagent
