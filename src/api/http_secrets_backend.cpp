#include "api/http_secrets_backend.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace secretcache {

namespace {

const char* const TARGET_DESCRIBE_SECRET = "secretsmanager.DescribeSecret";
const char* const TARGET_GET_SECRET_VALUE = "secretsmanager.GetSecretValue";
const char* const CONTENT_TYPE = "application/x-amz-json-1.1";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

HttpSecretsBackend::HttpSecretsBackend(const HttpBackendConfig& config)
    : http_client_(std::make_unique<HttpClient>(config.endpoint, config.timeout_ms))
    , headers_(config.headers)
{
    headers_["Content-Type"] = CONTENT_TYPE;
}

HttpSecretsBackend::~HttpSecretsBackend() = default;

std::string HttpSecretsBackend::call(
    const std::string& target,
    const std::string& body,
    const std::string& secret_id)
{
    std::map<std::string, std::string> headers = headers_;
    headers["X-Amz-Target"] = target;

    try {
        return http_client_->post("/", body, headers).body;
    } catch (const HttpClientError& e) {
        std::ostringstream oss;
        oss << target << " failed for '" << secret_id << "': " << e.what();
        throw BackendError(oss.str(), e.status_code());
    }
}

SecretMetadata HttpSecretsBackend::describe_secret(const std::string& secret_id) {
    json request = {
        {"SecretId", secret_id}
    };
    return parse_describe_response(call(TARGET_DESCRIBE_SECRET, request.dump(), secret_id));
}

SecretValue HttpSecretsBackend::get_secret_value(
    const std::string& secret_id,
    const std::string& version_id)
{
    json request = {
        {"SecretId", secret_id},
        {"VersionId", version_id}
    };
    return parse_secret_value_response(call(TARGET_GET_SECRET_VALUE, request.dump(), secret_id));
}

SecretMetadata HttpSecretsBackend::parse_describe_response(const std::string& body) {
    SecretMetadata metadata;

    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            throw BackendError("Invalid DescribeSecret response: not an object");
        }

        metadata.name = j.value("Name", "");

        // Missing VersionIdsToStages means no resolvable versions, not an error
        if (j.contains("VersionIdsToStages") && j["VersionIdsToStages"].is_object()) {
            for (auto& [version_id, stages] : j["VersionIdsToStages"].items()) {
                std::vector<std::string>& labels = metadata.version_ids_to_stages[version_id];
                for (const auto& stage : stages) {
                    labels.push_back(stage.get<std::string>());
                }
            }
        }

    } catch (const json::exception& e) {
        throw BackendError(std::string("Failed to parse DescribeSecret response: ") + e.what());
    }

    return metadata;
}

SecretValue HttpSecretsBackend::parse_secret_value_response(const std::string& body) {
    SecretValue value;

    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            throw BackendError("Invalid GetSecretValue response: not an object");
        }

        value.name = j.value("Name", "");
        value.version_id = j.value("VersionId", "");

        if (j.contains("VersionStages") && j["VersionStages"].is_array()) {
            for (const auto& stage : j["VersionStages"]) {
                value.version_stages.push_back(stage.get<std::string>());
            }
        }

        if (j.contains("SecretString") && j["SecretString"].is_string()) {
            value.secret_string = j["SecretString"].get<std::string>();
        }

        if (j.contains("SecretBinary") && j["SecretBinary"].is_string()) {
            value.secret_binary = decode_base64(j["SecretBinary"].get<std::string>());
        }

    } catch (const json::exception& e) {
        throw BackendError(std::string("Failed to parse GetSecretValue response: ") + e.what());
    }

    return value;
}

SecretBinary HttpSecretsBackend::decode_base64(const std::string& encoded) {
    SecretBinary decoded;
    decoded.reserve(encoded.size() * 3 / 4);

    unsigned int buffer = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=') {
            break;
        }
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') {
            continue;
        }

        int v = base64_value(c);
        if (v < 0) {
            throw BackendError(std::string("Invalid base64 character '") + c + "'");
        }

        buffer = (buffer << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    return decoded;
}

} // namespace secretcache
