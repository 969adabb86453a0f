/**
 * Example service start-up using the secret cache
 *
 * Reads a JSON config with "cache" and "backend" sections, then resolves a
 * secret a few times to show that only the first read reaches the backend.
 *
 * Build:
 *   cmake -S . -B build && cmake --build build --target cached_secret_usage
 *
 * Run:
 *   export SECRETS_ENDPOINT="http://localhost:2773"
 *   ./build/cached_secret_usage config.json db-password
 *
 * config.json:
 *   {
 *     "cache": {"max_cache_size": 64, "secret_refresh_interval": 600},
 *     "backend": {"endpoint": "${SECRETS_ENDPOINT}", "timeout_ms": 5000}
 *   }
 */

#include "api/http_secrets_backend.hpp"
#include "client/secret_cache.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <memory>

using namespace secretcache;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <secret-id> [version-stage]\n";
        return 1;
    }

    const std::string config_path = argv[1];
    const std::string secret_id = argv[2];
    const std::string version_stage = argc > 3 ? argv[3] : "";

    LoggerConfig log_config;
    log_config.enable_json = false;
    Logger::get_instance().configure(log_config);

    try {
        CacheConfig cache_config = parse_cache_config_from_file(config_path);
        HttpBackendConfig backend_config = parse_http_backend_config_from_file(config_path);

        auto backend = std::make_shared<HttpSecretsBackend>(backend_config);
        SecretCache cache(cache_config, backend);

        for (int i = 0; i < 3; ++i) {
            std::optional<SecretValue> value = cache.get_secret_value(secret_id, version_stage);
            if (!value) {
                std::cout << "No version of '" << secret_id << "' carries the requested stage\n";
                return 2;
            }

            // Never print the payload itself
            if (value->secret_string) {
                std::cout << "Resolved " << secret_id << " (" << value->version_id << "): "
                          << value->secret_string->size() << " characters\n";
            } else if (value->secret_binary) {
                std::cout << "Resolved " << secret_id << " (" << value->version_id << "): "
                          << value->secret_binary->size() << " bytes\n";
            }
        }

        CacheStats stats = cache.get_cache_stats();
        std::cout << "Cache stats: " << stats.hits << " hits, "
                  << stats.misses << " misses, "
                  << stats.entries_count << " entries\n";

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const BackendError& e) {
        std::cerr << "Failed to resolve " << secret_id << ": " << e.what() << "\n";
        return 1;
    }

    return 0;
}
