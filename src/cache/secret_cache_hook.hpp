#pragma once

#include "api/secrets_backend.hpp"

namespace secretcache {

/**
 * Hook into the in-memory store
 *
 * put() transforms a freshly fetched object before it is stored; get()
 * transforms the stored object back when it is read (e.g. encrypt/decrypt
 * secret payloads held in memory). Both default to the identity, so a hook
 * only overrides the object kinds it cares about.
 *
 * Hooks run while the entry lock is held: keep them fast and never call
 * back into the cache from them.
 */
class SecretCacheHook {
public:
    virtual ~SecretCacheHook() = default;

    virtual SecretMetadata put(SecretMetadata metadata) { return metadata; }
    virtual SecretMetadata get(const SecretMetadata& cached) { return cached; }

    virtual SecretValue put(SecretValue value) { return value; }
    virtual SecretValue get(const SecretValue& cached) { return cached; }
};

} // namespace secretcache
