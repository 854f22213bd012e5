#include "ffi/eda_core.h"

#include "adapters/secondary/core/InProcessCore.hpp"
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

namespace {

thread_local std::string g_lastError;

eda::adapters::secondary::InProcessCore& core() {
    static std::once_flag once;
    static std::unique_ptr<eda::adapters::secondary::InProcessCore> instance;
    std::call_once(once, []() {
        instance = std::make_unique<eda::adapters::secondary::InProcessCore>(
            std::make_shared<eda::settings::ConnectionSettings>());
    });
    return *instance;
}

char* duplicate(const std::string& value) {
    char* copy = static_cast<char*>(std::malloc(value.size() + 1));
    if (!copy) {
        g_lastError = "out of memory";
        return nullptr;
    }
    std::memcpy(copy, value.c_str(), value.size() + 1);
    return copy;
}

void setError(const std::exception& e) {
    g_lastError = e.what();
}

} // namespace

extern "C" {

uint32_t eda_core_abi_version(void) {
    return EDA_CORE_ABI_VERSION;
}

char* eda_get_broker(void) {
    try {
        return duplicate(core().getConnectionConfig().broker);
    } catch (const std::exception& e) {
        setError(e);
        return nullptr;
    }
}

char* eda_get_topic(void) {
    try {
        return duplicate(core().getConnectionConfig().topic);
    } catch (const std::exception& e) {
        setError(e);
        return nullptr;
    }
}

char* eda_get_group(void) {
    try {
        return duplicate(core().getConnectionConfig().group);
    } catch (const std::exception& e) {
        setError(e);
        return nullptr;
    }
}

void eda_free_string(char* value) {
    std::free(value);
}

int32_t eda_should_retry(const char* error, uint32_t attempt) {
    try {
        return core().shouldRetry(error ? error : "", attempt) ? 1 : 0;
    } catch (const std::exception& e) {
        setError(e);
        return -1;
    }
}

int32_t eda_calculate_backoff(uint32_t attempt, uint64_t* out_ms) {
    if (!out_ms) {
        g_lastError = "out_ms must not be NULL";
        return -1;
    }
    try {
        *out_ms = core().calculateBackoff(attempt);
        return 0;
    } catch (const std::exception& e) {
        setError(e);
        return -1;
    }
}

EdaOutputDestination* eda_get_output_destination(const char* event_json) {
    if (!event_json) {
        g_lastError = "event_json must not be NULL";
        return nullptr;
    }
    try {
        auto destination = core().getOutputDestination(event_json);

        auto* result = static_cast<EdaOutputDestination*>(std::calloc(1, sizeof(EdaOutputDestination)));
        if (!result) {
            g_lastError = "out of memory";
            return nullptr;
        }
        result->dest_type = static_cast<uint32_t>(destination.type);
        result->target = duplicate(destination.target);
        if (destination.cluster) {
            result->cluster = duplicate(*destination.cluster);
        }
        return result;
    } catch (const std::exception& e) {
        setError(e);
        return nullptr;
    }
}

void eda_free_output_destination(EdaOutputDestination* destination) {
    if (!destination) {
        return;
    }
    std::free(destination->target);
    std::free(destination->cluster);
    std::free(destination);
}

bool eda_load_routing_config(const char* path) {
    if (!path) {
        g_lastError = "path must not be NULL";
        return false;
    }
    try {
        core().loadRoutingConfig(path);
        return true;
    } catch (const std::exception& e) {
        setError(e);
        return false;
    }
}

const char* eda_last_error(void) {
    return g_lastError.c_str();
}

} // extern "C"
