#include "adapters/secondary/core/NativeLibraryCore.hpp"

#include "domain/Errors.hpp"
#include <dlfcn.h>
#include <iostream>
#include <memory>

namespace eda::adapters::secondary {

using domain::CoreError;

NativeLibraryCore::NativeLibraryCore(std::string path)
    : path_(std::move(path))
{
    if (path_.empty()) {
        throw CoreError("native core library path is empty");
    }

    handle_ = dlopen(path_.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_) {
        const char* error = dlerror();
        throw CoreError(std::string(error ? error : "dlopen failed") + ": " + path_);
    }

    try {
        resolve(api_.abiVersion, "eda_core_abi_version");
        resolve(api_.getBroker, "eda_get_broker");
        resolve(api_.getTopic, "eda_get_topic");
        resolve(api_.getGroup, "eda_get_group");
        resolve(api_.freeString, "eda_free_string");
        resolve(api_.shouldRetry, "eda_should_retry");
        resolve(api_.calculateBackoff, "eda_calculate_backoff");
        resolve(api_.getOutputDestination, "eda_get_output_destination");
        resolve(api_.freeOutputDestination, "eda_free_output_destination");
        resolve(api_.loadRoutingConfig, "eda_load_routing_config");
        resolve(api_.lastError, "eda_last_error");

        uint32_t version = api_.abiVersion();
        if (version != EDA_CORE_ABI_VERSION) {
            throw CoreError("unsupported core ABI version " + std::to_string(version)
                            + " (expected " + std::to_string(EDA_CORE_ABI_VERSION) + "): " + path_);
        }
    } catch (const CoreError&) {
        dlclose(handle_);
        handle_ = nullptr;
        throw;
    }

    std::cout << "[NativeLibraryCore] Loaded " << path_ << std::endl;
}

NativeLibraryCore::~NativeLibraryCore() {
    close();
}

template <typename Fn>
void NativeLibraryCore::resolve(Fn& target, const char* symbol) {
    dlerror();
    void* address = dlsym(handle_, symbol);
    if (!address) {
        throw CoreError(std::string("missing symbol ") + symbol + " in " + path_);
    }
    target = reinterpret_cast<Fn>(address);
}

domain::ConnectionConfig NativeLibraryCore::getConnectionConfig() {
    ensureLoaded("getConnectionConfig");
    std::string broker = takeString(api_.getBroker(), "broker");
    std::string topic = takeString(api_.getTopic(), "topic");
    std::string group = takeString(api_.getGroup(), "group");
    return domain::ConnectionConfig(std::move(broker), std::move(topic), std::move(group));
}

bool NativeLibraryCore::shouldRetry(const std::string& errorMessage, uint32_t attempt) {
    ensureLoaded("shouldRetry");
    int32_t result = api_.shouldRetry(errorMessage.c_str(), attempt);
    if (result < 0) {
        throw CoreError("eda_should_retry failed: " + lastError());
    }
    return result == 1;
}

uint64_t NativeLibraryCore::calculateBackoff(uint32_t attempt) {
    ensureLoaded("calculateBackoff");
    uint64_t backoffMs = 0;
    if (api_.calculateBackoff(attempt, &backoffMs) != 0) {
        throw CoreError("eda_calculate_backoff failed: " + lastError());
    }
    return backoffMs;
}

domain::OutputDestination NativeLibraryCore::getOutputDestination(const std::string& eventJson) {
    ensureLoaded("getOutputDestination");

    auto release = [this](EdaOutputDestination* d) { api_.freeOutputDestination(d); };
    std::unique_ptr<EdaOutputDestination, decltype(release)> raw(
        api_.getOutputDestination(eventJson.c_str()), release);
    if (!raw) {
        throw CoreError("eda_get_output_destination failed: " + lastError());
    }

    domain::OutputDestination destination;
    // Неизвестное значение пропускается дальше: его отвергает OutputRouter
    destination.type = static_cast<domain::DestinationType>(raw->dest_type);
    destination.target = raw->target ? raw->target : "";
    if (raw->cluster) {
        destination.cluster = std::string(raw->cluster);
    }
    return destination;
}

void NativeLibraryCore::loadRoutingConfig(const std::string& path) {
    ensureLoaded("loadRoutingConfig");
    if (!api_.loadRoutingConfig(path.c_str())) {
        throw CoreError("eda_load_routing_config failed: " + lastError());
    }
}

void NativeLibraryCore::close() {
    if (!handle_) {
        return;
    }
    if (dlclose(handle_) != 0) {
        const char* error = dlerror();
        std::cerr << "[NativeLibraryCore] dlclose failed: " << (error ? error : "unknown")
                  << " path=" << path_ << std::endl;
    }
    handle_ = nullptr;
    api_ = Api{};
    std::cout << "[NativeLibraryCore] Unloaded " << path_ << std::endl;
}

std::string NativeLibraryCore::takeString(char* raw, const char* what) {
    auto release = [this](char* s) { api_.freeString(s); };
    std::unique_ptr<char, decltype(release)> owned(raw, release);
    if (!owned) {
        throw CoreError(std::string("core returned no ") + what + ": " + lastError());
    }
    return std::string(owned.get());
}

std::string NativeLibraryCore::lastError() const {
    const char* error = api_.lastError ? api_.lastError() : nullptr;
    return error && *error ? error : "unknown error";
}

void NativeLibraryCore::ensureLoaded(const char* operation) const {
    if (!handle_) {
        throw CoreError(std::string("native core is closed: ") + operation);
    }
}

} // namespace eda::adapters::secondary
