#pragma once

#include "ffi/eda_core.h"
#include "ports/output/ICore.hpp"
#include <string>

namespace eda::adapters::secondary {

/**
 * @brief Core поверх разделяемой библиотеки с C ABI (ffi/eda_core.h)
 *
 * Библиотека открывается в конструкторе, закрывается в close().
 * Каждая строка и структура, выделенная библиотекой, освобождается
 * через eda_free_* сразу после копирования.
 *
 * @example
 * ```cpp
 * auto core = std::make_unique<NativeLibraryCore>("/opt/eda/libeda_core.so");
 * auto config = core->getConnectionConfig();
 * ```
 */
class NativeLibraryCore : public ports::output::ICore {
public:
    /**
     * @throws domain::CoreError если библиотеку не удалось загрузить,
     *         нет символа или не совпадает версия ABI
     */
    explicit NativeLibraryCore(std::string path);
    ~NativeLibraryCore() override;

    NativeLibraryCore(const NativeLibraryCore&) = delete;
    NativeLibraryCore& operator=(const NativeLibraryCore&) = delete;

    domain::ConnectionConfig getConnectionConfig() override;
    bool shouldRetry(const std::string& errorMessage, uint32_t attempt) override;
    uint64_t calculateBackoff(uint32_t attempt) override;
    domain::OutputDestination getOutputDestination(const std::string& eventJson) override;
    void loadRoutingConfig(const std::string& path) override;
    void close() override;

    const std::string& path() const { return path_; }
    bool isLoaded() const { return handle_ != nullptr; }

private:
    struct Api {
        uint32_t (*abiVersion)();
        char* (*getBroker)();
        char* (*getTopic)();
        char* (*getGroup)();
        void (*freeString)(char*);
        int32_t (*shouldRetry)(const char*, uint32_t);
        int32_t (*calculateBackoff)(uint32_t, uint64_t*);
        EdaOutputDestination* (*getOutputDestination)(const char*);
        void (*freeOutputDestination)(EdaOutputDestination*);
        bool (*loadRoutingConfig)(const char*);
        const char* (*lastError)();
    };

    template <typename Fn>
    void resolve(Fn& target, const char* symbol);

    std::string takeString(char* raw, const char* what);
    std::string lastError() const;
    void ensureLoaded(const char* operation) const;

    std::string path_;
    void* handle_ = nullptr;
    Api api_{};
};

} // namespace eda::adapters::secondary
