/*
 * C ABI бэкенда решений (Core).
 *
 * Загружается NativeLibraryCore через dlopen. Всё, что библиотека
 * выделяет, освобождает вызывающая сторона соответствующей eda_free_*.
 */
#ifndef EDA_CORE_H
#define EDA_CORE_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define EDA_CORE_ABI_VERSION 1u

#if defined(__GNUC__)
#define EDA_CORE_EXPORT __attribute__((visibility("default")))
#else
#define EDA_CORE_EXPORT
#endif

/* Значения dest_type: 0 broker, 1 queue, 2 http, 3 discard */
typedef struct EdaOutputDestination {
    uint32_t dest_type;
    char* target;
    char* cluster; /* NULL, если не задан */
} EdaOutputDestination;

EDA_CORE_EXPORT uint32_t eda_core_abi_version(void);

/* NULL при ошибке, см. eda_last_error() */
EDA_CORE_EXPORT char* eda_get_broker(void);
EDA_CORE_EXPORT char* eda_get_topic(void);
EDA_CORE_EXPORT char* eda_get_group(void);
EDA_CORE_EXPORT void eda_free_string(char* value);

/* 1 - повторять, 0 - нет, -1 - ошибка */
EDA_CORE_EXPORT int32_t eda_should_retry(const char* error, uint32_t attempt);

/* 0 - успех (значение в out_ms), -1 - ошибка */
EDA_CORE_EXPORT int32_t eda_calculate_backoff(uint32_t attempt, uint64_t* out_ms);

/* NULL при ошибке */
EDA_CORE_EXPORT EdaOutputDestination* eda_get_output_destination(const char* event_json);
EDA_CORE_EXPORT void eda_free_output_destination(EdaOutputDestination* destination);

EDA_CORE_EXPORT bool eda_load_routing_config(const char* path);

/* Последняя ошибка в текущем потоке; строкой владеет библиотека */
EDA_CORE_EXPORT const char* eda_last_error(void);

#ifdef __cplusplus
}
#endif

#endif /* EDA_CORE_H */
