#pragma once

#include <cstdint>
#include <string>

namespace eda::domain {

/**
 * @brief Неудачная попытка обработки, передаваемая в Core
 *
 * Создаётся на каждый сбой handler'а и отбрасывается
 * после получения решения.
 */
struct RetryAttempt {
    std::string errorMessage;
    uint32_t attemptNumber = 1;  ///< Нумерация с 1
};

} // namespace eda::domain
