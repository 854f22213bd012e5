#pragma once

#include <map>
#include <string>

namespace eda::domain {

/**
 * @brief Сырое сообщение брокера до декодирования
 */
struct BrokerMessage {
    std::string topic;
    std::string key;
    std::string body;
    std::map<std::string, std::string> headers;
};

} // namespace eda::domain
