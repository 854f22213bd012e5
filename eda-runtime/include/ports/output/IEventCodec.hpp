#pragma once

#include "domain/BrokerMessage.hpp"
#include "domain/Event.hpp"
#include <string>

namespace eda::ports::output {

/**
 * @brief Кодек конверта события
 */
class IEventCodec {
public:
    virtual ~IEventCodec() = default;

    /**
     * @throws domain::DecodeError если сообщение не является CloudEvent
     */
    virtual domain::Event decode(const domain::BrokerMessage& message) const = 0;

    /**
     * @brief Канонический JSON конверта (structured mode)
     */
    virtual std::string encode(const domain::Event& event) const = 0;
};

} // namespace eda::ports::output
