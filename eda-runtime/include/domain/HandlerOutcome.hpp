#pragma once

#include "domain/Event.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace eda::domain {

/**
 * @brief Результат вызова пользовательского handler'а
 *
 * Размеченное объединение:
 * - ACK - событие обработано, выходного события нет
 * - ACK_WITH_OUTPUT - handler вернул ровно одно производное событие
 * - FAILURE - handler завершился ошибкой
 */
class HandlerOutcome {
public:
    enum class Kind {
        ACK,
        ACK_WITH_OUTPUT,
        FAILURE
    };

    static HandlerOutcome ack() {
        return HandlerOutcome(Kind::ACK, std::nullopt, "");
    }

    static HandlerOutcome withOutput(Event output) {
        return HandlerOutcome(Kind::ACK_WITH_OUTPUT, std::move(output), "");
    }

    static HandlerOutcome failure(std::string error) {
        return HandlerOutcome(Kind::FAILURE, std::nullopt, std::move(error));
    }

    Kind kind() const { return kind_; }

    bool isAck() const { return kind_ == Kind::ACK; }
    bool hasOutput() const { return kind_ == Kind::ACK_WITH_OUTPUT; }
    bool isFailure() const { return kind_ == Kind::FAILURE; }

    const Event& output() const {
        if (!output_) {
            throw std::logic_error("HandlerOutcome has no output event");
        }
        return *output_;
    }

    const std::string& error() const { return error_; }

private:
    HandlerOutcome(Kind kind, std::optional<Event> output, std::string error)
        : kind_(kind)
        , output_(std::move(output))
        , error_(std::move(error))
    {}

    Kind kind_;
    std::optional<Event> output_;
    std::string error_;
};

} // namespace eda::domain
