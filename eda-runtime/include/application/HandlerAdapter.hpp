#pragma once

#include "domain/Errors.hpp"
#include "domain/Event.hpp"
#include "domain/HandlerOutcome.hpp"
#include "ports/input/Handler.hpp"
#include <string>

namespace eda::application {

/**
 * @brief Единая точка вызова пользовательского handler'а
 *
 * Форма handler'а определяется один раз при создании.
 * Исключение handler'а превращается в HandlerOutcome::failure,
 * наружу не выходит.
 */
class HandlerAdapter {
public:
    enum class Shape {
        SIMPLE,
        OUTPUT
    };

    /**
     * @throws domain::ConfigurationError если handler пуст
     */
    explicit HandlerAdapter(ports::input::Handler handler)
        : handler_(std::move(handler))
    {
        if (auto simple = std::get_if<ports::input::SimpleHandler>(&handler_)) {
            shape_ = Shape::SIMPLE;
            if (!*simple) {
                throw domain::ConfigurationError("handler must not be empty");
            }
        } else {
            shape_ = Shape::OUTPUT;
            if (!std::get<ports::input::OutputHandler>(handler_)) {
                throw domain::ConfigurationError("handler must not be empty");
            }
        }
    }

    Shape shape() const { return shape_; }

    bool producesOutput() const { return shape_ == Shape::OUTPUT; }

    /**
     * @brief Вызвать handler на копии события
     */
    domain::HandlerOutcome invoke(const domain::Event& event) const {
        domain::Event copy = event;
        try {
            if (shape_ == Shape::SIMPLE) {
                std::get<ports::input::SimpleHandler>(handler_)(copy);
                return domain::HandlerOutcome::ack();
            }

            auto output = std::get<ports::input::OutputHandler>(handler_)(copy);
            if (output) {
                return domain::HandlerOutcome::withOutput(std::move(*output));
            }
            return domain::HandlerOutcome::ack();
        } catch (const std::exception& e) {
            return domain::HandlerOutcome::failure(e.what());
        } catch (...) {
            return domain::HandlerOutcome::failure("unknown handler error");
        }
    }

private:
    ports::input::Handler handler_;
    Shape shape_;
};

inline std::string toString(HandlerAdapter::Shape shape) {
    return shape == HandlerAdapter::Shape::SIMPLE ? "simple" : "output";
}

} // namespace eda::application
