#pragma once

#include "domain/Event.hpp"
#include <functional>
#include <optional>
#include <type_traits>
#include <variant>

namespace eda::ports::input {

/**
 * @brief Обработчик без выходного события
 *
 * Завершился - событие обработано (Ack).
 * Выбросил исключение - Failure(what()).
 */
using SimpleHandler = std::function<void(const domain::Event&)>;

/**
 * @brief Обработчик, который может вернуть производное событие
 *
 * Вернул событие - AckWithOutput, вернул std::nullopt - Ack.
 */
using OutputHandler = std::function<std::optional<domain::Event>(const domain::Event&)>;

/**
 * @brief Закрытое множество форм пользовательского handler'а
 */
using Handler = std::variant<SimpleHandler, OutputHandler>;

namespace detail {

template <typename F, typename = void>
struct HandlerShape {
    static constexpr bool simple = false;
    static constexpr bool output = false;
};

template <typename F>
struct HandlerShape<F, std::enable_if_t<std::is_invocable_v<F&, const domain::Event&>>> {
    using Result = std::invoke_result_t<F&, const domain::Event&>;

    static constexpr bool simple = std::is_void_v<Result>;
    static constexpr bool output = std::is_same_v<std::decay_t<Result>, std::optional<domain::Event>>;
};

} // namespace detail

/**
 * @brief Определить форму callable по типу результата
 *
 * Callable другой формы не компилируется.
 *
 * @example
 * ```cpp
 * auto handler = makeHandler([](const domain::Event& e) {
 *     std::cout << e.id << std::endl;
 * });
 * // std::holds_alternative<SimpleHandler>(handler) == true
 * ```
 */
template <typename F>
Handler makeHandler(F&& f) {
    using Shape = detail::HandlerShape<std::decay_t<F>>;
    static_assert(Shape::simple || Shape::output,
                  "handler must be void(const Event&) or std::optional<Event>(const Event&)");

    if constexpr (Shape::simple) {
        return Handler(std::in_place_type<SimpleHandler>, std::forward<F>(f));
    } else {
        return Handler(std::in_place_type<OutputHandler>, std::forward<F>(f));
    }
}

} // namespace eda::ports::input
