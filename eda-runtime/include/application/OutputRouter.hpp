#pragma once

#include "domain/Event.hpp"
#include "ports/output/ICore.hpp"
#include "ports/output/IEventCodec.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <memory>

namespace eda::application {

/**
 * @brief Маршрутизатор выходных событий
 *
 * Сериализует событие, спрашивает у Core приёмник и
 * выполняет публикацию (или осознанный сброс).
 *
 * @example
 * ```cpp
 * OutputRouter router(core, codec, publisher.get());
 * auto result = router.route(outputEvent);  // PUBLISHED / DISCARDED / UNSUPPORTED
 * ```
 */
class OutputRouter {
public:
    enum class Result {
        PUBLISHED,
        DISCARDED,
        UNSUPPORTED
    };

    /**
     * @param publisher Может быть nullptr, если публиковать некуда
     */
    OutputRouter(ports::output::ICore& core,
                 std::shared_ptr<ports::output::IEventCodec> codec,
                 ports::output::IEventPublisher* publisher);

    /**
     * @throws domain::RoutingError если событие не удалось доставить
     */
    Result route(const domain::Event& event);

private:
    ports::output::ICore& core_;
    std::shared_ptr<ports::output::IEventCodec> codec_;
    ports::output::IEventPublisher* publisher_;
};

} // namespace eda::application
