#include "application/OutputRouter.hpp"

#include "domain/Errors.hpp"
#include <iostream>

namespace eda::application {

OutputRouter::OutputRouter(ports::output::ICore& core,
                           std::shared_ptr<ports::output::IEventCodec> codec,
                           ports::output::IEventPublisher* publisher)
    : core_(core)
    , codec_(std::move(codec))
    , publisher_(publisher)
{}

OutputRouter::Result OutputRouter::route(const domain::Event& event) {
    std::string envelope;
    try {
        envelope = codec_->encode(event);
    } catch (const std::exception& e) {
        throw domain::RoutingError("output event encoding failed: " + std::string(e.what()));
    }

    domain::OutputDestination destination;
    try {
        destination = core_.getOutputDestination(envelope);
    } catch (const std::exception& e) {
        throw domain::RoutingError("output destination lookup failed: " + std::string(e.what()));
    }

    if (!domain::isKnownDestinationType(static_cast<uint32_t>(destination.type))) {
        throw domain::RoutingError("unrecognized destination type: " + domain::toString(destination.type));
    }

    switch (destination.type) {
        case domain::DestinationType::BROKER:
            break;

        case domain::DestinationType::DISCARD:
            std::cout << "[OutputRouter] Discarded output event"
                      << " event_id=" << event.id
                      << " event_type=" << event.type << std::endl;
            return Result::DISCARDED;

        case domain::DestinationType::QUEUE:
        case domain::DestinationType::HTTP:
            std::cerr << "[OutputRouter] Destination type not supported, dropping"
                      << " destination_type=" << domain::toString(destination.type)
                      << " target=" << destination.target
                      << " event_id=" << event.id << std::endl;
            return Result::UNSUPPORTED;
    }

    if (!publisher_) {
        throw domain::RoutingError("no publisher available for target " + destination.target);
    }

    try {
        publisher_->publish(destination.target, event.id, envelope, destination.cluster);
    } catch (const std::exception& e) {
        throw domain::RoutingError("publish to " + destination.target + " failed: " + e.what());
    }

    std::cout << "[OutputRouter] Published output event"
              << " event_id=" << event.id
              << " event_type=" << event.type
              << " target=" << destination.target;
    if (destination.cluster) {
        std::cout << " cluster=" << *destination.cluster;
    }
    std::cout << std::endl;
    return Result::PUBLISHED;
}

} // namespace eda::application
