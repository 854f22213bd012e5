#pragma once

#include "domain/Errors.hpp"
#include "ports/output/IEventCodec.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <string>

namespace eda::adapters::secondary {

/**
 * @brief Кодек CloudEvents v1.0 для JSON
 *
 * decode():
 * - binary mode: атрибуты в заголовках ce_* (или cloudEvents:*),
 *   тело - data с типом из content-type;
 * - structured mode: тело - JSON-конверт;
 * - иначе, если включён rawMessageFallback, тело оборачивается в событие
 *   type=broker.message, source=broker, id=ключ сообщения.
 *
 * encode() всегда выдаёт structured mode.
 */
class CloudEventJsonCodec : public ports::output::IEventCodec {
public:
    static constexpr const char* RAW_MESSAGE_TYPE = "broker.message";
    static constexpr const char* RAW_MESSAGE_SOURCE = "broker";

    explicit CloudEventJsonCodec(bool rawMessageFallback = false)
        : rawMessageFallback_(rawMessageFallback)
    {}

    domain::Event decode(const domain::BrokerMessage& message) const override {
        if (isBinaryMode(message)) {
            return decodeBinary(message);
        }

        nlohmann::json json = nlohmann::json::parse(message.body, nullptr, false);
        if (!json.is_discarded() && json.is_object()) {
            try {
                return domain::Event::fromJson(json);
            } catch (const std::exception& e) {
                if (!rawMessageFallback_) {
                    throw domain::DecodeError(std::string("invalid CloudEvent: ") + e.what());
                }
            }
        } else if (!rawMessageFallback_) {
            throw domain::DecodeError("message body is not a JSON object");
        }

        return wrapRaw(message, json);
    }

    std::string encode(const domain::Event& event) const override {
        return event.toJson().dump();
    }

    bool rawMessageFallback() const { return rawMessageFallback_; }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }

    /**
     * @brief Имя атрибута CloudEvent из заголовка или пустая строка
     */
    static std::string attributeName(const std::string& header) {
        std::string name = lower(header);
        if (name.rfind("ce_", 0) == 0) return name.substr(3);
        if (name.rfind("cloudevents:", 0) == 0) return name.substr(12);
        return "";
    }

    static bool isBinaryMode(const domain::BrokerMessage& message) {
        for (const auto& [header, value] : message.headers) {
            if (attributeName(header) == "specversion") {
                return true;
            }
        }
        return false;
    }

    static domain::Event decodeBinary(const domain::BrokerMessage& message) {
        nlohmann::json envelope = nlohmann::json::object();
        std::string contentType;

        for (const auto& [header, value] : message.headers) {
            std::string name = attributeName(header);
            if (!name.empty()) {
                envelope[name] = value;
            } else if (lower(header) == "content-type" || lower(header) == "content_type") {
                contentType = value;
            }
        }

        if (!contentType.empty()) {
            envelope["datacontenttype"] = contentType;
        }

        if (!message.body.empty()) {
            bool isJson = contentType.empty() || contentType.find("json") != std::string::npos;
            nlohmann::json data = isJson
                ? nlohmann::json::parse(message.body, nullptr, false)
                : nlohmann::json(message.body);
            if (data.is_discarded()) {
                data = message.body;
            }
            envelope["data"] = data;
        }

        try {
            return domain::Event::fromJson(envelope);
        } catch (const std::exception& e) {
            throw domain::DecodeError(std::string("invalid binary-mode CloudEvent: ") + e.what());
        }
    }

    static domain::Event wrapRaw(const domain::BrokerMessage& message, const nlohmann::json& parsed) {
        std::string id = message.key.empty() ? utils::UuidGenerator::generate() : message.key;
        domain::Event event(id, RAW_MESSAGE_TYPE, RAW_MESSAGE_SOURCE);
        if (!parsed.is_discarded()) {
            event.data = parsed;
            event.dataContentType = "application/json";
        } else {
            event.data = message.body;
            event.dataContentType = "text/plain";
        }
        if (!message.topic.empty()) {
            event.subject = message.topic;
        }
        return event;
    }

    bool rawMessageFallback_;
};

} // namespace eda::adapters::secondary
