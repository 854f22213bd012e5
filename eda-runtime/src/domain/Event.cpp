#include "domain/Event.hpp"

#include <stdexcept>

namespace eda::domain {

namespace {

const char* const kSupportedSpecVersion = "1.0";

std::string requireString(const nlohmann::json& json, const char* name) {
    auto it = json.find(name);
    if (it == json.end()) {
        throw std::invalid_argument(std::string("missing required attribute: ") + name);
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("attribute must be a string: ") + name);
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        throw std::invalid_argument(std::string("attribute must not be empty: ") + name);
    }
    return value;
}

std::optional<std::string> optionalString(const nlohmann::json& json, const char* name) {
    auto it = json.find(name);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("attribute must be a string: ") + name);
    }
    return it->get<std::string>();
}

// Расширения CloudEvents: string, integer, boolean
const nlohmann::json& extensionValue(const std::string& name, const nlohmann::json& value) {
    if (value.is_string() || value.is_boolean() || value.is_number_integer()) {
        return value;
    }
    throw std::invalid_argument("unsupported extension value type: " + name);
}

std::string extensionText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

bool isContextAttribute(const std::string& name) {
    return name == "id" || name == "type" || name == "source" || name == "specversion"
        || name == "time" || name == "datacontenttype" || name == "dataschema"
        || name == "subject" || name == "data" || name == "data_base64";
}

} // namespace

std::optional<std::string> Event::attribute(const std::string& name) const {
    if (name == "id") return id;
    if (name == "type") return type;
    if (name == "source") return source;
    if (name == "specversion") return specVersion;
    if (name == "time") return time;
    if (name == "datacontenttype") return dataContentType;
    if (name == "dataschema") return dataSchema;
    if (name == "subject") return subject;

    auto it = extensions.find(name);
    if (it != extensions.end()) {
        return extensionText(it->second);
    }
    return std::nullopt;
}

nlohmann::json Event::toJson() const {
    nlohmann::json json;
    json["specversion"] = specVersion;
    json["id"] = id;
    json["type"] = type;
    json["source"] = source;

    if (time) json["time"] = *time;
    if (dataContentType) json["datacontenttype"] = *dataContentType;
    if (dataSchema) json["dataschema"] = *dataSchema;
    if (subject) json["subject"] = *subject;

    for (const auto& [name, value] : extensions) {
        json[name] = value;
    }

    if (data) {
        json["data"] = *data;
    } else if (dataBase64) {
        json["data_base64"] = *dataBase64;
    }
    return json;
}

Event Event::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("CloudEvent envelope must be a JSON object");
    }

    Event event;
    event.id = requireString(json, "id");
    event.type = requireString(json, "type");
    event.source = requireString(json, "source");

    if (auto version = optionalString(json, "specversion")) {
        if (*version != kSupportedSpecVersion) {
            throw std::invalid_argument("unsupported specversion: " + *version);
        }
        event.specVersion = *version;
    }

    event.time = optionalString(json, "time");
    event.dataContentType = optionalString(json, "datacontenttype");
    event.dataSchema = optionalString(json, "dataschema");
    event.subject = optionalString(json, "subject");

    auto data = json.find("data");
    auto dataBase64 = json.find("data_base64");
    if (data != json.end() && dataBase64 != json.end()) {
        throw std::invalid_argument("data and data_base64 are mutually exclusive");
    }
    if (data != json.end() && !data->is_null()) {
        event.data = *data;
    }
    if (dataBase64 != json.end()) {
        event.dataBase64 = optionalString(json, "data_base64");
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (isContextAttribute(it.key()) || it->is_null()) {
            continue;
        }
        event.extensions[it.key()] = extensionValue(it.key(), it.value());
    }
    return event;
}

} // namespace eda::domain
