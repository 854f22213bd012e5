#include "domain/routing/Filter.hpp"

#include <stdexcept>

namespace eda::domain::routing {

namespace {

void requireAttributes(const std::map<std::string, std::string>& attributes, const char* dialect) {
    if (attributes.empty()) {
        throw std::invalid_argument(std::string(dialect) + " filter requires at least one attribute");
    }
}

void requireFilters(const std::vector<FilterPtr>& filters, const char* dialect) {
    if (filters.empty()) {
        throw std::invalid_argument(std::string(dialect) + " filter requires at least one nested filter");
    }
    for (const auto& filter : filters) {
        if (!filter) {
            throw std::invalid_argument(std::string(dialect) + " filter contains a null filter");
        }
    }
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <typename Predicate>
bool allAttributes(const Event& event,
                   const std::map<std::string, std::string>& attributes,
                   Predicate predicate) {
    for (const auto& [name, expected] : attributes) {
        auto actual = event.attribute(name);
        if (!actual || !predicate(*actual, expected)) {
            return false;
        }
    }
    return true;
}

} // namespace

ExactFilter::ExactFilter(std::map<std::string, std::string> attributes)
    : attributes_(std::move(attributes))
{
    requireAttributes(attributes_, "exact");
}

bool ExactFilter::matches(const Event& event) const {
    return allAttributes(event, attributes_,
                         [](const std::string& actual, const std::string& expected) {
                             return actual == expected;
                         });
}

PrefixFilter::PrefixFilter(std::map<std::string, std::string> attributes)
    : attributes_(std::move(attributes))
{
    requireAttributes(attributes_, "prefix");
}

bool PrefixFilter::matches(const Event& event) const {
    return allAttributes(event, attributes_, startsWith);
}

SuffixFilter::SuffixFilter(std::map<std::string, std::string> attributes)
    : attributes_(std::move(attributes))
{
    requireAttributes(attributes_, "suffix");
}

bool SuffixFilter::matches(const Event& event) const {
    return allAttributes(event, attributes_, endsWith);
}

AllFilter::AllFilter(std::vector<FilterPtr> filters)
    : filters_(std::move(filters))
{
    requireFilters(filters_, "all");
}

bool AllFilter::matches(const Event& event) const {
    for (const auto& filter : filters_) {
        if (!filter->matches(event)) {
            return false;
        }
    }
    return true;
}

AnyFilter::AnyFilter(std::vector<FilterPtr> filters)
    : filters_(std::move(filters))
{
    requireFilters(filters_, "any");
}

bool AnyFilter::matches(const Event& event) const {
    for (const auto& filter : filters_) {
        if (filter->matches(event)) {
            return true;
        }
    }
    return false;
}

NotFilter::NotFilter(FilterPtr filter)
    : filter_(std::move(filter))
{
    if (!filter_) {
        throw std::invalid_argument("not filter requires a nested filter");
    }
}

bool NotFilter::matches(const Event& event) const {
    return !filter_->matches(event);
}

SqlFilter::SqlFilter(const std::string& expression)
    : expression_(SqlExpression::parse(expression))
{}

bool SqlFilter::matches(const Event& event) const {
    return expression_.evaluate(event);
}

} // namespace eda::domain::routing
