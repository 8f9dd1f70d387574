#include "Heuristic.hpp"
#include "Logger.hpp"

void Heuristic::apply(Response & response) {
    http::fields updated = updateHeaders(response);
    if (updated.begin() == updated.end()) {
        return;
    }

    for (const auto & field : updated) {
        response.getHeaders().set(field.name_string(), field.value());
    }
    std::optional<std::string> text = warning(response);
    if (text) {
        response.getHeaders().set(http::field::warning, *text);
    }
    Logger::getInstance().debug("heuristic updated response headers");
}
