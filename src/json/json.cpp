#include "mcpc/json/json.hpp"

#include <simdjson.h>

#include <format>

namespace mcpc {

namespace {

Result<Json> convert(simdjson::dom::element element, std::size_t depth) {
    if (depth > kMaxJsonDepth) {
        return tl::unexpected(Error::protocol(
            std::format("JSON nesting exceeds {} levels", kMaxJsonDepth)));
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            Json out = Json::object();
            for (auto field : simdjson::dom::object(element)) {
                auto value = convert(field.value, depth + 1);
                if (value.has_value() == false) {
                    return value;
                }
                out[std::string(field.key)] = std::move(*value);
            }
            return out;
        }
        case simdjson::dom::element_type::ARRAY: {
            Json out = Json::array();
            for (auto item : simdjson::dom::array(element)) {
                auto value = convert(item, depth + 1);
                if (value.has_value() == false) {
                    return value;
                }
                out.push_back(std::move(*value));
            }
            return out;
        }
        case simdjson::dom::element_type::STRING:
            return Json(std::string(std::string_view(element)));
        case simdjson::dom::element_type::INT64:
            return Json(std::int64_t(element));
        case simdjson::dom::element_type::UINT64:
            return Json(std::uint64_t(element));
        case simdjson::dom::element_type::DOUBLE:
            return Json(double(element));
        case simdjson::dom::element_type::BOOL:
            return Json(bool(element));
        case simdjson::dom::element_type::NULL_VALUE:
            return Json(nullptr);
    }
    return tl::unexpected(Error::protocol("Unsupported JSON value"));
}

}  // namespace

Result<Json> parse_json(std::string_view text) {
    // One parser per thread: dom::parser reuses its buffers between documents.
    thread_local simdjson::dom::parser parser;

    simdjson::dom::element root;
    const auto error = parser.parse(text.data(), text.size()).get(root);
    if (error != simdjson::SUCCESS) {
        return tl::unexpected(
            Error::protocol(std::format("Invalid JSON: {}", simdjson::error_message(error)))
                .with_evidence(excerpt(text)));
    }
    return convert(root, 0);
}

bool looks_like_json_object(std::string_view text) noexcept {
    const auto start = text.find_first_not_of(" \t\r\n");
    return start != std::string_view::npos && text[start] == '{';
}

std::string excerpt(std::string_view text, std::size_t limit) {
    if (text.size() <= limit) {
        return std::string(text);
    }
    std::string out(text.substr(0, limit));
    out += "...";
    return out;
}

}  // namespace mcpc
