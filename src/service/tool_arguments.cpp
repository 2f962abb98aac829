#include "mcpc/service/tool_arguments.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace mcpc {

namespace {

bool is_required(const Json& schema, const std::string& name) {
    const auto it = schema.find("required");
    if (it == schema.end() || it->is_array() == false) {
        return false;
    }
    return std::ranges::any_of(*it, [&name](const Json& entry) {
        return entry.is_string() && entry.get_ref<const std::string&>() == name;
    });
}

bool declared_as_array(const Json& schema, const std::string& name) {
    const auto properties = schema.find("properties");
    if (properties == schema.end() || properties->is_object() == false) {
        return false;
    }
    const auto property = properties->find(name);
    if (property == properties->end() || property->is_object() == false) {
        return false;
    }
    const auto type = property->find("type");
    return type != property->end() && type->is_string() && *type == "array";
}

}  // namespace

Json shape_tool_arguments(const Json& input_schema, Json arguments) {
    if (arguments.is_object() == false || input_schema.is_object() == false) {
        return arguments;
    }

    std::vector<std::string> omitted;
    for (auto& [name, value] : arguments.items()) {
        const bool empty_array = value.is_array() && value.empty();
        const bool null_array = value.is_null() && declared_as_array(input_schema, name);
        if (empty_array == false && null_array == false) {
            continue;
        }
        if (is_required(input_schema, name)) {
            value = Json::array();
        } else {
            omitted.push_back(name);
        }
    }

    for (const auto& name : omitted) {
        arguments.erase(name);
    }
    return arguments;
}

}  // namespace mcpc
