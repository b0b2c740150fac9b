/// @file properties.cpp
/// @brief Package properties parsing

#include <nitro/pkg/properties.hpp>
#include <nlohmann/json.hpp>

namespace nitro_pkg {

namespace {

/// Read an optional list of strings
nitro_core::Result<std::optional<std::vector<std::string>>> parse_string_list(
    const nlohmann::json& j, const char* key) {

    if (!j.contains(key) || j[key].is_null()) {
        return nitro_core::Ok(std::optional<std::vector<std::string>>{});
    }
    if (!j[key].is_array()) {
        return nitro_core::Err<std::optional<std::vector<std::string>>>(
            nitro_core::ConfigError::invalid_field(key, "expected an array of strings"));
    }

    std::vector<std::string> out;
    out.reserve(j[key].size());
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return nitro_core::Err<std::optional<std::vector<std::string>>>(
                nitro_core::ConfigError::invalid_field(key, "expected an array of strings"));
        }
        out.push_back(item.get<std::string>());
    }

    return nitro_core::Ok(std::optional<std::vector<std::string>>(std::move(out)));
}

} // anonymous namespace

nitro_core::Result<PackageProperties> PackageProperties::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return nitro_core::Err<PackageProperties>(
            nitro_core::Error(nitro_core::ErrorCode::ParseError,
                std::string("JSON parse error in package properties: ") + e.what()));
    }

    if (!j.is_object()) {
        return nitro_core::Err<PackageProperties>(
            nitro_core::Error(nitro_core::ErrorCode::ParseError,
                "Package properties must be a JSON object"));
    }

    PackageProperties props;

    auto versions = parse_string_list(j, "content_versions");
    if (!versions) {
        return nitro_core::Err<PackageProperties>(versions.error());
    }
    props.content_versions = std::move(*versions);

    auto features = parse_string_list(j, "features");
    if (!features) {
        return nitro_core::Err<PackageProperties>(features.error());
    }
    props.features = std::move(*features);

    auto default_features = parse_string_list(j, "default_features");
    if (!default_features) {
        return nitro_core::Err<PackageProperties>(default_features.error());
    }
    props.default_features = std::move(*default_features);

    return nitro_core::Ok(std::move(props));
}

} // namespace nitro_pkg
