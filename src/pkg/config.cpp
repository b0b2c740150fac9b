/// @file config.cpp
/// @brief Package configuration implementation

#include <nitro/pkg/config.hpp>
#include <nitro/pkg/eval_input.hpp>
#include <nitro/pkg/request.hpp>
#include <nitro/core/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace nitro_pkg {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

nitro_core::Result<std::vector<std::string>> parse_string_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) {
        return nitro_core::Ok(std::move(out));
    }
    if (!j[key].is_array()) {
        return nitro_core::Err<std::vector<std::string>>(
            nitro_core::ConfigError::invalid_field(key, "expected an array of strings"));
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return nitro_core::Err<std::vector<std::string>>(
                nitro_core::ConfigError::invalid_field(key, "expected an array of strings"));
        }
        out.push_back(item.get<std::string>());
    }
    return nitro_core::Ok(std::move(out));
}

/// Split a request string into its ID part and content version and validate the ID
nitro_core::Result<void> apply_request_text(PackageConfig& config, const std::string& text) {
    auto req = PackageRequest::parse(text, RequestSource::user_require());
    auto valid = validate_package_id(req.id);
    if (!valid) {
        return valid;
    }

    config.id = req.repository ? *req.repository + ":" + req.id : req.id;
    if (!req.content_version.is_any()) {
        config.content_version = req.content_version.to_string();
    }
    return nitro_core::Ok();
}

/// Parse a single package config entry
nitro_core::Result<PackageConfig> parse_package_config(const nlohmann::json& j,
                                                       PackageStability profile_stability) {
    PackageConfig config;
    config.stability = profile_stability;

    if (j.is_string()) {
        auto applied = apply_request_text(config, j.get<std::string>());
        if (!applied) {
            return nitro_core::Err<PackageConfig>(applied.error());
        }
        return nitro_core::Ok(std::move(config));
    }

    if (!j.is_object()) {
        return nitro_core::Err<PackageConfig>(
            nitro_core::ConfigError::invalid_field("packages", "expected a string or an object"));
    }

    if (!j.contains("id") || !j["id"].is_string()) {
        return nitro_core::Err<PackageConfig>(nitro_core::ConfigError::missing_field("id"));
    }
    auto applied = apply_request_text(config, j["id"].get<std::string>());
    if (!applied) {
        return nitro_core::Err<PackageConfig>(applied.error());
    }

    auto features = parse_string_array(j, "features");
    if (!features) {
        return nitro_core::Err<PackageConfig>(features.error().with_context("package", config.id));
    }
    config.features = std::move(*features);

    auto worlds = parse_string_array(j, "worlds");
    if (!worlds) {
        return nitro_core::Err<PackageConfig>(worlds.error().with_context("package", config.id));
    }
    config.worlds = std::move(*worlds);

    if (j.contains("use_default_features")) {
        if (!j["use_default_features"].is_boolean()) {
            return nitro_core::Err<PackageConfig>(
                nitro_core::Error(nitro_core::ConfigError::invalid_field("use_default_features", "expected a boolean"))
                    .with_context("package", config.id));
        }
        config.use_default_features = j["use_default_features"].get<bool>();
    }

    if (j.contains("optional")) {
        if (!j["optional"].is_boolean()) {
            return nitro_core::Err<PackageConfig>(
                nitro_core::Error(nitro_core::ConfigError::invalid_field("optional", "expected a boolean"))
                    .with_context("package", config.id));
        }
        config.optional = j["optional"].get<bool>();
    }

    if (j.contains("permissions")) {
        if (!j["permissions"].is_string() ||
            !eval_permissions_from_string(j["permissions"].get<std::string>(), config.permissions)) {
            return nitro_core::Err<PackageConfig>(
                nitro_core::Error(nitro_core::ConfigError::invalid_field(
                    "permissions", "expected one of restricted, standard, elevated"))
                    .with_context("package", config.id));
        }
    }

    if (j.contains("stability")) {
        if (!j["stability"].is_string() ||
            !package_stability_from_string(j["stability"].get<std::string>(), config.stability)) {
            return nitro_core::Err<PackageConfig>(
                nitro_core::Error(nitro_core::ConfigError::invalid_field(
                    "stability", "expected one of stable, latest"))
                    .with_context("package", config.id));
        }
    }

    if (j.contains("content_version")) {
        if (!j["content_version"].is_string()) {
            return nitro_core::Err<PackageConfig>(
                nitro_core::Error(nitro_core::ConfigError::invalid_field("content_version", "expected a string"))
                    .with_context("package", config.id));
        }
        config.content_version = j["content_version"].get<std::string>();
    }

    return nitro_core::Ok(std::move(config));
}

} // anonymous namespace

// =============================================================================
// PackageConfig Implementation
// =============================================================================

PackageConfig PackageConfig::from_id(std::string id) {
    PackageConfig config;
    config.id = std::move(id);
    return config;
}

nitro_core::Result<std::vector<std::string>> PackageConfig::calculate_features(
    const PackageProperties& properties) const {

    static const std::vector<std::string> empty;
    const auto& allowed = properties.features ? *properties.features : empty;

    for (const auto& feature : features) {
        if (std::find(allowed.begin(), allowed.end(), feature) == allowed.end()) {
            return nitro_core::Err<std::vector<std::string>>(
                nitro_core::ConfigError::unknown_feature(id, feature));
        }
    }

    std::vector<std::string> out = features;
    if (use_default_features && properties.default_features) {
        out.insert(out.end(), properties.default_features->begin(), properties.default_features->end());
    }

    return nitro_core::Ok(std::move(out));
}

ArcPkgReq PackageConfig::get_package() const {
    auto req = PackageRequest::parse(id, RequestSource::user_require());
    if (content_version) {
        req.content_version = VersionPattern::parse(*content_version);
    }
    return std::make_shared<const PackageRequest>(std::move(req));
}

nitro_core::Result<void> PackageConfig::override_configured_package_input(
    const PackageProperties& properties, EvalInput& input) const {

    auto* launcher_input = dynamic_cast<LauncherEvalInput*>(&input);
    if (!launcher_input) {
        return nitro_core::Err(nitro_core::Error(nitro_core::ErrorCode::InvalidArgument,
            "Package config for '" + id + "' requires launcher evaluation input"));
    }

    return launcher_input->params().apply_config(*this, properties);
}

// =============================================================================
// Reading
// =============================================================================

nitro_core::Result<std::vector<PackageConfig>> read_package_configs(
    const std::string& json_str, PackageStability profile_stability) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return nitro_core::Err<std::vector<PackageConfig>>(
            nitro_core::Error(nitro_core::ErrorCode::ParseError,
                std::string("JSON parse error in package configuration: ") + e.what()));
    }

    if (!j.is_array()) {
        return nitro_core::Err<std::vector<PackageConfig>>(
            nitro_core::ConfigError::invalid_field("packages", "expected an array"));
    }

    std::vector<PackageConfig> configs;
    configs.reserve(j.size());
    for (const auto& entry : j) {
        auto config = parse_package_config(entry, profile_stability);
        if (!config) {
            return nitro_core::Err<std::vector<PackageConfig>>(config.error());
        }
        configs.push_back(std::move(*config));
    }

    nitro_core::pkg_logger()->debug("Read {} package configurations", configs.size());

    return nitro_core::Ok(std::move(configs));
}

} // namespace nitro_pkg
