/// @file overrides.cpp
/// @brief Package overrides implementation

#include <nitro/pkg/overrides.hpp>
#include <nitro/pkg/request.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace nitro_pkg {

nitro_core::Result<PackageOverrides> PackageOverrides::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return nitro_core::Err<PackageOverrides>(
            nitro_core::Error(nitro_core::ErrorCode::ParseError,
                std::string("JSON parse error in package overrides: ") + e.what()));
    }

    if (!j.is_object()) {
        return nitro_core::Err<PackageOverrides>(
            nitro_core::ConfigError::invalid_field("overrides", "expected an object"));
    }

    PackageOverrides overrides;
    for (const char* key : {"suppress", "force"}) {
        if (!j.contains(key)) {
            continue;
        }
        const auto& list = j[key];
        if (!list.is_array() ||
            !std::all_of(list.begin(), list.end(), [](const nlohmann::json& x) { return x.is_string(); })) {
            return nitro_core::Err<PackageOverrides>(
                nitro_core::ConfigError::invalid_field(key, "expected an array of package IDs"));
        }
        auto& out = std::string(key) == "suppress" ? overrides.suppress : overrides.force;
        for (const auto& item : list) {
            out.push_back(item.get<std::string>());
        }
    }

    return nitro_core::Ok(std::move(overrides));
}

bool is_package_overridden(const PackageRequest& package, const std::vector<std::string>& list) {
    return std::any_of(list.begin(), list.end(), [&](const std::string& entry) {
        return PackageRequest::parse(entry, RequestSource::user_require()) == package;
    });
}

} // namespace nitro_pkg
