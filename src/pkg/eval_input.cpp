/// @file eval_input.cpp
/// @brief Launcher evaluation input implementation

#include <nitro/pkg/eval_input.hpp>
#include <nitro/pkg/config.hpp>

namespace nitro_pkg {

nitro_core::Result<void> EvalParameters::apply_config(const PackageConfig& config,
                                                      const PackageProperties& properties) {
    auto calculated = config.calculate_features(properties);
    if (!calculated) {
        return nitro_core::Err(calculated.error());
    }

    features = std::move(*calculated);
    permissions = config.permissions;
    stability = config.stability;
    worlds = config.worlds;

    return nitro_core::Ok();
}

} // namespace nitro_pkg
