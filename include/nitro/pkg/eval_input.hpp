#pragma once

/// @file eval_input.hpp
/// @brief The launcher's evaluation input for packages

#include "fwd.hpp"
#include "evaluator.hpp"
#include <nitro/core/error.hpp>

#include <memory>
#include <string>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// EvalConstants
// =============================================================================

/// Values that are the same for every package in one resolution
struct EvalConstants {
    std::string game_version;               ///< Game version of the instance
    std::string loader;                     ///< Mod loader of the instance
    std::vector<std::string> version_list;  ///< All known game versions, oldest first
    std::string language;                   ///< User's configured language
    PackageStability profile_stability = PackageStability::Stable;
};

// =============================================================================
// EvalParameters
// =============================================================================

/// Values that may differ for each package
struct EvalParameters {
    Side side = Side::Client;
    std::vector<std::string> features;
    EvalPermissions permissions = EvalPermissions::Standard;
    PackageStability stability = PackageStability::Stable;
    std::vector<std::string> worlds;
    std::vector<std::string> required_content_versions;
    std::vector<std::string> preferred_content_versions;
    bool force = false;

    EvalParameters() = default;
    explicit EvalParameters(Side s) : side(s) {}

    /// Apply a package config to the parameters
    [[nodiscard]] nitro_core::Result<void> apply_config(const PackageConfig& config,
                                                        const PackageProperties& properties);
};

// =============================================================================
// LauncherEvalInput
// =============================================================================

/// EvalInput combining shared constants with per-package parameters
class LauncherEvalInput : public EvalInput {
public:
    LauncherEvalInput(std::shared_ptr<const EvalConstants> constants, EvalParameters params)
        : m_constants(std::move(constants))
        , m_params(std::move(params)) {}

    [[nodiscard]] std::unique_ptr<EvalInput> clone() const override {
        return std::make_unique<LauncherEvalInput>(*this);
    }

    void set_content_versions(std::vector<std::string> required,
                              std::vector<std::string> preferred) override {
        m_params.required_content_versions = std::move(required);
        m_params.preferred_content_versions = std::move(preferred);
    }

    void set_force(bool force) override { m_params.force = force; }

    [[nodiscard]] const EvalConstants& constants() const noexcept { return *m_constants; }
    [[nodiscard]] const EvalParameters& params() const noexcept { return m_params; }
    [[nodiscard]] EvalParameters& params() noexcept { return m_params; }

private:
    std::shared_ptr<const EvalConstants> m_constants;
    EvalParameters m_params;
};

} // namespace nitro_pkg
