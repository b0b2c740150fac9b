/// @file error.cpp
/// @brief Resolution error implementation

#include <nitro/pkg/error.hpp>
#include <nitro/pkg/evaluator.hpp>

#include <sstream>

namespace nitro_pkg {

// =============================================================================
// Factory Methods
// =============================================================================

ResolutionError ResolutionError::failed_to_preload(nitro_core::Error cause) {
    ResolutionError err(Kind::FailedToPreload);
    err.m_cause = std::move(cause);
    return err;
}

ResolutionError ResolutionError::failed_to_get_properties(ArcPkgReq package, nitro_core::Error cause) {
    ResolutionError err(Kind::FailedToGetProperties);
    err.m_package = std::move(package);
    err.m_cause = std::move(cause);
    return err;
}

ResolutionError ResolutionError::failed_to_evaluate(ArcPkgReq package, nitro_core::Error cause) {
    ResolutionError err(Kind::FailedToEvaluate);
    err.m_package = std::move(package);
    err.m_cause = std::move(cause);
    return err;
}

ResolutionError ResolutionError::no_valid_versions_found(ArcPkgReq package,
                                                         std::vector<VersionPattern> constraints) {
    ResolutionError err(Kind::NoValidVersionsFound);
    err.m_package = std::move(package);
    err.m_constraints = std::move(constraints);
    return err;
}

ResolutionError ResolutionError::incompatible_package(ArcPkgReq package, std::vector<ArcPkgReq> refusers) {
    ResolutionError err(Kind::IncompatiblePackage);
    err.m_package = std::move(package);
    err.m_refusers = std::move(refusers);
    return err;
}

ResolutionError ResolutionError::extension_not_fulfilled(ArcPkgReq source, ArcPkgReq package) {
    ResolutionError err(Kind::ExtensionNotFulfilled);
    err.m_source = std::move(source);
    err.m_package = std::move(package);
    return err;
}

ResolutionError ResolutionError::explicit_require_not_fulfilled(ArcPkgReq package, ArcPkgReq source) {
    ResolutionError err(Kind::ExplicitRequireNotFulfilled);
    err.m_package = std::move(package);
    err.m_source = std::move(source);
    return err;
}

ResolutionError ResolutionError::package_context(ArcPkgReq package, ResolutionError inner) {
    ResolutionError err(Kind::PackageContext);
    err.m_package = std::move(package);
    err.m_inner = std::make_shared<const ResolutionError>(std::move(inner));
    return err;
}

ResolutionError ResolutionError::misc(nitro_core::Error cause) {
    ResolutionError err(Kind::Misc);
    err.m_cause = std::move(cause);
    return err;
}

const ResolutionError& ResolutionError::root() const noexcept {
    const ResolutionError* current = this;
    while (current->m_inner) {
        current = current->m_inner.get();
    }
    return *current;
}

// =============================================================================
// Display
// =============================================================================

namespace {

std::string display(const ArcPkgReq& req) {
    return req ? req->debug_sources() : std::string("<unknown>");
}

} // anonymous namespace

std::string ResolutionError::message() const {
    std::ostringstream oss;

    switch (m_kind) {
        case Kind::FailedToPreload:
            oss << "Failed to preload packages: " << m_cause.message();
            break;

        case Kind::FailedToGetProperties:
            oss << "Failed to get properties of package '" << display(m_package) << "': "
                << m_cause.message();
            break;

        case Kind::FailedToEvaluate:
            oss << "Failed to evaluate package '" << display(m_package) << "': " << m_cause.message();
            break;

        case Kind::NoValidVersionsFound: {
            oss << "No valid content versions found for package '" << display(m_package) << "'";
            if (!m_constraints.empty()) {
                oss << " with constraints [";
                for (std::size_t i = 0; i < m_constraints.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << m_constraints[i].to_string();
                }
                oss << "]";
            }
            break;
        }

        case Kind::IncompatiblePackage: {
            oss << "Package '" << display(m_package) << "' is incompatible with existing packages ";
            for (std::size_t i = 0; i < m_refusers.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << "'" << (m_refusers[i] ? m_refusers[i]->id : std::string("<unknown>")) << "'";
            }
            break;
        }

        case Kind::ExtensionNotFulfilled:
            if (m_source) {
                oss << "The package '" << display(m_source) << "' extends the functionality of the package '"
                    << display(m_package) << "', which is not installed";
            } else {
                oss << "A package extends the functionality of the package '" << display(m_package)
                    << "', which is not installed";
            }
            break;

        case Kind::ExplicitRequireNotFulfilled:
            oss << "The package '" << display(m_package) << "' must be explicitly required by the user"
                << " because '" << display(m_source) << "' depends on it explicitly";
            break;

        case Kind::PackageContext:
            oss << "In package '" << display(m_package) << "': "
                << (m_inner ? m_inner->message() : std::string("unknown error"));
            break;

        case Kind::Misc:
            oss << m_cause.message();
            break;
    }

    return oss.str();
}

ResolutionError ResolutionError::make_displayable(PackageEvaluator& evaluator,
                                                  const CommonInput& common_input) const {
    auto rewrite = [&evaluator, &common_input](const ArcPkgReq& req) -> ArcPkgReq {
        return req ? evaluator.make_req_displayable(req, common_input) : req;
    };

    ResolutionError out = *this;
    out.m_package = rewrite(m_package);
    out.m_source = rewrite(m_source);
    for (auto& refuser : out.m_refusers) {
        refuser = rewrite(refuser);
    }
    if (m_inner) {
        out.m_inner = std::make_shared<const ResolutionError>(m_inner->make_displayable(evaluator, common_input));
    }

    return out;
}

const char* resolution_error_kind_name(ResolutionError::Kind kind) noexcept {
    switch (kind) {
        case ResolutionError::Kind::FailedToPreload: return "FailedToPreload";
        case ResolutionError::Kind::FailedToGetProperties: return "FailedToGetProperties";
        case ResolutionError::Kind::FailedToEvaluate: return "FailedToEvaluate";
        case ResolutionError::Kind::NoValidVersionsFound: return "NoValidVersionsFound";
        case ResolutionError::Kind::IncompatiblePackage: return "IncompatiblePackage";
        case ResolutionError::Kind::ExtensionNotFulfilled: return "ExtensionNotFulfilled";
        case ResolutionError::Kind::ExplicitRequireNotFulfilled: return "ExplicitRequireNotFulfilled";
        case ResolutionError::Kind::PackageContext: return "PackageContext";
        case ResolutionError::Kind::Misc: return "Misc";
        default: return "Unknown";
    }
}

} // namespace nitro_pkg
