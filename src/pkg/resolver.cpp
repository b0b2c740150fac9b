/// @file resolver.cpp
/// @brief Package dependency resolver implementation

#include <nitro/pkg/resolver.hpp>
#include <nitro/pkg/properties.hpp>
#include <nitro/core/log.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>

namespace nitro_pkg {

const char* dependency_kind_name(DependencyKind kind) noexcept {
    switch (kind) {
        case DependencyKind::Require: return "Require";
        case DependencyKind::Bundled: return "Bundled";
        case DependencyKind::UserRequire: return "UserRequire";
        default: return "Unknown";
    }
}

namespace {

using Status = nitro_core::Result<void, ResolutionError>;

// =============================================================================
// Resolver State
// =============================================================================

/// One request that reached a dependency record
struct Requester {
    ArcPkgReq req;
    DependencyKind kind = DependencyKind::Require;
};

/// ID of the package that made a request, empty for user requests
std::string parent_id(const ArcPkgReq& req) {
    const auto& parent = req->source.get_parent();
    return parent ? parent->id : std::string();
}

/// Whether any package on the request chain is in `ids`
bool requested_through(const ArcPkgReq& req, const std::unordered_set<std::string>& ids) {
    for (auto parent = req->source.get_parent(); parent; parent = parent->source.get_parent()) {
        if (ids.contains(parent->id)) {
            return true;
        }
    }
    return false;
}

/// Accumulated state for one package ID
struct Dependency {
    ArcPkgReq pkg;  ///< First request seen for this ID, unless its requester was removed
    std::vector<Requester> requesters;
    DependencyKind kind = DependencyKind::Require;
    std::vector<VersionPattern> uncanonicalized_constraints;
    std::vector<VersionPattern> canonicalized_constraints;
    std::vector<VersionPattern> already_canonicalized_constraints;
    bool user_required = false;  ///< Requested by the user or a bundle chain rooted at the user
    std::vector<std::string> required_content_versions;
    std::vector<std::string> preferred_content_versions;

    [[nodiscard]] bool has_constraint(const VersionPattern& pattern) const {
        auto contains = [&pattern](const std::vector<VersionPattern>& list) {
            return std::find(list.begin(), list.end(), pattern) != list.end();
        };
        return contains(uncanonicalized_constraints) || contains(canonicalized_constraints) ||
               contains(already_canonicalized_constraints);
    }
};

/// Target must never become required
struct RefuseConstraint {
    ArcPkgReq target;
    ArcPkgReq origin;
};

/// Soft preference, checked once resolution is finished
struct RecommendConstraint {
    ArcPkgReq target;
    bool invert = false;
    ArcPkgReq origin;
};

/// If `a` becomes required, `b` must become required too
struct CompatConstraint {
    ArcPkgReq a;
    ArcPkgReq b;
    ArcPkgReq origin;
};

/// Target must be required by the end of resolution
struct ExtendConstraint {
    ArcPkgReq target;
    ArcPkgReq origin;
};

using Constraint = std::variant<RefuseConstraint, RecommendConstraint, CompatConstraint, ExtendConstraint>;

/// Evaluate the relations of a package
struct EvalPackageTask {
    ArcPkgReq dest;
};

using Task = std::variant<EvalPackageTask>;

/// Package that produced a constraint
const ArcPkgReq& constraint_origin(const Constraint& constraint) {
    return std::visit([](const auto& c) -> const ArcPkgReq& { return c.origin; }, constraint);
}

/// Constraints are identical when they have the same kind, the same package
/// IDs and the same origin
bool same_constraint(const Constraint& lhs, const Constraint& rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (*constraint_origin(lhs) != *constraint_origin(rhs)) {
        return false;
    }

    return std::visit([&rhs](const auto& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        const auto& r = std::get<T>(rhs);
        if constexpr (std::is_same_v<T, RefuseConstraint> || std::is_same_v<T, ExtendConstraint>) {
            return *l.target == *r.target;
        } else if constexpr (std::is_same_v<T, RecommendConstraint>) {
            return *l.target == *r.target && l.invert == r.invert;
        } else if constexpr (std::is_same_v<T, CompatConstraint>) {
            return *l.a == *r.a && *l.b == *r.b;
        }
    }, lhs);
}

struct State {
    std::deque<Task> tasks;
    std::unordered_map<std::string, Dependency> dependencies;
    std::vector<std::string> order;  ///< Dependency IDs in discovery order
    std::vector<Constraint> constraints;
};

/// Undo record for one evaluation. An evaluation only appends tasks, records
/// and constraints, so their old sizes plus copies of the records it modified
/// are enough to restore the state.
struct Checkpoint {
    std::size_t tasks = 0;
    std::size_t order = 0;
    std::size_t constraints = 0;
    std::unordered_map<std::string, Dependency> modified;
};

// =============================================================================
// Resolver
// =============================================================================

class Resolver {
public:
    Resolver(PackageEvaluator& evaluator, const EvalInput& constant_input, const CommonInput& common_input,
             const PackageOverrides& overrides)
        : m_evaluator(evaluator)
        , m_constant_input(constant_input)
        , m_common_input(common_input)
        , m_overrides(overrides) {}

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    Status seed(const std::vector<std::shared_ptr<const ConfiguredPackage>>& configured_packages);
    Status run();
    ResolutionOutcome finish() const;

private:
    // Tasks
    Status preload(std::vector<ArcPkgReq> packages);
    Status preload_queued();
    Status resolve_task(const Task& task);
    Status resolve_eval_package(const ArcPkgReq& pkg);
    void remove_failed_package(const ArcPkgReq& dest);

    // Rollback
    void begin_checkpoint();
    void remember(const std::string& id, const Dependency& dep);
    void rollback();

    // Dependencies
    void update_dependency(const ArcPkgReq& req, DependencyKind kind);
    void canonicalize_versions(Dependency& dep);
    void reroot_dependency(Dependency& dep, const std::unordered_set<std::string>& removed);
    [[nodiscard]] bool is_required(const PackageRequest& req) const;
    [[nodiscard]] bool is_suppressed(const PackageRequest& req) const;
    [[nodiscard]] bool is_optional(const std::string& id) const;
    [[nodiscard]] bool is_optional(const std::string& id, std::unordered_set<std::string>& visiting) const;
    [[nodiscard]] bool is_optional_request(const ArcPkgReq& req,
                                           std::unordered_set<std::string>& visiting) const;

    // Constraints
    Status check_constraints(const ArcPkgReq& req) const;
    void check_compats();
    void add_constraint(Constraint constraint);

    PackageEvaluator& m_evaluator;
    const EvalInput& m_constant_input;
    const CommonInput& m_common_input;
    const PackageOverrides& m_overrides;

    State m_state;
    std::optional<Checkpoint> m_checkpoint;
    std::unordered_set<std::string> m_preloaded;
    std::unordered_set<std::string> m_failed;  ///< Optional packages whose failure was skipped
    std::unordered_map<std::string, std::shared_ptr<const ConfiguredPackage>> m_configs;
};

// =============================================================================
// Setup and Main Loop
// =============================================================================

Status Resolver::seed(const std::vector<std::shared_ptr<const ConfiguredPackage>>& configured_packages) {
    std::vector<std::pair<ArcPkgReq, std::shared_ptr<const ConfiguredPackage>>> packages;
    packages.reserve(configured_packages.size());
    for (const auto& configured : configured_packages) {
        auto req = configured->get_package();
        if (is_suppressed(*req)) {
            nitro_core::pkg_logger()->debug("Skipping suppressed package '{}'", req->id);
            continue;
        }
        packages.emplace_back(std::move(req), configured);
    }

    std::stable_sort(packages.begin(), packages.end(), [](const auto& lhs, const auto& rhs) {
        return request_less(lhs.first, rhs.first);
    });

    std::vector<ArcPkgReq> to_preload;
    to_preload.reserve(packages.size());
    for (const auto& [req, _] : packages) {
        to_preload.push_back(req);
    }
    auto preloaded = preload(std::move(to_preload));
    if (!preloaded) {
        return preloaded;
    }

    for (const auto& [req, configured] : packages) {
        m_configs[req->id] = configured;
        update_dependency(req, DependencyKind::UserRequire);
    }

    return Status();
}

Status Resolver::run() {
    while (!m_state.tasks.empty()) {
        std::size_t skipped = 0;

        while (!m_state.tasks.empty()) {
            Task task = std::move(m_state.tasks.front());
            m_state.tasks.pop_front();

            if (const auto* eval = std::get_if<EvalPackageTask>(&task);
                eval && !m_preloaded.contains(eval->dest->id)) {
                m_state.tasks.push_back(std::move(task));
                ++skipped;
                if (skipped >= m_state.tasks.size()) {
                    break;
                }
                continue;
            }

            auto result = resolve_task(task);
            if (!result) {
                return result;
            }
            check_compats();
            skipped = 0;
        }

        if (m_state.tasks.empty()) {
            break;
        }

        auto preloaded = preload_queued();
        if (!preloaded) {
            return preloaded;
        }
    }

    return Status();
}

ResolutionOutcome Resolver::finish() const {
    ResolutionResult result;

    for (const auto& constraint : m_state.constraints) {
        if (const auto* extend = std::get_if<ExtendConstraint>(&constraint)) {
            if (!is_required(*extend->target)) {
                return ResolutionError::extension_not_fulfilled(extend->origin, extend->target);
            }
        } else if (const auto* recommend = std::get_if<RecommendConstraint>(&constraint)) {
            if (is_required(*recommend->target) == recommend->invert) {
                nitro_core::pkg_logger()->info("Recommendation {}'{}' from '{}' is not fulfilled",
                    recommend->invert ? "against " : "", recommend->target->id, recommend->origin->id);
                result.unfulfilled_recommendations.push_back(
                    UnfulfilledRecommendation{recommend->target, recommend->invert});
            }
        }
    }

    result.packages.reserve(m_state.order.size());
    for (const auto& id : m_state.order) {
        const auto& dep = m_state.dependencies.at(id);
        result.packages.push_back(ResolutionPackageResult{
            dep.pkg, dep.kind, dep.required_content_versions, dep.preferred_content_versions});
    }

    return result;
}

// =============================================================================
// Tasks
// =============================================================================

Status Resolver::preload(std::vector<ArcPkgReq> packages) {
    std::unordered_set<std::string> seen;
    std::vector<ArcPkgReq> batch;
    batch.reserve(packages.size());
    for (auto& req : packages) {
        if (seen.insert(req->id).second) {
            batch.push_back(std::move(req));
        }
    }

    if (batch.empty()) {
        return Status();
    }

    nitro_core::pkg_logger()->debug("Preloading {} packages", batch.size());

    auto result = m_evaluator.preload_packages(batch, m_common_input);
    if (!result) {
        return ResolutionError::failed_to_preload(result.error());
    }

    for (const auto& req : batch) {
        m_preloaded.insert(req->id);
    }

    return Status();
}

Status Resolver::preload_queued() {
    std::vector<ArcPkgReq> packages;
    for (const auto& task : m_state.tasks) {
        std::visit([&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, EvalPackageTask>) {
                if (!is_suppressed(*t.dest) && !m_preloaded.contains(t.dest->id)) {
                    packages.push_back(t.dest);
                }
            }
        }, task);
    }

    return preload(std::move(packages));
}

Status Resolver::resolve_task(const Task& task) {
    return std::visit([this](const auto& t) -> Status {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, EvalPackageTask>) {
            if (is_suppressed(*t.dest)) {
                return Status();
            }

            begin_checkpoint();
            auto result = resolve_eval_package(t.dest);
            if (result) {
                m_checkpoint.reset();
                return result;
            }
            rollback();

            // Only skipped when every path to the package runs through an optional config
            if (is_optional(t.dest->id)) {
                nitro_core::pkg_logger()->warn("Skipping optional package '{}': {}",
                    t.dest->debug_sources(), result.error().message());
                remove_failed_package(t.dest);
                return Status();
            }

            return ResolutionError::package_context(t.dest, std::move(result.error()));
        }
    }, task);
}

Status Resolver::resolve_eval_package(const ArcPkgReq& pkg) {
    nitro_core::pkg_logger()->debug("Evaluating package '{}'", pkg->debug_sources());

    auto allowed = check_constraints(pkg);
    if (!allowed) {
        return allowed;
    }

    // The record is created here if a package is evaluated before it was required
    auto [dep_it, inserted] = m_state.dependencies.try_emplace(pkg->id);
    if (inserted) {
        dep_it->second.pkg = pkg;
        m_state.order.push_back(pkg->id);
    } else {
        remember(pkg->id, dep_it->second);
    }
    canonicalize_versions(dep_it->second);

    // Content versions

    auto properties = m_evaluator.get_package_properties(pkg, m_common_input);
    if (!properties) {
        return ResolutionError::failed_to_get_properties(pkg, properties.error());
    }
    if (*properties == nullptr) {
        return ResolutionError::failed_to_get_properties(
            pkg, nitro_core::PackageError::properties_unavailable(pkg->id, "evaluator returned no properties"));
    }
    const PackageProperties& props = **properties;

    std::vector<std::string> required = props.content_versions.value_or(std::vector<std::string>{});
    std::vector<std::string> preferred;
    for (const auto& constraint : dep_it->second.canonicalized_constraints) {
        required = constraint.matches(required);
        if (constraint.is_prefer() &&
            std::find(preferred.begin(), preferred.end(), constraint.version) == preferred.end()) {
            preferred.push_back(constraint.version);
        }
    }

    if (required.empty() && props.has_content_versions()) {
        return ResolutionError::no_valid_versions_found(pkg, dep_it->second.canonicalized_constraints);
    }

    dep_it->second.required_content_versions = required;
    dep_it->second.preferred_content_versions = preferred;

    // Input

    auto input = m_constant_input.clone();
    input->set_content_versions(std::move(required), std::move(preferred));
    input->set_force(is_package_overridden(*pkg, m_overrides.force));

    if (auto config = m_configs.find(pkg->id); config != m_configs.end()) {
        auto applied = config->second->override_configured_package_input(props, *input);
        if (!applied) {
            return ResolutionError::misc(applied.error());
        }
    }

    auto relations = m_evaluator.eval_package_relations(pkg, *input, m_common_input);
    if (!relations) {
        return ResolutionError::failed_to_evaluate(pkg, relations.error());
    }

    // dep_it may be invalidated from here on

    // Conflicts

    std::vector<ArcPkgReq> conflicts;
    for (const auto& conflict : relations->conflicts) {
        conflicts.push_back(PackageRequest::parse_shared(conflict, RequestSource::refused(pkg)));
    }
    std::sort(conflicts.begin(), conflicts.end(), request_less);

    for (const auto& target : conflicts) {
        if (is_required(*target)) {
            return ResolutionError::incompatible_package(target, {pkg});
        }
        add_constraint(RefuseConstraint{target, pkg});
    }

    // Dependencies

    std::vector<std::pair<ArcPkgReq, bool>> deps;
    for (const auto& group : relations->deps) {
        for (const auto& dep : group) {
            deps.emplace_back(PackageRequest::parse_shared(dep.value, RequestSource::dependency(pkg)), dep.explicit_);
        }
    }
    std::sort(deps.begin(), deps.end(), [](const auto& lhs, const auto& rhs) {
        if (request_less(lhs.first, rhs.first)) return true;
        if (request_less(rhs.first, lhs.first)) return false;
        return lhs.second < rhs.second;
    });

    for (const auto& [target, is_explicit] : deps) {
        if (is_explicit) {
            auto existing = m_state.dependencies.find(target->id);
            if (existing == m_state.dependencies.end() || !existing->second.user_required) {
                return ResolutionError::explicit_require_not_fulfilled(target, pkg);
            }
        }

        auto allowed_dep = check_constraints(target);
        if (!allowed_dep) {
            return allowed_dep;
        }
        update_dependency(target, DependencyKind::Require);
    }

    // Bundles

    std::vector<ArcPkgReq> bundled;
    for (const auto& bundle : relations->bundled) {
        bundled.push_back(PackageRequest::parse_shared(bundle, RequestSource::bundled(pkg)));
    }
    std::sort(bundled.begin(), bundled.end(), request_less);

    for (const auto& target : bundled) {
        auto allowed_bundle = check_constraints(target);
        if (!allowed_bundle) {
            return allowed_bundle;
        }
        update_dependency(target, DependencyKind::Bundled);
    }

    // Compats

    std::vector<std::pair<ArcPkgReq, ArcPkgReq>> compats;
    for (const auto& [a, b] : relations->compats) {
        compats.emplace_back(PackageRequest::parse_shared(a, RequestSource::dependency(pkg)),
                             PackageRequest::parse_shared(b, RequestSource::dependency(pkg)));
    }
    std::sort(compats.begin(), compats.end(), [](const auto& lhs, const auto& rhs) {
        if (request_less(lhs.first, rhs.first)) return true;
        if (request_less(rhs.first, lhs.first)) return false;
        return request_less(lhs.second, rhs.second);
    });

    for (auto& [a, b] : compats) {
        add_constraint(CompatConstraint{std::move(a), std::move(b), pkg});
    }

    // Extensions

    std::vector<ArcPkgReq> extensions;
    for (const auto& extension : relations->extensions) {
        extensions.push_back(PackageRequest::parse_shared(extension, RequestSource::dependency(pkg)));
    }
    std::sort(extensions.begin(), extensions.end(), request_less);

    for (auto& target : extensions) {
        add_constraint(ExtendConstraint{std::move(target), pkg});
    }

    // Recommendations

    std::vector<std::pair<ArcPkgReq, bool>> recommendations;
    for (const auto& recommendation : relations->recommendations) {
        recommendations.emplace_back(
            PackageRequest::parse_shared(recommendation.value, RequestSource::dependency(pkg)),
            recommendation.invert);
    }
    std::sort(recommendations.begin(), recommendations.end(), [](const auto& lhs, const auto& rhs) {
        if (request_less(lhs.first, rhs.first)) return true;
        if (request_less(rhs.first, lhs.first)) return false;
        return lhs.second < rhs.second;
    });

    for (auto& [target, invert] : recommendations) {
        add_constraint(RecommendConstraint{std::move(target), invert, pkg});
    }

    return Status();
}

void Resolver::remove_failed_package(const ArcPkgReq& dest) {
    m_failed.insert(dest->id);

    // A record goes when every package that requested it is gone
    std::unordered_set<std::string> removed{dest->id};
    for (bool changed = true; changed;) {
        changed = false;
        for (const auto& [id, dep] : m_state.dependencies) {
            if (removed.contains(id) || dep.requesters.empty()) {
                continue;
            }
            bool orphaned = std::all_of(dep.requesters.begin(), dep.requesters.end(), [&](const Requester& r) {
                auto parent = parent_id(r.req);
                return !parent.empty() && removed.contains(parent);
            });
            if (orphaned) {
                removed.insert(id);
                changed = true;
            }
        }
    }

    for (const auto& id : removed) {
        m_state.dependencies.erase(id);
    }
    std::erase_if(m_state.order, [&](const std::string& id) { return removed.contains(id); });
    std::erase_if(m_state.tasks, [&](const Task& task) {
        return std::visit([&](const auto& t) { return removed.contains(t.dest->id); }, task);
    });
    std::erase_if(m_state.constraints, [&](const Constraint& constraint) {
        return removed.contains(constraint_origin(constraint)->id);
    });

    for (const auto& id : m_state.order) {
        reroot_dependency(m_state.dependencies.at(id), removed);
    }
    for (auto& task : m_state.tasks) {
        std::visit([&](auto& t) {
            if (requested_through(t.dest, removed)) {
                t.dest = m_state.dependencies.at(t.dest->id).pkg;
            }
        }, task);
    }

    nitro_core::pkg_logger()->debug("Removed {} packages after optional failure of '{}'",
        removed.size(), dest->id);
}

// =============================================================================
// Rollback
// =============================================================================

void Resolver::begin_checkpoint() {
    m_checkpoint.emplace();
    m_checkpoint->tasks = m_state.tasks.size();
    m_checkpoint->order = m_state.order.size();
    m_checkpoint->constraints = m_state.constraints.size();
}

void Resolver::remember(const std::string& id, const Dependency& dep) {
    if (m_checkpoint) {
        m_checkpoint->modified.try_emplace(id, dep);
    }
}

void Resolver::rollback() {
    if (!m_checkpoint) {
        return;
    }
    Checkpoint checkpoint = std::move(*m_checkpoint);
    m_checkpoint.reset();

    for (auto& [id, dep] : checkpoint.modified) {
        m_state.dependencies[id] = std::move(dep);
    }
    // Records created during the evaluation, including ones modified after creation
    for (std::size_t i = checkpoint.order; i < m_state.order.size(); ++i) {
        m_state.dependencies.erase(m_state.order[i]);
    }

    m_state.order.resize(checkpoint.order);
    m_state.constraints.resize(checkpoint.constraints);
    m_state.tasks.erase(m_state.tasks.begin() + static_cast<std::ptrdiff_t>(checkpoint.tasks),
                        m_state.tasks.end());
}

// =============================================================================
// Dependencies
// =============================================================================

void Resolver::update_dependency(const ArcPkgReq& req, DependencyKind kind) {
    if (is_suppressed(*req)) {
        return;
    }

    // A skipped optional package is only brought back by a required path,
    // whose evaluation then reports the failure
    if (m_failed.contains(req->id)) {
        std::unordered_set<std::string> visiting;
        if (is_optional_request(req, visiting)) {
            return;
        }
    }

    auto [it, inserted] = m_state.dependencies.try_emplace(req->id);
    Dependency& dep = it->second;
    if (inserted) {
        dep.pkg = req;
        dep.kind = kind;
        m_state.order.push_back(req->id);
    } else {
        remember(req->id, dep);
    }

    auto same_request = [&req, kind](const Requester& r) {
        return r.kind == kind && parent_id(r.req) == parent_id(req) && r.req->content_version == req->content_version;
    };
    if (std::none_of(dep.requesters.begin(), dep.requesters.end(), same_request)) {
        dep.requesters.push_back(Requester{req, kind});
    }

    dep.kind = std::max(dep.kind, kind);
    if (req->source.is_user_bundled()) {
        dep.user_required = true;
    }

    bool constraint_added = false;
    if (!req->content_version.is_any() && !dep.has_constraint(req->content_version)) {
        dep.uncanonicalized_constraints.push_back(req->content_version);
        constraint_added = true;
    }

    if (inserted || constraint_added) {
        m_state.tasks.push_back(EvalPackageTask{req});
    }
}

void Resolver::canonicalize_versions(Dependency& dep) {
    for (auto& pattern : dep.uncanonicalized_constraints) {
        auto displayable = m_evaluator.make_req_displayable(dep.pkg->with_content_version(pattern), m_common_input);
        const VersionPattern& canonical = displayable ? displayable->content_version : pattern;

        if (std::find(dep.canonicalized_constraints.begin(), dep.canonicalized_constraints.end(), canonical) ==
            dep.canonicalized_constraints.end()) {
            dep.canonicalized_constraints.push_back(canonical);
        }
        dep.already_canonicalized_constraints.push_back(std::move(pattern));
    }
    dep.uncanonicalized_constraints.clear();
}

void Resolver::reroot_dependency(Dependency& dep, const std::unordered_set<std::string>& removed) {
    auto pruned = std::erase_if(dep.requesters, [&removed](const Requester& r) {
        auto parent = parent_id(r.req);
        return !parent.empty() && removed.contains(parent);
    });
    if (!requested_through(dep.pkg, removed) && pruned == 0) {
        return;
    }

    auto surviving = std::find_if(dep.requesters.begin(), dep.requesters.end(),
                                  [&removed](const Requester& r) { return !requested_through(r.req, removed); });
    if (surviving != dep.requesters.end()) {
        dep.pkg = surviving->req;
    } else if (!dep.requesters.empty()) {
        dep.pkg = dep.requesters.front().req;
    }

    if (pruned == 0) {
        return;
    }

    // Rebuild what the removed requesters contributed
    dep.kind = DependencyKind::Require;
    dep.user_required = false;
    std::vector<VersionPattern> constraints;
    for (const auto& r : dep.requesters) {
        dep.kind = std::max(dep.kind, r.kind);
        if (r.req->source.is_user_bundled()) {
            dep.user_required = true;
        }
        const auto& version = r.req->content_version;
        if (!version.is_any() && std::find(constraints.begin(), constraints.end(), version) == constraints.end()) {
            constraints.push_back(version);
        }
    }

    std::vector<VersionPattern> previous = dep.already_canonicalized_constraints;
    previous.insert(previous.end(), dep.uncanonicalized_constraints.begin(), dep.uncanonicalized_constraints.end());
    if (previous == constraints) {
        return;
    }

    dep.uncanonicalized_constraints = std::move(constraints);
    dep.canonicalized_constraints.clear();
    dep.already_canonicalized_constraints.clear();

    bool queued = std::any_of(m_state.tasks.begin(), m_state.tasks.end(), [&dep](const Task& task) {
        return std::visit([&dep](const auto& t) { return t.dest->id == dep.pkg->id; }, task);
    });
    if (!queued) {
        m_state.tasks.push_back(EvalPackageTask{dep.pkg});
    }
}

bool Resolver::is_required(const PackageRequest& req) const {
    return m_state.dependencies.contains(req.id);
}

bool Resolver::is_suppressed(const PackageRequest& req) const {
    return is_package_overridden(req, m_overrides.suppress);
}

bool Resolver::is_optional(const std::string& id) const {
    std::unordered_set<std::string> visiting;
    return is_optional(id, visiting);
}

/// Whether every request for the package came through an optional config
bool Resolver::is_optional(const std::string& id, std::unordered_set<std::string>& visiting) const {
    auto it = m_state.dependencies.find(id);
    if (it == m_state.dependencies.end() || it->second.requesters.empty()) {
        return false;
    }
    // A cycle adds no path of its own
    if (!visiting.insert(id).second) {
        return true;
    }

    return std::all_of(it->second.requesters.begin(), it->second.requesters.end(),
                       [&](const Requester& r) { return is_optional_request(r.req, visiting); });
}

bool Resolver::is_optional_request(const ArcPkgReq& req, std::unordered_set<std::string>& visiting) const {
    const auto& parent = req->source.get_parent();
    if (!parent) {
        auto config = m_configs.find(req->id);
        return config != m_configs.end() && config->second->is_optional();
    }
    return is_optional(parent->id, visiting);
}

// =============================================================================
// Constraints
// =============================================================================

Status Resolver::check_constraints(const ArcPkgReq& req) const {
    std::vector<ArcPkgReq> refusers;
    for (const auto& constraint : m_state.constraints) {
        if (const auto* refuse = std::get_if<RefuseConstraint>(&constraint); refuse && *refuse->target == *req) {
            refusers.push_back(refuse->origin);
        }
    }

    if (!refusers.empty()) {
        return ResolutionError::incompatible_package(req, std::move(refusers));
    }

    return Status();
}

void Resolver::check_compats() {
    std::vector<ArcPkgReq> to_require;
    for (const auto& constraint : m_state.constraints) {
        if (const auto* compat = std::get_if<CompatConstraint>(&constraint)) {
            if (is_required(*compat->a) && !is_required(*compat->b)) {
                to_require.push_back(compat->b);
            }
        }
    }

    for (const auto& req : to_require) {
        update_dependency(req, DependencyKind::Require);
    }
}

void Resolver::add_constraint(Constraint constraint) {
    for (const auto& existing : m_state.constraints) {
        if (same_constraint(existing, constraint)) {
            return;
        }
    }
    m_state.constraints.push_back(std::move(constraint));
}

} // anonymous namespace

// =============================================================================
// Entry Point
// =============================================================================

ResolutionOutcome resolve(
    const std::vector<std::shared_ptr<const ConfiguredPackage>>& configured_packages,
    PackageEvaluator& evaluator,
    const EvalInput& constant_input,
    const CommonInput& common_input,
    const PackageOverrides& overrides) {

    NITRO_LOG_SCOPE("resolve", "pkg");

    Resolver resolver(evaluator, constant_input, common_input, overrides);

    auto seeded = resolver.seed(configured_packages);
    if (!seeded) {
        return seeded.error().make_displayable(evaluator, common_input);
    }

    auto ran = resolver.run();
    if (!ran) {
        return ran.error().make_displayable(evaluator, common_input);
    }

    auto result = resolver.finish();
    if (!result) {
        return result.error().make_displayable(evaluator, common_input);
    }

    nitro_core::pkg_logger()->debug("Resolved {} packages", result->packages.size());

    return result;
}

} // namespace nitro_pkg
