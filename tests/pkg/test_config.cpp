// nitro_pkg configuration tests
//
// Covers package configs, overrides, properties and the launcher's
// evaluation input.

#include <catch2/catch_test_macros.hpp>
#include <nitro/pkg/config.hpp>
#include <nitro/pkg/eval_input.hpp>
#include <nitro/pkg/overrides.hpp>
#include <nitro/pkg/properties.hpp>
#include <nitro/pkg/request.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace nitro_pkg;
using namespace nitro_core;

namespace {

PackageProperties make_properties() {
    PackageProperties props;
    props.content_versions = std::vector<std::string>{"1.0", "2.0"};
    props.features = std::vector<std::string>{"extras", "shaders", "sounds"};
    props.default_features = std::vector<std::string>{"sounds"};
    return props;
}

/// EvalInput that is not the launcher's
class OtherInput : public EvalInput {
public:
    std::unique_ptr<EvalInput> clone() const override { return std::make_unique<OtherInput>(*this); }
    void set_content_versions(std::vector<std::string>, std::vector<std::string>) override {}
    void set_force(bool) override {}
};

} // anonymous namespace

// =============================================================================
// PackageProperties
// =============================================================================

TEST_CASE("PackageProperties parsing", "[pkg][properties]") {
    SECTION("all fields") {
        auto result = PackageProperties::from_json_string(R"({
            "content_versions": ["1.0", "1.1"],
            "features": ["extras"],
            "default_features": [],
            "unknown": 5
        })");
        REQUIRE(result.is_ok());
        REQUIRE(result->content_versions == std::vector<std::string>{"1.0", "1.1"});
        REQUIRE(result->features == std::vector<std::string>{"extras"});
        REQUIRE(result->default_features.has_value());
        REQUIRE(result->has_content_versions());
    }

    SECTION("missing fields stay unset") {
        auto result = PackageProperties::from_json_string("{}");
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result->content_versions.has_value());
        REQUIRE_FALSE(result->has_content_versions());
    }

    SECTION("wrong types are parse errors") {
        auto result = PackageProperties::from_json_string(R"({"content_versions": "1.0"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("malformed JSON") {
        auto result = PackageProperties::from_json_string("{");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}

// =============================================================================
// PackageConfig
// =============================================================================

TEST_CASE("PackageConfig reading", "[pkg][config]") {
    SECTION("string and object entries") {
        auto result = read_package_configs(R"([
            "sodium",
            "modrinth:iris@1.6+",
            {
                "id": "create",
                "features": ["extras"],
                "use_default_features": false,
                "permissions": "restricted",
                "stability": "latest",
                "worlds": ["survival"],
                "content_version": "0.5.1",
                "optional": true
            }
        ])", PackageStability::Stable);
        REQUIRE(result.is_ok());
        REQUIRE(result->size() == 3);

        const auto& sodium = (*result)[0];
        REQUIRE(sodium.id == "sodium");
        REQUIRE(sodium.use_default_features);
        REQUIRE_FALSE(sodium.is_optional());
        REQUIRE(sodium.permissions == EvalPermissions::Standard);

        const auto& iris = (*result)[1];
        REQUIRE(iris.id == "modrinth:iris");
        REQUIRE(iris.content_version == "1.6+");

        const auto& create = (*result)[2];
        REQUIRE(create.features == std::vector<std::string>{"extras"});
        REQUIRE_FALSE(create.use_default_features);
        REQUIRE(create.permissions == EvalPermissions::Restricted);
        REQUIRE(create.stability == PackageStability::Latest);
        REQUIRE(create.worlds == std::vector<std::string>{"survival"});
        REQUIRE(create.content_version == "0.5.1");
        REQUIRE(create.is_optional());
    }

    SECTION("stability is inherited from the profile") {
        auto result = read_package_configs(R"(["sodium", {"id": "iris"}])", PackageStability::Latest);
        REQUIRE(result.is_ok());
        REQUIRE((*result)[0].stability == PackageStability::Latest);
        REQUIRE((*result)[1].stability == PackageStability::Latest);
    }

    SECTION("missing id") {
        auto result = read_package_configs(R"([{"features": []}])", PackageStability::Stable);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<ConfigError>());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::MissingField);
    }

    SECTION("invalid id") {
        auto result = read_package_configs(R"(["Not Valid"])", PackageStability::Stable);
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::InvalidPackageId);
    }

    SECTION("unknown permission level") {
        auto result = read_package_configs(R"([{"id": "sodium", "permissions": "root"}])", PackageStability::Stable);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("package") != nullptr);
    }

    SECTION("not an array") {
        auto result = read_package_configs(R"({"id": "sodium"})", PackageStability::Stable);
        REQUIRE(result.is_err());
    }
}

TEST_CASE("PackageConfig features", "[pkg][config]") {
    auto props = make_properties();

    SECTION("defaults are appended") {
        auto config = PackageConfig::from_id("create");
        config.features = {"extras"};
        auto features = config.calculate_features(props);
        REQUIRE(features.is_ok());
        REQUIRE(*features == std::vector<std::string>{"extras", "sounds"});
    }

    SECTION("defaults can be disabled") {
        auto config = PackageConfig::from_id("create");
        config.use_default_features = false;
        auto features = config.calculate_features(props);
        REQUIRE(features.is_ok());
        REQUIRE(features->empty());
    }

    SECTION("unknown feature") {
        auto config = PackageConfig::from_id("create");
        config.features = {"flying"};
        auto features = config.calculate_features(props);
        REQUIRE(features.is_err());
        REQUIRE(features.error().as<ConfigError>()->kind == ConfigError::Kind::UnknownFeature);
    }
}

TEST_CASE("PackageConfig as a configured package", "[pkg][config]") {
    SECTION("get_package is a user requirement") {
        auto config = PackageConfig::from_id("modrinth:iris");
        config.content_version = "~1.6";
        auto req = config.get_package();
        REQUIRE(req->id == "iris");
        REQUIRE(req->repository == "modrinth");
        REQUIRE(req->source.kind() == RequestSource::Kind::UserRequire);
        REQUIRE(req->content_version == VersionPattern::prefer("1.6"));
    }

    SECTION("overrides the launcher input") {
        auto config = PackageConfig::from_id("create");
        config.features = {"shaders"};
        config.permissions = EvalPermissions::Elevated;
        config.stability = PackageStability::Latest;
        config.worlds = {"creative"};

        auto constants = std::make_shared<const EvalConstants>(EvalConstants{"1.20.1", "fabric", {}, "en_us"});
        LauncherEvalInput input(constants, EvalParameters(Side::Server));
        REQUIRE(config.override_configured_package_input(make_properties(), input).is_ok());

        const auto& params = input.params();
        REQUIRE(params.side == Side::Server);
        REQUIRE(params.features == std::vector<std::string>{"shaders", "sounds"});
        REQUIRE(params.permissions == EvalPermissions::Elevated);
        REQUIRE(params.stability == PackageStability::Latest);
        REQUIRE(params.worlds == std::vector<std::string>{"creative"});
    }

    SECTION("other inputs are rejected") {
        OtherInput input;
        auto result = PackageConfig::from_id("create").override_configured_package_input(make_properties(), input);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

// =============================================================================
// LauncherEvalInput
// =============================================================================

TEST_CASE("LauncherEvalInput", "[pkg][config]") {
    auto constants = std::make_shared<const EvalConstants>(EvalConstants{"1.20.1", "quilt", {"1.20", "1.20.1"}, "en_us"});
    LauncherEvalInput input(constants, EvalParameters());

    auto copy = input.clone();
    copy->set_content_versions({"1.0", "2.0"}, {"2.0"});
    copy->set_force(true);

    SECTION("clones are independent") {
        REQUIRE(input.params().required_content_versions.empty());
        REQUIRE_FALSE(input.params().force);

        const auto& launcher_copy = dynamic_cast<const LauncherEvalInput&>(*copy);
        REQUIRE(launcher_copy.params().required_content_versions == std::vector<std::string>{"1.0", "2.0"});
        REQUIRE(launcher_copy.params().preferred_content_versions == std::vector<std::string>{"2.0"});
        REQUIRE(launcher_copy.params().force);
    }

    SECTION("constants are shared") {
        const auto& launcher_copy = dynamic_cast<const LauncherEvalInput&>(*copy);
        REQUIRE(&launcher_copy.constants() == &input.constants());
        REQUIRE(launcher_copy.constants().loader == "quilt");
    }
}

// =============================================================================
// PackageOverrides
// =============================================================================

TEST_CASE("PackageOverrides", "[pkg][overrides]") {
    SECTION("parse") {
        auto result = PackageOverrides::from_json_string(R"({"suppress": ["sodium"], "force": ["iris"]})");
        REQUIRE(result.is_ok());
        REQUIRE(result->suppress == std::vector<std::string>{"sodium"});
        REQUIRE(result->force == std::vector<std::string>{"iris"});
    }

    SECTION("missing keys") {
        auto result = PackageOverrides::from_json_string("{}");
        REQUIRE(result.is_ok());
        REQUIRE(result->suppress.empty());
        REQUIRE(result->force.empty());
    }

    SECTION("wrong types") {
        REQUIRE(PackageOverrides::from_json_string(R"({"suppress": "sodium"})").is_err());
        REQUIRE(PackageOverrides::from_json_string(R"({"force": [1]})").is_err());
    }

    SECTION("entries match by id") {
        auto root = PackageRequest::parse_shared("a", RequestSource::user_require());
        PackageRequest req("sodium", RequestSource::dependency(root), VersionPattern::single("0.5"));
        REQUIRE(is_package_overridden(req, {"modrinth:sodium@0.4"}));
        REQUIRE_FALSE(is_package_overridden(req, {"iris"}));
        REQUIRE_FALSE(is_package_overridden(req, {}));
    }
}

// =============================================================================
// Enum Names
// =============================================================================

TEST_CASE("Configuration enum names", "[pkg][config]") {
    SECTION("stability") {
        PackageStability stability = PackageStability::Stable;
        REQUIRE(package_stability_from_string(package_stability_to_string(PackageStability::Latest), stability));
        REQUIRE(stability == PackageStability::Latest);
        REQUIRE_FALSE(package_stability_from_string("nightly", stability));
    }

    SECTION("permissions") {
        EvalPermissions perms = EvalPermissions::Standard;
        REQUIRE(eval_permissions_from_string(eval_permissions_to_string(EvalPermissions::Elevated), perms));
        REQUIRE(perms == EvalPermissions::Elevated);
        REQUIRE_FALSE(eval_permissions_from_string("root", perms));
    }

    SECTION("side") {
        REQUIRE(std::string(side_to_string(Side::Client)) == "client");
        REQUIRE(std::string(side_to_string(Side::Server)) == "server");
    }
}
