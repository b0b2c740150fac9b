// nitro_pkg PackageRequest tests

#include <catch2/catch_test_macros.hpp>
#include <nitro/pkg/request.hpp>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace nitro_pkg;

TEST_CASE("PackageRequest parsing", "[pkg][request]") {
    SECTION("bare id") {
        auto req = PackageRequest::parse("sodium", RequestSource::user_require());
        REQUIRE(req.id == "sodium");
        REQUIRE_FALSE(req.repository.has_value());
        REQUIRE(req.content_version.is_any());
    }

    SECTION("repository and version") {
        auto req = PackageRequest::parse("modrinth:iris@1.6+", RequestSource::repository());
        REQUIRE(req.id == "iris");
        REQUIRE(req.repository == "modrinth");
        REQUIRE(req.content_version == VersionPattern::after("1.6"));
        REQUIRE(req.source.kind() == RequestSource::Kind::Repository);
    }

    SECTION("empty repository means none") {
        auto req = PackageRequest::parse(":sodium", RequestSource::user_require());
        REQUIRE(req.id == "sodium");
        REQUIRE_FALSE(req.repository.has_value());
    }
}

TEST_CASE("PackageRequest identity", "[pkg][request]") {
    auto root = PackageRequest::parse_shared("a", RequestSource::user_require());
    PackageRequest plain("foo", RequestSource::user_require());
    PackageRequest other("foo", RequestSource::dependency(root), VersionPattern::single("1.0"), "modrinth");

    SECTION("equality ignores everything but the id") {
        REQUIRE(plain == other);
        REQUIRE_FALSE(plain == PackageRequest("bar", RequestSource::user_require()));
    }

    SECTION("hash is consistent with equality") {
        std::unordered_set<PackageRequest, PackageRequestHash> set;
        set.insert(plain);
        set.insert(other);
        REQUIRE(set.size() == 1);
    }

    SECTION("ordering looks at source first") {
        REQUIRE(plain < other);
        PackageRequest refused("aaa", RequestSource::refused(root));
        PackageRequest bundled("zzz", RequestSource::bundled(root));
        REQUIRE(bundled < refused);
    }

    SECTION("ordering within a source uses the id") {
        std::vector<ArcPkgReq> reqs = {
            PackageRequest::parse_shared("c", RequestSource::dependency(root)),
            PackageRequest::parse_shared("a", RequestSource::dependency(root)),
            PackageRequest::parse_shared("b", RequestSource::dependency(root)),
        };
        std::sort(reqs.begin(), reqs.end(), request_less);
        REQUIRE(reqs[0]->id == "a");
        REQUIRE(reqs[1]->id == "b");
        REQUIRE(reqs[2]->id == "c");
    }

    SECTION("with_content_version keeps the source") {
        auto changed = other.with_content_version(VersionPattern::latest());
        REQUIRE(changed->content_version == VersionPattern::latest());
        REQUIRE(changed->source.get_parent() == root);
        REQUIRE(changed->repository == "modrinth");
    }
}

TEST_CASE("RequestSource provenance", "[pkg][request]") {
    auto user = PackageRequest::parse_shared("a", RequestSource::user_require());
    auto bundled = PackageRequest::parse_shared("b", RequestSource::bundled(user));
    auto dep = PackageRequest::parse_shared("c", RequestSource::dependency(bundled));
    auto bundled_by_dep = PackageRequest::parse_shared("d", RequestSource::bundled(dep));
    auto refused = PackageRequest::parse_shared("e", RequestSource::refused(dep));

    SECTION("get_source only for dependencies and bundles") {
        REQUIRE(user->source.get_source() == nullptr);
        REQUIRE(bundled->source.get_source() == user);
        REQUIRE(dep->source.get_source() == bundled);
        REQUIRE(refused->source.get_source() == nullptr);
        REQUIRE(refused->source.get_parent() == dep);
    }

    SECTION("user bundled chains") {
        REQUIRE(user->source.is_user_bundled());
        REQUIRE(bundled->source.is_user_bundled());
        REQUIRE_FALSE(dep->source.is_user_bundled());
        REQUIRE_FALSE(bundled_by_dep->source.is_user_bundled());
        REQUIRE_FALSE(RequestSource::repository().is_user_bundled());
    }

    SECTION("debug_sources renders the chain") {
        REQUIRE(user->debug_sources() == "a");
        REQUIRE(dep->debug_sources() == "a => b -> c");
        REQUIRE(refused->debug_sources() == "a => b -> c =X=> e");

        auto from_repo = PackageRequest::parse_shared("baz", RequestSource::repository());
        auto bar = PackageRequest::parse_shared("bar", RequestSource::dependency(from_repo));
        auto foo = PackageRequest::parse_shared("foo", RequestSource::dependency(bar));
        REQUIRE(foo->debug_sources() == "Repository -> baz -> bar -> foo");
    }

    SECTION("source names") {
        REQUIRE(std::string(request_source_name(RequestSource::Kind::Bundled)) == "Bundled");
        REQUIRE(std::string(request_source_name(RequestSource::Kind::Refused)) == "Refused");
    }
}

TEST_CASE("Package ID validation", "[pkg][request]") {
    REQUIRE(is_valid_package_id("sodium"));
    REQUIRE(is_valid_package_id("fabric-api-2"));
    REQUIRE_FALSE(is_valid_package_id(""));
    REQUIRE_FALSE(is_valid_package_id("Sodium"));
    REQUIRE_FALSE(is_valid_package_id("my_mod"));
    REQUIRE_FALSE(is_valid_package_id(std::string(MAX_PACKAGE_ID_LENGTH + 1, 'a')));
    REQUIRE(is_valid_package_id(std::string(MAX_PACKAGE_ID_LENGTH, 'a')));

    auto result = validate_package_id("Bad!");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == nitro_core::ErrorCode::InvalidArgument);
}
