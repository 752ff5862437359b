#include <doctest/doctest.h>
#include <uberpack/manifest.hpp>
#include <uberpack/platform.hpp>

#include <filesystem>

namespace fs = std::filesystem;

using namespace uberpack;

namespace {

std::vector<std::string> names_of(const ManifestAttributes& attrs) {
    std::vector<std::string> names;
    for (const auto& [name, value] : attrs.items()) names.push_back(name);
    return names;
}

} // namespace

TEST_CASE("normalize_main_class replaces dashes with underscores") {
    CHECK(normalize_main_class("my-app.core") == "my_app.core");
    CHECK(normalize_main_class("a-b-c.d-e") == "a_b_c.d_e");
    CHECK(normalize_main_class("plain.Main") == "plain.Main");
}

TEST_CASE("ManifestAttributes compares names case-insensitively") {
    ManifestAttributes attrs;
    attrs.set("Main-Class", "a.Main");
    attrs.set("main-class", "b.Main");

    CHECK(attrs.size() == 1);
    CHECK(attrs.items()[0].first == "Main-Class");
    CHECK(attrs.get("MAIN-CLASS") == std::optional<std::string>("b.Main"));
    CHECK_FALSE(attrs.contains("Class-Path"));
}

TEST_CASE("synthesize_manifest builds the standard attributes in order") {
    ManifestInputs inputs;
    inputs.build_jdk_spec = "17";
    inputs.main = "my-app.core";

    auto result = synthesize_manifest(inputs);
    REQUIRE(result.ok);
    CHECK(names_of(result.attributes) ==
          std::vector<std::string>{"Manifest-Version", "Created-By", "Build-Jdk-Spec", "Main-Class"});
    CHECK(*result.attributes.get("Manifest-Version") == "1.0");
    CHECK(*result.attributes.get("Created-By") == "uberpack");
    CHECK(*result.attributes.get("Build-Jdk-Spec") == "17");
    CHECK(*result.attributes.get("Main-Class") == "my_app.core");
}

TEST_CASE("synthesize_manifest omits Main-Class without an entry point") {
    ManifestInputs inputs;
    inputs.build_jdk_spec = "17";

    auto result = synthesize_manifest(inputs);
    REQUIRE(result.ok);
    CHECK_FALSE(result.attributes.contains("Main-Class"));
    CHECK_FALSE(result.attributes.contains("Multi-Release"));
}

TEST_CASE("synthesize_manifest marks multi-release archives") {
    ManifestInputs inputs;
    inputs.build_jdk_spec = "11";
    inputs.multi_release = true;

    auto result = synthesize_manifest(inputs);
    REQUIRE(result.ok);
    CHECK(*result.attributes.get("Multi-Release") == "true");
}

TEST_CASE("synthesize_manifest applies overrides last") {
    ManifestInputs inputs;
    inputs.build_jdk_spec = "17";
    inputs.main = "my-app.core";
    inputs.overrides = {{"Main-Class", "custom.Launcher"},
                        {"created-by", "me"},
                        {"Implementation-Version", "1.2.3"}};

    auto result = synthesize_manifest(inputs);
    REQUIRE(result.ok);
    CHECK(*result.attributes.get("Main-Class") == "custom.Launcher");
    CHECK(*result.attributes.get("Created-By") == "me");
    CHECK(names_of(result.attributes).back() == "Implementation-Version");
    CHECK(names_of(result.attributes)[1] == "Created-By");
}

TEST_CASE("synthesize_manifest rejects invalid override names and values") {
    ManifestInputs bad_name;
    bad_name.overrides = {{"Bad Name", "x"}};
    auto result = synthesize_manifest(bad_name);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("Bad Name") != std::string::npos);

    ManifestInputs bad_value;
    bad_value.overrides = {{"X-Note", "line\nbreak"}};
    CHECK_FALSE(synthesize_manifest(bad_value).ok);
}

TEST_CASE("is_valid_attribute_name") {
    CHECK(is_valid_attribute_name("Main-Class"));
    CHECK(is_valid_attribute_name("X_Custom-1"));
    CHECK_FALSE(is_valid_attribute_name(""));
    CHECK_FALSE(is_valid_attribute_name("Has:Colon"));
    CHECK_FALSE(is_valid_attribute_name(std::string(71, 'a')));
    CHECK(is_valid_attribute_name(std::string(70, 'a')));
}

TEST_CASE("serialize_manifest writes Manifest-Version first with CRLF endings") {
    ManifestAttributes attrs;
    attrs.set("Created-By", "uberpack");
    attrs.set("Manifest-Version", "1.0");

    CHECK(serialize_manifest(attrs) == "Manifest-Version: 1.0\r\nCreated-By: uberpack\r\n\r\n");
}

TEST_CASE("serialize_manifest continues long lines") {
    ManifestAttributes attrs;
    attrs.set("Manifest-Version", "1.0");
    attrs.set("X-Long", std::string(100, 'a'));

    std::string text = serialize_manifest(attrs);

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find("\r\n", start);
        REQUIRE(end != std::string::npos);
        CHECK(end - start <= MANIFEST_LINE_LIMIT);
        start = end + 2;
    }
    CHECK(text.find("\r\n a") != std::string::npos);

    auto parsed = parse_manifest(text);
    REQUIRE(parsed.ok);
    CHECK(*parsed.attributes.get("X-Long") == std::string(100, 'a'));
}

TEST_CASE("serialize_manifest never splits a multi-byte character") {
    ManifestAttributes attrs;
    attrs.set("Manifest-Version", "1.0");
    // "X: " is 3 bytes, so a 2-byte character straddles byte 72
    std::string value = std::string(68, 'a') + "\xC3\xA9" + "tail";
    attrs.set("X", value);

    std::string text = serialize_manifest(attrs);
    CHECK(text.find("\xC3\r\n") == std::string::npos);

    auto parsed = parse_manifest(text);
    REQUIRE(parsed.ok);
    CHECK(*parsed.attributes.get("X") == value);
}

TEST_CASE("parse_manifest rejects malformed lines") {
    CHECK_FALSE(parse_manifest("Manifest-Version 1.0\r\n\r\n").ok);
    CHECK_FALSE(parse_manifest(" continuation\r\n").ok);
}

TEST_CASE("has_multi_release_marker looks for META-INF/versions") {
    fs::path dir = fs::temp_directory_path() / ("uberpack_manifest_" + generate_uuid());
    fs::create_directories(dir / "META-INF");

    CHECK_FALSE(has_multi_release_marker(dir.string()));
    fs::create_directories(dir / "META-INF" / "versions" / "11");
    CHECK(has_multi_release_marker(dir.string()));

    std::error_code ec;
    fs::remove_all(dir, ec);
}
