#include <doctest/doctest.h>
#include <uberpack/config.hpp>
#include <uberpack/manifest.hpp>
#include <uberpack/uber.hpp>

#include "../support/test_helpers.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

using namespace uberpack;
using uberpack::test::TempDir;
using uberpack::test::archive_entry;
using uberpack::test::archive_names;
using uberpack::test::contains_name;
using uberpack::test::make_archive;
using uberpack::test::write_text;

namespace {

LibraryNode lib(const std::string& coordinate, std::vector<std::string> paths,
                bool optional = false, std::vector<Coordinate> dependents = {}) {
    LibraryNode node;
    node.coordinate = coordinate;
    node.paths = std::move(paths);
    node.optional = optional;
    node.dependents = std::move(dependents);
    return node;
}

// depA (directory), depB (archive) and compiled output, as a project would have
struct Project {
    TempDir tmp;
    std::string work_root;

    Project() {
        work_root = tmp / "work";
        fs::create_directories(work_root);

        write_text(tmp / "deps/depA/foo.txt", "1");
        write_text(tmp / "deps/depA/data_readers.clj", "{x y}");
        make_archive(tmp / "deps/depB.jar", {{"META-INF/", ""},
                                             {"META-INF/MANIFEST.MF", "Manifest-Version: 1.0\r\n\r\n"},
                                             {"META-INF/DEPB.SF", "signature"},
                                             {"foo.txt", "2"},
                                             {"data_readers.clj", "{z w}"},
                                             {"depb/core.clj", "(ns depb.core)"}});
        write_text(tmp / "target/classes/my_app/core.clj", "(ns my-app.core)");
        write_text(tmp / "target/classes/project.clj", "(defproject my-app)");
    }

    UberParams params() const {
        UberParams p;
        p.libs = {lib("dep/a", {tmp / "deps/depA"}), lib("dep/b", {"deps/depB.jar"})};
        p.class_dir = "target/classes";
        p.uber_file = "target/app.jar";
        p.project_root = tmp.path();
        p.build_jdk_spec = "17";
        p.work_root = work_root;
        return p;
    }

    bool work_root_empty() const { return fs::is_empty(work_root); }
};

ManifestAttributes read_manifest(const std::string& archive) {
    auto parsed = parse_manifest(archive_entry(archive, "META-INF/MANIFEST.MF"));
    return parsed.attributes;
}

} // namespace

TEST_CASE("uber assembles libraries and compiled output into one archive") {
    Project project;
    auto params = project.params();
    params.main = "my-app.core";

    auto result = uber(params);
    REQUIRE_MESSAGE(result.ok, result.error);

    std::string jar = project.tmp / "target/app.jar";
    CHECK(result.uber_file == jar);
    REQUIRE(fs::exists(jar));

    auto names = archive_names(jar);
    REQUIRE_FALSE(names.empty());
    CHECK(names[0] == "META-INF/MANIFEST.MF");

    CHECK(archive_entry(jar, "foo.txt") == "1");
    CHECK(archive_entry(jar, "data_readers.clj") == "{x y, z w}\n");
    CHECK(archive_entry(jar, "depb/core.clj") == "(ns depb.core)");
    CHECK(archive_entry(jar, "my_app/core.clj") == "(ns my-app.core)");

    CHECK_FALSE(contains_name(names, "project.clj"));
    CHECK_FALSE(contains_name(names, "META-INF/DEPB.SF"));
    CHECK(std::count(names.begin(), names.end(), "META-INF/MANIFEST.MF") == 1);

    auto manifest = read_manifest(jar);
    CHECK(*manifest.get("Manifest-Version") == "1.0");
    CHECK(*manifest.get("Created-By") == "uberpack");
    CHECK(*manifest.get("Build-Jdk-Spec") == "17");
    CHECK(*manifest.get("Main-Class") == "my_app.core");
    CHECK_FALSE(manifest.contains("Multi-Release"));

    CHECK(result.conflicts_dropped == 1);
    CHECK(result.files_merged == 1);
    CHECK(result.entries_excluded == 3);
    CHECK(result.entries_written == names.size());
}

TEST_CASE("uber extracts libraries in order with compiled output last") {
    Project project;
    write_text(project.tmp / "target/classes/foo.txt", "compiled");

    auto result = uber(project.params());
    REQUIRE(result.ok);

    REQUIRE(result.sources.size() == 3);
    CHECK(result.sources[0] == project.tmp / "deps/depA");
    CHECK(result.sources[1] == project.tmp / "deps/depB.jar");
    CHECK(result.sources[2] == project.tmp / "target/classes");
    CHECK(archive_entry(result.uber_file, "foo.txt") == "1");
}

TEST_CASE("uber writes directories before their contents in sorted order") {
    Project project;
    auto result = uber(project.params());
    REQUIRE(result.ok);

    // The manifest leads; everything after it is sorted
    auto names = archive_names(result.uber_file);
    REQUIRE(names.size() > 2);
    CHECK(names[0] == "META-INF/MANIFEST.MF");
    CHECK(names[1] == "META-INF/");
    for (size_t i = 2; i < names.size(); ++i) {
        CHECK(names[i - 1] < names[i]);
    }
    auto dir = std::find(names.begin(), names.end(), "my_app/");
    auto file = std::find(names.begin(), names.end(), "my_app/core.clj");
    REQUIRE(dir != names.end());
    REQUIRE(file != names.end());
    CHECK(dir < file);
}

TEST_CASE("uber leaves out optional libraries") {
    Project project;
    make_archive(project.tmp / "deps/opt.jar", {{"opt/only.clj", "(ns opt.only)"}});
    make_archive(project.tmp / "deps/via-opt.jar", {{"via/opt.clj", "(ns via.opt)"}});

    auto params = project.params();
    params.libs.push_back(lib("opt/tool", {project.tmp / "deps/opt.jar"}, true));
    params.libs.push_back(lib("via/opt", {project.tmp / "deps/via-opt.jar"}, false, {"opt/tool"}));

    auto result = uber(params);
    REQUIRE(result.ok);
    CHECK(result.pruned.size() == 2);

    auto names = archive_names(result.uber_file);
    CHECK_FALSE(contains_name(names, "opt/only.clj"));
    CHECK_FALSE(contains_name(names, "via/opt.clj"));
    CHECK(contains_name(names, "depb/core.clj"));
}

TEST_CASE("uber applies manifest overrides last") {
    Project project;
    auto params = project.params();
    params.main = "my-app.core";
    params.manifest = {{"Main-Class", "other.Launcher"}, {"Implementation-Title", "my-app"}};

    auto result = uber(params);
    REQUIRE(result.ok);

    auto manifest = read_manifest(result.uber_file);
    CHECK(*manifest.get("Main-Class") == "other.Launcher");
    CHECK(*manifest.get("Implementation-Title") == "my-app");
}

TEST_CASE("uber marks multi-release archives") {
    Project project;
    make_archive(project.tmp / "deps/mr.jar", {{"META-INF/versions/11/a/B.class", "11"}});

    auto params = project.params();
    params.libs.push_back(lib("mr/lib", {project.tmp / "deps/mr.jar"}));

    auto result = uber(params);
    REQUIRE(result.ok);
    CHECK(*read_manifest(result.uber_file).get("Multi-Release") == "true");
}

TEST_CASE("uber removes its working directory after success") {
    Project project;
    auto result = uber(project.params());
    REQUIRE(result.ok);
    CHECK_FALSE(result.working_dir.empty());
    CHECK_FALSE(fs::exists(result.working_dir));
    CHECK(project.work_root_empty());
}

TEST_CASE("uber removes its working directory after failure") {
    Project project;
    auto params = project.params();
    params.libs.push_back(lib("gone/lib", {project.tmp / "deps/gone.jar"}));

    auto result = uber(params);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("gone.jar") != std::string::npos);
    CHECK(project.work_root_empty());
    CHECK_FALSE(fs::exists(project.tmp / "target/app.jar"));
}

TEST_CASE("uber fails when the compiled output is missing") {
    Project project;
    fs::remove_all(project.tmp / "target/classes");

    auto result = uber(project.params());
    CHECK_FALSE(result.ok);
    CHECK(project.work_root_empty());
}

TEST_CASE("uber rejects invalid manifest overrides") {
    Project project;
    auto params = project.params();
    params.manifest = {{"Not Valid", "x"}};

    auto result = uber(params);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("Not Valid") != std::string::npos);
    CHECK(project.work_root_empty());
}

TEST_CASE("uber reports conflicts through the warning collector") {
    Project project;
    WarningCollector collector;
    auto params = project.params();
    params.warnings = &collector;

    auto result = uber(params);
    REQUIRE(result.ok);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].key == "merge_conflict");
    CHECK(warnings[0].fields.at("entry") == "foo.txt");
    CHECK(warnings[1].key == "data_readers_merged");
}

TEST_CASE("uber fails in strict mode on a dropped conflict") {
    Project project;
    WarningCollector collector;
    collector.apply_override("merge_conflict", WarningAction::Error);
    auto params = project.params();
    params.warnings = &collector;

    auto result = uber(params);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("merge_conflict") != std::string::npos);
    CHECK(project.work_root_empty());
}

TEST_CASE("uber warns about dependents missing from the library map") {
    Project project;
    WarningCollector collector;
    auto params = project.params();
    params.libs[0].dependents = {"not/resolved"};
    params.warnings = &collector;

    auto result = uber(params);
    REQUIRE(result.ok);
    bool found = false;
    for (const auto& w : collector.get_warnings()) {
        if (w.key == "unknown_dependent") {
            found = true;
            CHECK(w.fields.at("coordinate") == "dep/a");
        }
    }
    CHECK(found);
}

TEST_CASE("uber builds from a parsed basis and params") {
    Project project;
    std::string basis_json = R"({"libs": {
        "dep/a": {"paths": [")" + (project.tmp / "deps/depA") + R"("]},
        "dep/b": {"paths": [")" + (project.tmp / "deps/depB.jar") + R"("]}
    }})";
    std::string params_json = R"({"main": "my-app.core", "uber_file": "dist/standalone.jar",
                                  "manifest": {"X-Build": 42}})";

    auto basis = parse_basis(basis_json);
    REQUIRE(basis.ok);
    auto parsed = parse_params(params_json);
    REQUIRE(parsed.ok);
    parsed.params.project_root = project.tmp.path();

    auto params = merge_params(get_builtin_defaults(), parsed.params, basis.libs);
    params.build_jdk_spec = "21";
    params.work_root = project.work_root;

    auto result = uber(params);
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.uber_file == project.tmp / "dist/standalone.jar");
    CHECK(archive_entry(result.uber_file, "foo.txt") == "1");

    auto manifest = read_manifest(result.uber_file);
    CHECK(*manifest.get("Main-Class") == "my_app.core");
    CHECK(*manifest.get("X-Build") == "42");
    CHECK(*manifest.get("Build-Jdk-Spec") == "21");
}

TEST_CASE("uber creates the destination directory before extracting") {
    Project project;
    auto params = project.params();
    params.class_dir = "missing/classes";
    params.uber_file = "out/nested/app.jar";

    auto result = uber(params);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("source not found") != std::string::npos);
    CHECK(fs::is_directory(project.tmp / "out/nested"));
}

TEST_CASE("uber reports an unusable destination directory before extracting") {
    Project project;
    write_text(project.tmp / "blocked", "a file, not a directory");
    auto params = project.params();
    params.class_dir = "missing/classes";
    params.uber_file = "blocked/app.jar";

    auto result = uber(params);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("blocked") != std::string::npos);
    CHECK(result.error.find("source not found") == std::string::npos);
    CHECK(project.work_root_empty());
}

namespace {

// Restores the process working directory on scope exit
struct CurrentPathGuard {
    fs::path saved = fs::current_path();
    ~CurrentPathGuard() {
        std::error_code ec;
        fs::current_path(saved, ec);
    }
};

} // namespace

TEST_CASE("uber fails cleanly when the current directory is gone") {
    Project project;
    auto params = project.params();
    params.project_root.clear();
    params.libs = {lib("dep/a", {project.tmp / "deps/depA"})};
    params.class_dir = project.tmp / "target/classes";
    params.uber_file = "app.jar";

    UberResult result;
    {
        CurrentPathGuard guard;
        std::string gone = project.tmp / "gone";
        fs::create_directories(gone);
        fs::current_path(gone);
        fs::remove(gone);

        result = uber(params);
    }

    CHECK_FALSE(result.ok);
    CHECK(result.error.find("current directory") != std::string::npos);
    CHECK(project.work_root_empty());
}

TEST_CASE("uber writes archives with more than 65535 entries") {
    Project project;
    uberpack::test::ArchiveFiles files;
    const size_t count = 66000;
    files.reserve(count + 1);
    for (size_t i = 0; i < count; ++i) {
        files.emplace_back("many/" + std::to_string(i) + "/", "");
    }
    files.emplace_back("many/last.txt", "last");
    REQUIRE(make_archive(project.tmp / "deps/many.jar", files));

    auto params = project.params();
    params.libs.push_back(lib("dep/many", {"deps/many.jar"}));

    auto result = uber(params);
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.entries_written > 65535);

    auto names = archive_names(result.uber_file);
    CHECK(names.size() == result.entries_written);
    CHECK(names[0] == "META-INF/MANIFEST.MF");
    CHECK(archive_entry(result.uber_file, "many/last.txt") == "last");
    CHECK(archive_entry(result.uber_file, "foo.txt") == "1");
}
