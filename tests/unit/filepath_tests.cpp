#include <doctest/doctest.h>
#include <pathsafe/filepath.hpp>

using namespace pathsafe;

namespace {

EngineOptions on(Platform p) {
    EngineOptions o;
    o.platform = p;
    return o;
}

SanitizerOptions sanitize_on(Platform p) {
    SanitizerOptions o;
    o.platform = p;
    return o;
}

ErrorReason reason_of(const std::string& path, Platform p) {
    auto r = validate_filepath(path, on(p));
    REQUIRE(r.isErr());
    return r.error().reason();
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("valid relative paths") {
    CHECK(is_valid_filepath("a/b/c.txt"));
    CHECK(is_valid_filepath("a\\b\\c.txt", on(Platform::Windows)));
    CHECK(is_valid_filepath("../x/./y", on(Platform::Linux)));
    CHECK(is_valid_filepath(std::filesystem::path("dir/file")));
}

TEST_CASE("absolute paths per platform") {
    CHECK(is_valid_filepath("/usr/local/bin", on(Platform::Linux)));
    CHECK(is_valid_filepath("/Users/me", on(Platform::macOS)));
    CHECK(is_valid_filepath("C:\\Users\\me", on(Platform::Windows)));
    CHECK(is_valid_filepath("C:/Users/me", on(Platform::Windows)));
    CHECK(is_valid_filepath("\\\\server\\share\\dir", on(Platform::Windows)));

    CHECK(reason_of("C:\\a\\b", Platform::Linux) == ErrorReason::MALFORMED_ABS_PATH);
    CHECK(reason_of("C:\\a\\b", Platform::POSIX) == ErrorReason::MALFORMED_ABS_PATH);
    CHECK(reason_of("/a/b", Platform::Windows) == ErrorReason::MALFORMED_ABS_PATH);
    CHECK(reason_of("/a/b", Platform::Universal) == ErrorReason::MALFORMED_ABS_PATH);
    CHECK(reason_of("C:\\a\\b", Platform::Universal) == ErrorReason::MALFORMED_ABS_PATH);
}

TEST_CASE("malformed absolute path message names both styles") {
    auto r = validate_filepath("/a/b", on(Platform::Universal));
    REQUIRE(r.isErr());
    CHECK(r.error().description().find("POSIX style absolute file path found") == 0);
    CHECK(r.error().description().find("platform-independent") != std::string::npos);

    auto w = validate_filepath("C:\\a", on(Platform::Linux));
    REQUIRE(w.isErr());
    CHECK(w.error().description().find("Windows style absolute file path found") == 0);
}

TEST_CASE("drive-relative path on windows") {
    CHECK(is_valid_filepath("C:", on(Platform::Windows)));
    CHECK(is_valid_filepath("C:file.txt", on(Platform::Windows)));
    CHECK(reason_of("C:file.txt", Platform::Universal) == ErrorReason::INVALID_CHARACTER);
}

TEST_CASE("empty and whitespace paths") {
    CHECK(reason_of("", Platform::Linux) == ErrorReason::NULL_NAME);
    CHECK(reason_of(" ", Platform::Windows) == ErrorReason::NULL_NAME);
    CHECK(is_valid_filepath(" ", on(Platform::Linux)));
}

TEST_CASE("path length limits per platform") {
    std::string linux_max(4096, 'a');
    auto r = validate_filepath(linux_max + "a", on(Platform::Linux));
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::INVALID_LENGTH);
    CHECK(r.error().description() == "file path is too long: expected<=4096, actual=4097");

    std::string posix_path;
    while (posix_path.size() < 1024) {
        posix_path += "abcdefg/";
    }
    posix_path.resize(1024);
    posix_path.back() = 'x';
    CHECK(is_valid_filepath(posix_path, on(Platform::POSIX)));
    CHECK(reason_of(posix_path + "y", Platform::macOS) == ErrorReason::INVALID_LENGTH);
    CHECK(reason_of(std::string(261, 'a'), Platform::Windows) == ErrorReason::INVALID_LENGTH);
}

TEST_CASE("length is measured without the drive") {
    EngineOptions o = on(Platform::Windows);
    o.max_len = 5;
    CHECK(is_valid_filepath("C:\\abcd", o));
    CHECK_FALSE(is_valid_filepath("C:\\abcde", o));
}

TEST_CASE("reserved names in any component") {
    auto r = validate_filepath("C:\\Users\\CON.txt", on(Platform::Windows));
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::RESERVED_NAME);
    CHECK(r.error().reservedName() == "CON");

    CHECK(reason_of("a/lpt1/b", Platform::Universal) == ErrorReason::RESERVED_NAME);
    CHECK(is_valid_filepath("a/lpt1/b", on(Platform::Linux)));

    EngineOptions o = on(Platform::Windows);
    o.check_reserved = false;
    CHECK(is_valid_filepath("a\\CON\\b", o));
}

TEST_CASE("colon token on macOS") {
    CHECK(reason_of("a/:", Platform::macOS) == ErrorReason::RESERVED_NAME);
    CHECK(is_valid_filepath("a/b:c", on(Platform::Linux)));
    CHECK(is_valid_filepath("a/b:c", on(Platform::macOS)));
}

TEST_CASE("invalid characters in the path") {
    auto r = validate_filepath("a/b?/c", on(Platform::Windows));
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::INVALID_CHARACTER);
    CHECK(r.error().invalidChars() == "?");

    CHECK(is_valid_filepath("a/b?/c", on(Platform::Linux)));
    CHECK(reason_of(std::string("a/\x01"), Platform::Linux) == ErrorReason::INVALID_CHARACTER);
}

TEST_CASE("NTFS metafiles at the volume root") {
    CHECK(reason_of("$Mft", Platform::Windows) == ErrorReason::RESERVED_NAME);
    CHECK(reason_of("C:\\$MFT", Platform::Windows) == ErrorReason::RESERVED_NAME);
    CHECK(reason_of("$Extend", Platform::Universal) == ErrorReason::RESERVED_NAME);
    CHECK(is_valid_filepath("dir\\$Mft", on(Platform::Windows)));
    CHECK(is_valid_filepath("$Mft", on(Platform::Linux)));
}

TEST_CASE("validate_abspath alone") {
    FilePathValidator v(on(Platform::Windows));
    CHECK(v.validate_abspath("C:\\a").isOk());
    CHECK(v.validate_abspath("relative").isOk());
    CHECK(v.validate_abspath("/abs").isErr());
}

// ============================================================================
// Sanitization
// ============================================================================

TEST_CASE("sanitize windows path") {
    auto r = sanitize_filepath("C:/a/./b/../c?", "", sanitize_on(Platform::Windows));
    REQUIRE(r.isOk());
    CHECK(r.value() == "C:\\a\\c");
}

TEST_CASE("sanitize normalizes and joins with the platform separator") {
    auto linux_opts = sanitize_on(Platform::Linux);
    CHECK(sanitize_filepath("a//b/./c/", "", linux_opts).value() == "a/b/c");
    CHECK(sanitize_filepath("/a/../..", "", linux_opts).value() == "/");
    CHECK(sanitize_filepath("/tmp/x", "", linux_opts).value() == "/tmp/x");
    CHECK(sanitize_filepath("a\\b", "", sanitize_on(Platform::Windows)).value() == "a\\b");
}

TEST_CASE("sanitize without normalization keeps dot segments") {
    SanitizerOptions o = sanitize_on(Platform::Linux);
    o.normalize = false;
    CHECK(sanitize_filepath("a/./b", "", o).value() == "a/./b");
    CHECK(sanitize_filepath("a//b", "", o).value() == "a/b");
}

TEST_CASE("sanitize replaces invalid characters") {
    CHECK(sanitize_filepath("a/b:c*d", "_").value() == "a/b_c_d");
    CHECK(sanitize_filepath("fi:l*e/p\"a?t>h|.t<xt").value() == "file/path.txt");
    CHECK(sanitize_filepath(std::string("a/\x01" "b"), "", sanitize_on(Platform::Linux)).value() ==
          "a/b");
}

TEST_CASE("sanitize reserved components") {
    auto win = sanitize_on(Platform::Windows);
    CHECK(sanitize_filepath("a/CON/b", "", win).value() == "a\\CON_\\b");
    CHECK(sanitize_filepath("C:\\dir\\lpt1.txt", "", win).value() == "C:\\dir\\lpt1_.txt");
    CHECK(sanitize_filepath("$Mft", "", win).value() == "$Mft_");
    CHECK(sanitize_filepath("\\$mft", "", win).value() == "\\$mft_");
}

TEST_CASE("sanitize strips trailing periods per component on windows") {
    CHECK(sanitize_filepath("a /b.", "", sanitize_on(Platform::Windows)).value() == "a\\b");
}

TEST_CASE("sanitize keeps the UNC share") {
    auto r = sanitize_filepath("\\\\server\\share\\d?ir\\f", "", sanitize_on(Platform::Windows));
    REQUIRE(r.isOk());
    CHECK(r.value() == "\\\\server\\share\\dir\\f");
}

TEST_CASE("sanitize propagates malformed absolute paths") {
    auto r = sanitize_filepath("/etc/passwd");
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::MALFORMED_ABS_PATH);

    auto w = sanitize_filepath("C:\\x", "", sanitize_on(Platform::Linux));
    REQUIRE(w.isErr());
    CHECK(w.error().reason() == ErrorReason::MALFORMED_ABS_PATH);
}

TEST_CASE("sanitize empty paths") {
    CHECK(sanitize_filepath("").value() == "");
    CHECK(sanitize_filepath("???").value() == "");

    SanitizerOptions raise;
    raise.null_value_handler = raise_error;
    auto r = sanitize_filepath("", "", raise);
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::NULL_NAME);

    auto emptied = sanitize_filepath("|*", "", raise);
    REQUIRE(emptied.isErr());
    CHECK(emptied.error().reason() == ErrorReason::NULL_NAME);

    auto p = sanitize_filepath(std::filesystem::path(""));
    REQUIRE(p.isErr());
    CHECK(p.error().reason() == ErrorReason::NULL_NAME);
}

TEST_CASE("sanitize returns a path for path input") {
    auto r = sanitize_filepath(std::filesystem::path("a/b?c"), "_");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::filesystem::path("a/b_c"));
}

TEST_CASE("sanitize truncates long components") {
    std::string component(300, 'x');
    auto r = sanitize_filepath("dir/" + component, "", sanitize_on(Platform::Linux));
    REQUIRE(r.isOk());
    CHECK(r.value() == "dir/" + std::string(255, 'x'));
}

TEST_CASE("sanitize truncates components to max_len") {
    SanitizerOptions o = sanitize_on(Platform::Linux);
    o.max_len = 10;
    auto r = sanitize_filepath("abcdefghijklmnop", "", o);
    REQUIRE(r.isOk());
    CHECK(r.value() == "abcdefghij");

    // a path limit above the filename ceiling still cuts components at 255
    SanitizerOptions wide = sanitize_on(Platform::Linux);
    wide.max_len = 1000;
    wide.min_len = 300;
    FilePathSanitizer sanitizer(wide);
    CHECK(sanitizer.config().max_len == 1000);
}

TEST_CASE("sanitize passes validate_after_sanitize to components") {
    SanitizerOptions o = sanitize_on(Platform::Linux);
    o.min_len = 3;
    CHECK(sanitize_filepath("ab/cd", "", o).isOk());

    o.validate_after_sanitize = true;
    auto r = sanitize_filepath("ab/cdef", "", o);
    REQUIRE(r.isErr());
    CHECK(r.error().reason() == ErrorReason::INVALID_LENGTH);
}

TEST_CASE("sanitize surfaces residual length failures") {
    auto r = sanitize_filepath(std::string(300, 'a'), "", sanitize_on(Platform::Universal));
    // the component is cut to 255, which fits within 260
    REQUIRE(r.isOk());
    CHECK(r.value().size() == 255);

    SanitizerOptions o = sanitize_on(Platform::Linux);
    o.max_len = 10;
    auto tight = sanitize_filepath("abcdef/ghijkl", "", o);
    REQUIRE(tight.isErr());
    CHECK(tight.error().reason() == ErrorReason::INVALID_LENGTH);
}
