#include <doctest/doctest.h>
#include <pathsafe/cli11.hpp>

using namespace pathsafe;

namespace {

EngineOptions windows() {
    EngineOptions o;
    o.platform = Platform::Windows;
    return o;
}

SanitizerOptions windows_sanitizer() {
    SanitizerOptions o;
    o.platform = Platform::Windows;
    return o;
}

} // namespace

TEST_CASE("filename validator passes valid names") {
    cli11::FilenameValidator v(windows());
    std::string value = "report.txt";
    CHECK(v(value).empty());
    CHECK(value == "report.txt");
}

TEST_CASE("filename validator reports the error description") {
    cli11::FilenameValidator v(windows());
    std::string value = "a*b";
    CHECK(v(value) == "invalids=('*'), value='a*b'");
}

TEST_CASE("validators pass empty arguments through") {
    std::string empty;
    CHECK(cli11::FilenameValidator()(empty).empty());
    CHECK(cli11::FilepathValidator()(empty).empty());
    CHECK(cli11::FilenameSanitizer()(empty).empty());
    CHECK(empty.empty());
}

TEST_CASE("filepath validator on an option") {
    CLI::App app{"test"};
    std::string out;
    EngineOptions linux_opts;
    linux_opts.platform = Platform::Linux;
    app.add_option("--out", out)->check(cli11::FilepathValidator(linux_opts));

    CHECK_NOTHROW(app.parse("--out /tmp/report.json", false));
    CHECK(out == "/tmp/report.json");

    CLI::App strict{"test"};
    std::string bad;
    strict.add_option("--out", bad)->check(cli11::FilepathValidator(linux_opts));
    const char* argv[] = {"test", "--out", "C:\\report.json"};
    CHECK_THROWS_AS(strict.parse(3, argv), CLI::ValidationError);
}

TEST_CASE("filename sanitizer rewrites the argument") {
    CLI::App app{"test"};
    std::string name;
    app.add_option("--name", name)->transform(cli11::FilenameSanitizer("_", windows_sanitizer()));

    app.parse("--name CON", false);
    CHECK(name == "CON_");
}

TEST_CASE("filepath sanitizer rewrites in place") {
    cli11::FilepathSanitizer s("", windows_sanitizer());
    std::string value = "C:/a/../b?";
    CHECK(s(value).empty());
    CHECK(value == "C:\\b");
}

TEST_CASE("filepath sanitizer reports unrecoverable input") {
    cli11::FilepathSanitizer s;
    std::string value = "/etc/passwd";
    CHECK_FALSE(s(value).empty());
    CHECK(value == "/etc/passwd");
}
