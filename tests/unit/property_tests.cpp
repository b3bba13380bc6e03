#include <doctest/doctest.h>
#include <pathsafe/pathsafe.hpp>

#include <vector>

using namespace pathsafe;

namespace {

const Platform kPlatforms[] = {Platform::POSIX, Platform::Linux, Platform::Windows,
                               Platform::macOS, Platform::Universal};

const std::vector<std::string> kNames = {
    "simple.txt",      "a:b*c?d",        "CON",          "lpt9.log",    "trailing. ",
    "...",             " lead",          "x/y\\z",       "\t\n",        "$Mft",
    "com1.",           "na|me<>.txt",    "\xe3\x81\x82", "a\x7f" "b",   ":",
};

const std::vector<std::string> kPaths = {
    "a/b/c.txt",       "a//b/./c/../d",  "dir/CON/x",    "dir\\lpt1.txt", "x?/y*",
    "a /b.",           "$Extend",        "../up/../x",   "C:rel\\f?",     "n:|m",
};

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

} // namespace

TEST_CASE("filename sanitize is idempotent") {
    for (auto platform : kPlatforms) {
        for (const auto& name : kNames) {
            for (const char* replacement : {"", "_"}) {
                CAPTURE(name);
                auto once = sanitize_filename(name, replacement, sanitize_on(platform));
                REQUIRE(once.isOk());
                auto twice = sanitize_filename(once.value(), replacement, sanitize_on(platform));
                REQUIRE(twice.isOk());
                CHECK(twice.value() == once.value());
            }
        }
    }
}

TEST_CASE("filename sanitize result is valid") {
    for (auto platform : kPlatforms) {
        for (const auto& name : kNames) {
            CAPTURE(name);
            auto sanitized = sanitize_filename(name, "_", sanitize_on(platform));
            REQUIRE(sanitized.isOk());
            if (!sanitized.value().empty()) {
                CHECK(is_valid_filename(sanitized.value(), on(platform)));
            }
        }
    }
}

TEST_CASE("filepath sanitize is idempotent and valid") {
    for (auto platform : kPlatforms) {
        for (const auto& path : kPaths) {
            CAPTURE(path);
            auto once = sanitize_filepath(path, "_", sanitize_on(platform));
            REQUIRE(once.isOk());
            auto twice = sanitize_filepath(once.value(), "_", sanitize_on(platform));
            REQUIRE(twice.isOk());
            CHECK(twice.value() == once.value());
            if (!once.value().empty()) {
                CHECK(is_valid_filepath(once.value(), on(platform)));
            }
        }
    }
}

TEST_CASE("every invalid filename character is caught and replaced") {
    for (auto platform : kPlatforms) {
        auto profile = make_platform_profile(platform);
        for (char c : profile.invalid_filename_chars) {
            std::string name = std::string("A") + c + "B";
            CAPTURE(static_cast<int>(static_cast<unsigned char>(c)));
            auto r = validate_filename(name, on(platform));
            REQUIRE(r.isErr());
            CHECK(r.error().reason() == ErrorReason::INVALID_CHARACTER);
            CHECK(sanitize_filename(name, "_", sanitize_on(platform)).value() == "A_B");
            CHECK(sanitize_filename(name, "", sanitize_on(platform)).value() == "AB");
        }
    }
}

TEST_CASE("every invalid path character is caught and replaced") {
    for (auto platform : kPlatforms) {
        auto profile = make_platform_profile(platform);
        // "A:B" is a drive-relative path on Windows, so use a longer prefix
        std::string prefix = platform == Platform::Windows ? "AA" : "A";
        for (char c : profile.invalid_path_chars) {
            std::string path = prefix + c + "B";
            CAPTURE(static_cast<int>(static_cast<unsigned char>(c)));
            auto r = validate_filepath(path, on(platform));
            REQUIRE(r.isErr());
            CHECK(r.error().reason() == ErrorReason::INVALID_CHARACTER);
            CHECK(sanitize_filepath(path, "_", sanitize_on(platform)).value() == prefix + "_B");
        }
    }
}

TEST_CASE("valid characters are never changed") {
    std::string printable;
    for (char c = 0x20; c < 0x7F; ++c) {
        printable += c;
    }
    for (auto platform : kPlatforms) {
        auto profile = make_platform_profile(platform);
        for (char c : printable) {
            if (profile.is_invalid_filename_char(c) || c == ' ' || c == '.') {
                continue;
            }
            std::string name = std::string("A") + c + "B";
            CAPTURE(name);
            CHECK(sanitize_filename(name, "_", sanitize_on(platform)).value() == name);
        }
    }
}

TEST_CASE("length boundaries") {
    for (auto platform : kPlatforms) {
        auto profile = make_platform_profile(platform);

        CHECK(is_valid_filename(std::string(profile.max_filename_len, 'a'), on(platform)));
        CHECK_FALSE(is_valid_filename(std::string(profile.max_filename_len + 1, 'a'),
                                      on(platform)));

        std::string path;
        while (path.size() < profile.max_path_len) {
            path += "abcd/";
        }
        path.resize(profile.max_path_len);
        if (path.back() == '/') {
            path.back() = 'z';
        }
        CHECK(is_valid_filepath(path, on(platform)));
        CHECK_FALSE(is_valid_filepath(path + "z", on(platform)));
    }

    EngineOptions o;
    o.min_len = 3;
    CHECK_FALSE(is_valid_filename("ab", o));
    CHECK(is_valid_filename("abc", o));
}

TEST_CASE("reserved device names") {
    for (const char* name : {"CON", "com1", "LPT9.txt"}) {
        CHECK_FALSE(is_valid_filename(name, on(Platform::Windows)));
        CHECK_FALSE(is_valid_filename(name, on(Platform::Universal)));
    }
    auto win = sanitize_on(Platform::Windows);
    CHECK(sanitize_filename("CON", "", win).value() == "CON_");
    CHECK(sanitize_filename("com1", "", win).value() == "com1_");
    CHECK(sanitize_filename("LPT9.txt", "", win).value() == "LPT9_.txt");
}

TEST_CASE("absolute path consistency") {
    CHECK_FALSE(is_valid_filepath("C:\\a\\b", on(Platform::Linux)));
    CHECK_FALSE(is_valid_filepath("/a/b", on(Platform::Windows)));
    CHECK_FALSE(is_valid_filepath("C:\\a\\b", on(Platform::Universal)));
    CHECK_FALSE(is_valid_filepath("/a/b", on(Platform::Universal)));
}

TEST_CASE("null handling") {
    for (auto platform : kPlatforms) {
        auto name = validate_filename("", on(platform));
        REQUIRE(name.isErr());
        CHECK(name.error().reason() == ErrorReason::NULL_NAME);

        auto path = validate_filepath("", on(platform));
        REQUIRE(path.isErr());
        CHECK(path.error().reason() == ErrorReason::NULL_NAME);

        CHECK(sanitize_filename("", "", sanitize_on(platform)).value() == "");
    }
}
