#include <catch2/catch_test_macros.hpp>

#include "html_links.hpp"
#include "url_utils.hpp"

TEST_CASE("resolve_url handles relative directory and file links") {
    const std::string page = "https://host.example/files/No-Intro/";
    CHECK(resolve_url(page, "Nintendo%20-%20Game%20Boy/") ==
          std::optional<std::string>("https://host.example/files/No-Intro/Nintendo%20-%20Game%20Boy/"));
    CHECK(resolve_url(page, "a.zip") == std::optional<std::string>("https://host.example/files/No-Intro/a.zip"));
    CHECK(resolve_url(page, "../") == std::optional<std::string>("https://host.example/files/"));
    CHECK(resolve_url(page, "sub/../b.bin") == std::optional<std::string>("https://host.example/files/No-Intro/b.bin"));
}

TEST_CASE("resolve_url handles absolute, host-absolute and scheme-relative links") {
    const std::string page = "https://host.example/files/dir/";
    CHECK(resolve_url(page, "/other/x.bin") == std::optional<std::string>("https://host.example/other/x.bin"));
    CHECK(resolve_url(page, "//mirror.example/files/") == std::optional<std::string>("https://mirror.example/files/"));
    CHECK(resolve_url(page, "http://elsewhere.example/y") == std::optional<std::string>("http://elsewhere.example/y"));
}

TEST_CASE("resolve_url drops fragments and keeps queries") {
    const std::string page = "https://host.example/dir/";
    CHECK(resolve_url(page, "file.bin#top") == std::optional<std::string>("https://host.example/dir/file.bin"));
    CHECK(resolve_url(page, "?C=M;O=A") == std::optional<std::string>("https://host.example/dir/?C=M;O=A"));
    CHECK_FALSE(resolve_url("not a url", "x").has_value());
}

TEST_CASE("percent_decode decodes escapes and leaves malformed ones") {
    CHECK(percent_decode("Game%20%28Europe%29.zip") == "Game (Europe).zip");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz%4") == "%zz%4");
    CHECK(percent_decode("a+b") == "a+b");
}

TEST_CASE("relative_path_for strips the root, decodes and normalizes") {
    const std::string root = "https://host.example/files/";
    CHECK(relative_path_for("https://host.example/files/Sub%20Dir/Game%20(USA).zip", root) == "Sub Dir/Game (USA).zip");
    CHECK(relative_path_for("https://host.example/files/a%5Cb.bin", root) == "a/b.bin");
    CHECK(relative_path_for("https://host.example/files/%2E%2E/%2E%2E/etc/passwd", root) == "etc/passwd");
    CHECK(relative_path_for("https://host.example/files/what%3F.bin", root) == "what_.bin");
    CHECK(relative_path_for("https://host.example/files/", root).empty());
}

TEST_CASE("last_segment and ends_with_ci") {
    CHECK(last_segment("https://h/a/b/Game%20(Japan).7z") == "Game%20(Japan).7z");
    CHECK(last_segment("https://h/a/b/") == "");
    CHECK(ends_with_ci("ARCHIVE.ZIP", ".zip"));
    CHECK_FALSE(ends_with_ci("archive.zipx", ".zip"));
    CHECK(ensure_trailing_slash("https://h/a") == "https://h/a/");
    CHECK(ensure_trailing_slash("https://h/a/") == "https://h/a/");
}

TEST_CASE("extract_hrefs finds quoted and unquoted anchors") {
    const std::string html =
        "<a href=\"dir/\">dir/</a>\n"
        "<A HREF='single.bin'>x</A>\n"
        "<a class=\"f\" href=bare.zip>y</a>\n"
        "<link href=\"style.css\">\n"
        "<a href=\"q?a=1&amp;b=2\">q</a>\n";
    auto links = extract_hrefs(html);
    REQUIRE(links.size() == 4);
    CHECK(links[0] == "dir/");
    CHECK(links[1] == "single.bin");
    CHECK(links[2] == "bare.zip");
    CHECK(links[3] == "q?a=1&b=2");
    CHECK(is_directory_href(links[0]));
    CHECK_FALSE(is_directory_href(links[1]));
}
