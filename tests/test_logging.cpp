#include <catch2/catch.hpp>

#include "io.hpp"
#include "logging.hpp"
#include "test_support.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <thread>

static std::string slurp(const std::string& path) {
    std::string text;
    bool missing = false;
    REQUIRE(read_file(path, text, missing));
    REQUIRE_FALSE(missing);
    return text;
}

TEST_CASE("Audit log lines", "[logging]") {
    const std::string saved = audit_log_path();
    const std::string dir = make_temp_dir();
    const std::string path = dir + "/" + AUDIT_LOG;

    set_audit_log_path(path);
    set_log_device("log-test");
    CHECK(audit_log_path() == path);

    audit_log_level(LogLevel::WARN, "first line\nforged | line", "note_unlock", "failure");
    audit_log_level(LogLevel::INFO, "second");

    const std::string text = slurp(path);
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
    CHECK(text.find(" | WARN | ") != std::string::npos);
    CHECK(text.find("device=log-test") != std::string::npos);
    CHECK(text.find("event=note_unlock | outcome=failure | first line forged | line") != std::string::npos);

    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    set_audit_log_path("");
    CHECK(audit_log_path() == AUDIT_LOG);

    set_audit_log_path(saved);
    std::remove(path.c_str());
    rmdir(dir.c_str());
}

TEST_CASE("Log path can be read while another thread logs", "[logging][threads]") {
    const std::string saved = audit_log_path();
    const std::string dir = make_temp_dir();
    const std::string one = dir + "/one.log";
    const std::string two = dir + "/two.log";
    set_audit_log_path(one);

    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            set_audit_log_path(i % 2 ? one : two);
            audit_log_level(LogLevel::INFO, "tick " + std::to_string(i));
        }
    });
    size_t bad = 0;
    for (int i = 0; i < 200; ++i) {
        std::string p = audit_log_path();
        if (p != one && p != two) ++bad;
    }
    writer.join();
    CHECK(bad == 0);

    set_audit_log_path(saved);
    std::remove(one.c_str());
    std::remove(two.c_str());
    rmdir(dir.c_str());
}
