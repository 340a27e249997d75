#include <catch2/catch.hpp>

#include "config.hpp"
#include "io.hpp"
#include "sync_adapter.hpp"
#include "test_support.hpp"

static const char* DEVICE = "0123456789abcdef0123456789abcdef";

TEST_CASE("Config file parsing", "[config]") {
    SyncConfig cfg;

    SECTION("defaults when empty") {
        REQUIRE(parse_config("", cfg) == ZkStatus::OK);
        CHECK(cfg.target == SyncTarget::NONE);
        CHECK(cfg.interval_minutes == 5);
        CHECK(cfg.quiet_period_seconds == 3);
    }

    SECTION("every key, with comments and spacing") {
        const std::string text =
            "# sync settings\n"
            "sync_target = SERVER\n"
            "  sync_interval_minutes=10   # every ten minutes\n"
            "remote_url = https://notes.example.org\n"
            "credentials = tok123\n"
            "device_id = 0123456789ABCDEF0123456789ABCDEF\n"
            "quiet_period_seconds = 7\n"
            "\n"
            "future_option = ignored\n";
        REQUIRE(parse_config(text, cfg) == ZkStatus::OK);
        CHECK(cfg.target == SyncTarget::SERVER);
        CHECK(cfg.interval_minutes == 10);
        CHECK(cfg.remote_url == "https://notes.example.org");
        CHECK(cfg.credentials == "tok123");
        CHECK(cfg.device_id == DEVICE);
        CHECK(cfg.quiet_period_seconds == 7);
    }

    SECTION("a '#' inside a value is kept") {
        const std::string text =
            "sync_target = server\n"
            "remote_url = https://notes.example.org/api#v2\n"
            "credentials = tok#123#abc   # bearer token\n";
        REQUIRE(parse_config(text, cfg) == ZkStatus::OK);
        CHECK(cfg.remote_url == "https://notes.example.org/api#v2");
        CHECK(cfg.credentials == "tok#123#abc");

        SyncConfig back;
        REQUIRE(parse_config(serialize_config(cfg), back) == ZkStatus::OK);
        CHECK(back.credentials == "tok#123#abc");
    }

    SECTION("bad input is refused") {
        CHECK(parse_config("sync_target server\n", cfg) == ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("sync_target = cloud\n", cfg) == ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("sync_interval_minutes = 7\n", cfg) == ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("sync_interval_minutes = -5\n", cfg) == ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("device_id = xyz\n", cfg) == ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("sync_target = server\nremote_url = ftp://host\n", cfg) ==
            ZkStatus::VALIDATION_FAILURE);
        CHECK(parse_config("sync_target = file\n", cfg) == ZkStatus::VALIDATION_FAILURE);
    }
}

TEST_CASE("Allowed sync intervals", "[config]") {
    for (int m : { 1, 2, 3, 5, 10, 30, 60 }) CHECK(valid_sync_interval(m));
    for (int m : { 0, 4, 15, 120 }) CHECK_FALSE(valid_sync_interval(m));
}

TEST_CASE("Config is created once with a device id", "[config][file]") {
    const std::string dir = make_temp_dir();
    const std::string path = dir + "/" + CONFIG_FILENAME;

    SyncConfig first;
    REQUIRE(load_or_create_config(path, first) == ZkStatus::OK);
    CHECK(first.device_id.size() == 32);
    CHECK(validate_config(first) == ZkStatus::OK);

    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    SyncConfig again;
    REQUIRE(load_or_create_config(path, again) == ZkStatus::OK);
    CHECK(again.device_id == first.device_id);

    SyncConfig changed = again;
    changed.target = SyncTarget::FILE;
    changed.remote_url = dir;
    changed.interval_minutes = 30;
    REQUIRE(save_config(path, changed) == ZkStatus::OK);

    SyncConfig reloaded;
    REQUIRE(load_or_create_config(path, reloaded) == ZkStatus::OK);
    CHECK(reloaded.target == SyncTarget::FILE);
    CHECK(reloaded.remote_url == dir);
    CHECK(reloaded.interval_minutes == 30);
    CHECK(reloaded.device_id == first.device_id);

    changed.interval_minutes = 4;
    CHECK(save_config(path, changed) == ZkStatus::VALIDATION_FAILURE);

    std::remove(path.c_str());
    rmdir(dir.c_str());
}

TEST_CASE("Adapter follows the configured target", "[config][adapter]") {
    SyncConfig cfg;
    CHECK(make_sync_adapter(cfg) == nullptr);

    cfg.target = SyncTarget::FILE;
    cfg.remote_url = "/tmp";
    auto file = make_sync_adapter(cfg);
    REQUIRE(file);
    CHECK(std::string(file->name()) == "file");

    cfg.target = SyncTarget::SERVER;
    cfg.remote_url = "https://notes.example.org";
    auto server = make_sync_adapter(cfg);
    REQUIRE(server);
    CHECK(std::string(server->name()) == "server");
}
