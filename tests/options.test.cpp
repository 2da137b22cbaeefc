#include <catch2/catch_all.hpp>
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "ktnsync/core/util/sync_options.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace ktnsync;

namespace {
    std::string writeTemp(const std::string& name, const std::string& body) {
        auto path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream(path) << body;
        return path;
    }
}

TEST_CASE("Absent keys keep their defaults", "[options]") {
    auto o = nlohmann::json{ {"fragmentSize", 800}, {"autoStartSync", false} }.get<SyncOptions>();
    REQUIRE(o.fragmentSize == 800);
    REQUIRE_FALSE(o.autoStartSync);
    REQUIRE(o.singleCodeCapacity == 2953);
    REQUIRE(o.maxChunkBytes == 16 * 1024);
    REQUIRE(o.highWaterBytes == 64 * 1024);
    REQUIRE(o.maxPendingStreams == 8);
    REQUIRE(o.channelLabel == "sync");
    REQUIRE(o.strictFragments);

    nlohmann::json j = o;
    REQUIRE(j.at("fragmentSize") == 800);
    REQUIRE(j.at("openTimeoutMs") == 30000);
}

TEST_CASE("Options load from a file", "[options]") {
    auto path = writeTemp("ktnsync_opts_ok.json", R"({"gatherTimeoutMs":1200,"channelLabel":"notes"})");
    auto o = loadSyncOptions(path);
    REQUIRE(o.gatherTimeoutMs == 1200);
    REQUIRE(o.channelLabel == "notes");
    std::remove(path.c_str());
}

TEST_CASE("Bad option files are reported as Internal", "[options]") {
    auto code = [](const std::string& path) {
        try {
            loadSyncOptions(path);
        }
        catch (const SyncError& e) {
            return e.code();
        }
        return SyncErr::InvalidMessage;
    };

    REQUIRE(code("/nonexistent/ktnsync/options.json") == SyncErr::Internal);

    auto broken = writeTemp("ktnsync_opts_broken.json", "{ fragmentSize: ");
    REQUIRE(code(broken) == SyncErr::Internal);
    std::remove(broken.c_str());

    auto array = writeTemp("ktnsync_opts_array.json", "[1,2]");
    REQUIRE(code(array) == SyncErr::Internal);
    std::remove(array.c_str());

    auto zero = writeTemp("ktnsync_opts_zero.json", R"({"fragmentSize":0})");
    REQUIRE(code(zero) == SyncErr::Internal);
    std::remove(zero.c_str());

    auto noStreams = writeTemp("ktnsync_opts_streams.json", R"({"maxPendingStreams":0})");
    REQUIRE(code(noStreams) == SyncErr::Internal);
    std::remove(noStreams.c_str());

    auto wrongType = writeTemp("ktnsync_opts_type.json", R"({"fragmentSize":"big"})");
    REQUIRE(code(wrongType) == SyncErr::Internal);
    std::remove(wrongType.c_str());
}

TEST_CASE("Log level names", "[options][logger]") {
    REQUIRE(parseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(parseLogLevel("error") == LogLevel::Error);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());

    std::vector<std::string> seen;
    auto& log = Logger::inst();
    const auto before = log.level();
    log.setSink([&](LogLevel, const std::string& m) { seen.push_back(m); });
    log.setLevel(LogLevel::Warn);
    LOG_INFO("hidden");
    LOG_WARN("shown");
    log.setLevel(before);
    log.setSink(nullptr);

    REQUIRE(seen == std::vector<std::string>{ "shown" });
}
