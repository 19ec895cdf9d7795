#include <catch2/catch_test_macros.hpp>

#include "infrastructure/storage/IconStore.hpp"

#include <filesystem>
#include <fstream>

using namespace netscan::infra;

namespace {

class TestDataDir {
public:
    TestDataDir() : dir_(std::filesystem::temp_directory_path() / "netscan_icon_test") {
        cleanup();
        std::filesystem::create_directories(dir_);
    }

    ~TestDataDir() { cleanup(); }

    std::filesystem::path path() const { return dir_; }

    std::filesystem::path makeImage(const std::string& name) const {
        auto path = dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << "\x89PNG fake image";
        return path;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(dir_)) {
            std::filesystem::remove_all(dir_);
        }
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_CASE("Icon assignment", "[IconStore]") {
    TestDataDir dir;
    IconStore store(dir.path() / "icons.json", dir.path() / "icons");

    SECTION("No icon by default") {
        REQUIRE_FALSE(store.iconPathFor("AA:BB:CC:DD:EE:FF").has_value());
    }

    SECTION("Assigned icon is copied and recorded") {
        auto stored = store.setIcon("aa-bb-cc-dd-ee-ff", dir.makeImage("phone.png"));

        REQUIRE(stored.has_value());
        REQUIRE(*stored == (dir.path() / "icons" / "AA-BB-CC-DD-EE-FF.png").string());
        REQUIRE(std::filesystem::exists(*stored));
        REQUIRE(store.iconPathFor("AA:BB:CC:DD:EE:FF") == stored);
    }

    SECTION("Mapping survives a new store instance") {
        auto stored = store.setIcon("AA:BB:CC:DD:EE:FF", dir.makeImage("phone.png"));
        IconStore reopened(dir.path() / "icons.json", dir.path() / "icons");
        REQUIRE(reopened.iconPathFor("aa:bb:cc:dd:ee:ff") == stored);
    }

    SECTION("Missing source file fails") {
        REQUIRE_FALSE(store.setIcon("AA:BB:CC:DD:EE:FF", dir.path() / "missing.png").has_value());
        REQUIRE_FALSE(store.iconPathFor("AA:BB:CC:DD:EE:FF").has_value());
    }

    SECTION("Removing deletes the file and the mapping") {
        auto stored = store.setIcon("AA:BB:CC:DD:EE:FF", dir.makeImage("phone.png"));
        REQUIRE(stored.has_value());

        REQUIRE(store.removeIcon("AA:BB:CC:DD:EE:FF"));
        REQUIRE_FALSE(std::filesystem::exists(*stored));
        REQUIRE_FALSE(store.iconPathFor("AA:BB:CC:DD:EE:FF").has_value());
        REQUIRE_FALSE(store.removeIcon("AA:BB:CC:DD:EE:FF"));
    }
}
