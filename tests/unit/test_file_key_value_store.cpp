#include <catch2/catch_test_macros.hpp>
#include "tether/storage/file_key_value_store.hpp"
#include "tether/storage/in_memory_key_value_store.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
using namespace tether;
using namespace tether::storage;
namespace {
struct TempPath {
    std::filesystem::path path;
    TempPath() {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        path = std::filesystem::temp_directory_path() /
               ("tether_kv_" + crypto::SodiumInterop::ToHex(crypto::SodiumInterop::GetRandomBytes(8)));
    }
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};
size_t FileCount(const std::filesystem::path& directory) {
    return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(directory),
                                             std::filesystem::directory_iterator()));
}
}
TEST_CASE("FileKeyValueStore - Basic operations", "[storage]") {
    TempPath temp;
    auto store = FileKeyValueStore::Open(temp.path).Unwrap();
    SECTION("Missing directory opens empty") {
        REQUIRE(std::filesystem::is_directory(temp.path));
        REQUIRE_FALSE(store->Get("absent").Unwrap().has_value());
    }
    SECTION("Set then get") {
        REQUIRE_FALSE(store->Has("tether.identity.device_id").Unwrap());
        REQUIRE(store->Set("tether.identity.device_id", "dev_0123").IsOk());
        REQUIRE(store->Get("tether.identity.device_id").Unwrap() == std::optional<std::string>("dev_0123"));
        REQUIRE(store->Has("tether.identity.device_id").Unwrap());
    }
    SECTION("Empty key is rejected") {
        REQUIRE(store->Set("", "x").UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Delete of an absent key succeeds") {
        REQUIRE(store->Delete("absent").IsOk());
    }
    SECTION("Each key has its own record file") {
        REQUIRE(store->Set("tether.ledger.state", "directory").IsOk());
        REQUIRE(store->Set("tether.attachment.att_1", std::string(4096, 'x')).IsOk());
        REQUIRE(FileCount(temp.path) == 2);
        const auto payload_file = store->RecordPath("tether.attachment.att_1");
        const auto before = std::filesystem::last_write_time(payload_file);
        const auto size_before = std::filesystem::file_size(payload_file);
        REQUIRE(store->Set("tether.ledger.state", "directory v2").IsOk());
        REQUIRE(std::filesystem::last_write_time(payload_file) == before);
        REQUIRE(std::filesystem::file_size(payload_file) == size_before);
        REQUIRE(store->Delete("tether.attachment.att_1").IsOk());
        REQUIRE_FALSE(std::filesystem::exists(payload_file));
        REQUIRE(FileCount(temp.path) == 1);
    }
}
TEST_CASE("FileKeyValueStore - Survives reopening", "[storage]") {
    TempPath temp;
    {
        auto store = FileKeyValueStore::Open(temp.path).Unwrap();
        REQUIRE(store->Set("a", "1").IsOk());
        REQUIRE(store->Set("b", std::string("\0binary\xff", 8)).IsOk());
        REQUIRE(store->Set("c", "3").IsOk());
        REQUIRE(store->Delete("c").IsOk());
    }
    {
        std::ofstream interrupted(temp.path / "61.rec.tmp", std::ios::binary);
        interrupted << "half written";
    }
    auto reopened = FileKeyValueStore::Open(temp.path).Unwrap();
    REQUIRE(reopened->Get("a").Unwrap() == std::optional<std::string>("1"));
    REQUIRE(reopened->Get("b").Unwrap()->size() == 8);
    REQUIRE_FALSE(reopened->Get("c").Unwrap().has_value());
    REQUIRE_FALSE(std::filesystem::exists(temp.path / "61.rec.tmp"));
    REQUIRE(FileCount(temp.path) == 2);
}
TEST_CASE("FileKeyValueStore - Corrupt records", "[storage]") {
    TempPath temp;
    auto store = FileKeyValueStore::Open(temp.path).Unwrap();
    REQUIRE(store->Set("good", "value").IsOk());
    {
        std::ofstream out(store->RecordPath("bad"), std::ios::binary);
        out << "\xff\xff\xff\xff not a record";
    }
    SECTION("Reading the damaged key fails") {
        REQUIRE(store->Get("bad").UnwrapErr().Is(TetherFailureType::Storage));
    }
    SECTION("Other keys are unaffected") {
        REQUIRE(store->Get("good").Unwrap() == std::optional<std::string>("value"));
    }
    SECTION("A record copied under another key's name is refused") {
        std::filesystem::copy_file(store->RecordPath("good"), store->RecordPath("bad"),
                                   std::filesystem::copy_options::overwrite_existing);
        REQUIRE(store->Get("bad").UnwrapErr().Is(TetherFailureType::Storage));
    }
}
TEST_CASE("FileKeyValueStore - A plain file is not a store", "[storage]") {
    TempPath temp;
    {
        std::ofstream out(temp.path, std::ios::binary);
        out << "not a directory";
    }
    auto store = FileKeyValueStore::Open(temp.path);
    REQUIRE(store.IsErr());
    REQUIRE(store.UnwrapErr().Is(TetherFailureType::Storage));
}
TEST_CASE("InMemoryKeyValueStore - Basic operations", "[storage]") {
    InMemoryKeyValueStore store;
    REQUIRE(store.Set("k", "v").IsOk());
    REQUIRE(store.Contains("k"));
    REQUIRE(store.Has("k").Unwrap());
    REQUIRE(store.Size() == 1);
    REQUIRE(store.Delete("k").IsOk());
    REQUIRE_FALSE(store.Contains("k"));
    REQUIRE(store.Delete("k").IsOk());
    REQUIRE(store.Set("", "v").IsErr());
}
