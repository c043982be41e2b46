#include "tether/storage/file_key_value_store.hpp"
#include "tether/debug/event_logger.hpp"
#include "storage/kv_record.pb.h"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace tether::storage {

namespace {
    constexpr uint32_t RECORD_FORMAT_VERSION = 1;
    constexpr std::string_view RECORD_EXTENSION = ".rec";
    constexpr std::string_view TEMP_EXTENSION = ".tmp";
}

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

Result<std::unique_ptr<FileKeyValueStore>, TetherFailure> FileKeyValueStore::Open(std::filesystem::path directory) {
    std::unique_ptr<FileKeyValueStore> store(new FileKeyValueStore(std::move(directory)));

    std::error_code ec;
    std::filesystem::create_directories(store->directory_, ec);
    if (ec || !std::filesystem::is_directory(store->directory_, ec)) {
        return Result<std::unique_ptr<FileKeyValueStore>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("{} is not a usable directory", store->directory_.string())));
    }

    // Leftovers of writes interrupted before their rename.
    for (const auto& entry : std::filesystem::directory_iterator(store->directory_, ec)) {
        if (entry.path().extension() == TEMP_EXTENSION) {
            std::error_code removed;
            if (!std::filesystem::remove(entry.path(), removed) || removed) {
                TETHER_LOG_ID("storage", "stale temp file kept", entry.path().string());
            }
        }
    }
    if (ec) {
        return Result<std::unique_ptr<FileKeyValueStore>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Cannot list {}: {}", store->directory_.string(), ec.message())));
    }
    return Result<std::unique_ptr<FileKeyValueStore>, TetherFailure>::Ok(std::move(store));
}

std::filesystem::path FileKeyValueStore::RecordPath(std::string_view key) const {
    std::string name;
    name.reserve(key.size() * 2 + RECORD_EXTENSION.size());
    for (const char c : key) {
        name += fmt::format("{:02x}", static_cast<unsigned char>(c));
    }
    name += RECORD_EXTENSION;
    return directory_ / name;
}

Result<std::optional<std::string>, TetherFailure> FileKeyValueStore::Get(std::string_view key) const {
    const auto path = RecordPath(key);
    std::lock_guard lock(mutex_);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return Result<std::optional<std::string>, TetherFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<std::string>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Cannot open {}", path.string())));
    }
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    proto::storage::KeyValueRecord record;
    if (!record.ParseFromString(bytes)) {
        return Result<std::optional<std::string>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Record {} is corrupt", path.string())));
    }
    if (record.format_version() != RECORD_FORMAT_VERSION) {
        return Result<std::optional<std::string>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Unsupported record version {}", record.format_version())));
    }
    if (record.key() != key) {
        return Result<std::optional<std::string>, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Record {} holds a different key", path.string())));
    }
    return Result<std::optional<std::string>, TetherFailure>::Ok(std::move(*record.mutable_value()));
}

Result<bool, TetherFailure> FileKeyValueStore::Has(std::string_view key) const {
    const auto path = RecordPath(key);
    std::lock_guard lock(mutex_);
    std::error_code ec;
    const bool present = std::filesystem::exists(path, ec);
    if (ec) {
        return Result<bool, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
    }
    return Result<bool, TetherFailure>::Ok(present);
}

Result<Unit, TetherFailure> FileKeyValueStore::Set(std::string_view key, std::string value) {
    if (key.empty()) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::InvalidInput("Storage key cannot be empty"));
    }

    proto::storage::KeyValueRecord record;
    record.set_format_version(RECORD_FORMAT_VERSION);
    record.set_key(std::string(key));
    record.set_value(std::move(value));
    std::string bytes;
    if (!record.SerializeToString(&bytes)) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::Storage("Failed to serialize record"));
    }

    const auto path = RecordPath(key);
    std::filesystem::path temp_path = path;
    temp_path += TEMP_EXTENSION;

    std::lock_guard lock(mutex_);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::Storage(fmt::format("Cannot write {}", temp_path.string())));
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::Storage(fmt::format("Short write to {}", temp_path.string())));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Cannot replace {}", path.string())));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> FileKeyValueStore::Delete(std::string_view key) {
    const auto path = RecordPath(key);
    std::lock_guard lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Cannot delete {}: {}", path.string(), ec.message())));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

}
