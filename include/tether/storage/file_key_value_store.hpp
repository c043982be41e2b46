#pragma once
#include "tether/interfaces/i_key_value_store.hpp"
#include <filesystem>
#include <memory>
#include <mutex>

namespace tether::storage {

/**
 * Key-value store kept as a directory with one protobuf record file per key.
 *
 * A write goes to "<record>.tmp" and is renamed over the record, so a crash
 * leaves either the old or the new value of that key on disk. Writing one key
 * never touches the files of other keys.
 */
class FileKeyValueStore final : public interfaces::IKeyValueStore {
public:
    /// Creates the directory when it is absent.
    [[nodiscard]] static Result<std::unique_ptr<FileKeyValueStore>, TetherFailure> Open(
        std::filesystem::path directory);

    [[nodiscard]] Result<std::optional<std::string>, TetherFailure> Get(std::string_view key) const override;
    [[nodiscard]] Result<bool, TetherFailure> Has(std::string_view key) const override;
    [[nodiscard]] Result<Unit, TetherFailure> Set(std::string_view key, std::string value) override;
    [[nodiscard]] Result<Unit, TetherFailure> Delete(std::string_view key) override;

    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return directory_; }

    /// Where the value of key lives on disk.
    [[nodiscard]] std::filesystem::path RecordPath(std::string_view key) const;

    FileKeyValueStore(const FileKeyValueStore&) = delete;
    FileKeyValueStore& operator=(const FileKeyValueStore&) = delete;

private:
    explicit FileKeyValueStore(std::filesystem::path directory);

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

}
