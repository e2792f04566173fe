/**
 * @file artifact_storage.cpp
 * @brief Local file system artifact storage
 */

#include <kcenon/secure_transfer/storage/artifact_storage.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <fstream>

namespace kcenon::secure_transfer {

namespace {

constexpr const char* artifact_extension = ".enc";
constexpr const char* staging_extension = ".enc.tmp";

class local_artifact_writer final : public artifact_writer {
public:
    local_artifact_writer(std::filesystem::path staging, std::filesystem::path target,
                          std::ofstream file)
        : staging_(std::move(staging)), target_(std::move(target)), file_(std::move(file)) {}

    ~local_artifact_writer() override {
        if (!committed_) {
            abort();
        }
    }

    local_artifact_writer(const local_artifact_writer&) = delete;
    auto operator=(const local_artifact_writer&) -> local_artifact_writer& = delete;

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (committed_ || aborted_) {
            return make_error(error_code::file_write_error, "Artifact writer is closed");
        }
        if (data.empty()) {
            return {};
        }

        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return make_error(error_code::file_write_error,
                              "Failed to write artifact: " + staging_.string());
        }
        written_ += data.size();
        return {};
    }

    auto commit() -> result<uint64_t> override {
        if (committed_ || aborted_) {
            return make_error(error_code::file_write_error, "Artifact writer is closed");
        }

        file_.flush();
        file_.close();
        if (file_.fail()) {
            abort();
            return make_error(error_code::file_write_error,
                              "Failed to flush artifact: " + staging_.string());
        }

        std::error_code ec;
        std::filesystem::rename(staging_, target_, ec);
        if (ec) {
            abort();
            return make_error(error_code::file_write_error,
                              "Failed to publish artifact: " + ec.message());
        }

        committed_ = true;
        return written_;
    }

    void abort() override {
        if (committed_ || aborted_) {
            return;
        }
        aborted_ = true;
        if (file_.is_open()) {
            file_.close();
        }
        std::error_code ec;
        std::filesystem::remove(staging_, ec);
        if (ec) {
            ST_LOG_WARN(log_category::storage,
                "Failed to remove staging file " + staging_.string() + ": " + ec.message());
        }
    }

    auto bytes_written() const -> uint64_t override { return written_; }

private:
    std::filesystem::path staging_;
    std::filesystem::path target_;
    std::ofstream file_;
    uint64_t written_ = 0;
    bool committed_ = false;
    bool aborted_ = false;
};

class local_artifact_reader final : public artifact_reader {
public:
    local_artifact_reader(std::ifstream file, uint64_t size)
        : file_(std::move(file)), size_(size) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty() || file_.eof()) {
            return std::size_t{0};
        }
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            return make_error(error_code::file_read_error, "Failed to read artifact");
        }
        return static_cast<std::size_t>(file_.gcount());
    }

    auto size() const -> uint64_t override { return size_; }

private:
    std::ifstream file_;
    uint64_t size_;
};

}  // namespace

// ============================================================================
// artifact_storage
// ============================================================================

auto artifact_storage::read_all(const std::string& name) -> result<byte_buffer> {
    auto reader = open_reader(name);
    if (!reader) {
        return unexpected(reader.error());
    }

    byte_buffer out(static_cast<std::size_t>(reader.value()->size()));
    std::size_t filled = 0;
    while (filled < out.size()) {
        auto got = reader.value()->read(std::span<std::byte>(out).subspan(filled));
        if (!got) {
            return unexpected(got.error());
        }
        if (got.value() == 0) {
            break;
        }
        filled += got.value();
    }
    out.resize(filled);
    return out;
}

auto artifact_storage::validate_name(const std::string& name) -> result<void> {
    if (name.empty()) {
        return make_error(error_code::validation_error, "Artifact name is empty");
    }
    for (char c : name) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return make_error(error_code::validation_error,
                              "Artifact name contains invalid characters: " + name);
        }
    }
    return {};
}

// ============================================================================
// local_artifact_storage
// ============================================================================

local_artifact_storage::local_artifact_storage(std::filesystem::path base_path)
    : base_path_(std::move(base_path)) {}

auto local_artifact_storage::create(const std::filesystem::path& base_path)
    -> result<std::unique_ptr<local_artifact_storage>> {
    if (base_path.empty()) {
        return make_error(error_code::invalid_configuration, "Storage directory is empty");
    }

    std::error_code ec;
    if (!std::filesystem::exists(base_path, ec)) {
        std::filesystem::create_directories(base_path, ec);
        if (ec) {
            return make_error(error_code::storage_error,
                "Failed to create storage directory: " + base_path.string());
        }
    } else if (!std::filesystem::is_directory(base_path, ec)) {
        return make_error(error_code::storage_error,
            "Storage path is not a directory: " + base_path.string());
    }

    return std::unique_ptr<local_artifact_storage>(new local_artifact_storage(base_path));
}

auto local_artifact_storage::open_writer(const std::string& name)
    -> result<std::unique_ptr<artifact_writer>> {
    auto valid = validate_name(name);
    if (!valid) {
        return unexpected(valid.error());
    }

    auto target = artifact_path(name);
    auto staging = base_path_ / (name + staging_extension);

    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return make_error(error_code::already_exists, "Artifact already exists: " + name);
    }

    std::ofstream file(staging, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_error(error_code::file_write_error,
                          "Failed to open artifact for writing: " + staging.string());
    }

    return std::unique_ptr<artifact_writer>(
        std::make_unique<local_artifact_writer>(staging, target, std::move(file)));
}

auto local_artifact_storage::open_reader(const std::string& name)
    -> result<std::unique_ptr<artifact_reader>> {
    auto valid = validate_name(name);
    if (!valid) {
        return unexpected(valid.error());
    }

    auto path = artifact_path(name);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(error_code::not_found, "Artifact not found: " + name);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(error_code::file_read_error,
                          "Failed to open artifact: " + path.string());
    }

    return std::unique_ptr<artifact_reader>(
        std::make_unique<local_artifact_reader>(std::move(file), static_cast<uint64_t>(size)));
}

auto local_artifact_storage::remove(const std::string& name) -> result<void> {
    auto valid = validate_name(name);
    if (!valid) {
        return unexpected(valid.error());
    }

    auto path = artifact_path(name);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error(error_code::not_found, "Artifact not found: " + name);
    }

    std::filesystem::remove(path, ec);
    if (ec) {
        return make_error(error_code::storage_error,
                          "Failed to delete artifact " + name + ": " + ec.message());
    }
    return {};
}

auto local_artifact_storage::exists(const std::string& name) const -> bool {
    if (!validate_name(name)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(artifact_path(name), ec) && !ec;
}

auto local_artifact_storage::base_path() const -> const std::filesystem::path& {
    return base_path_;
}

auto local_artifact_storage::artifact_path(const std::string& name) const
    -> std::filesystem::path {
    return base_path_ / (name + artifact_extension);
}

}  // namespace kcenon::secure_transfer
