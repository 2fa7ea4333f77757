#include <docsnap-cpp/file_snapshot_store.hpp>
#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/json.hpp>
#include <docsnap-cpp/log.hpp>

#include "storage/compression.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace docsnap_cpp {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view snapshot_extension = ".snap";

auto hex_encode(std::string_view text) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(text.size() * 2);
    for (auto c : text) {
        auto b = static_cast<unsigned char>(c);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

auto version_file_name(Version version) -> std::string {
    char buf[21];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(version));
    return std::string{buf} + std::string{snapshot_extension};
}

// Parse "<digits>.snap"; nullopt for anything else (temp files, strays).
auto parse_version(const fs::path& path) -> std::optional<Version> {
    if (path.extension().string() != snapshot_extension) return std::nullopt;
    auto stem = path.stem().string();
    auto version = Version{0};
    auto [ptr, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), version);
    if (ec != std::errc{} || ptr != stem.data() + stem.size()) return std::nullopt;
    return version;
}

[[noreturn]] void storage_failure(std::string message) {
    logger()->warn("snapshot storage failure: {}", message);
    throw SnapshotError{ErrorKind::storage_error, std::move(message)};
}

// Best-effort removal of a half-written temp file.
void discard(const fs::path& temp) {
    auto ec = std::error_code{};
    if (!fs::remove(temp, ec) && ec) {
        logger()->warn("cannot remove temp file '{}': {}", temp.string(), ec.message());
    }
}

}  // anonymous namespace

FileSnapshotStore::FileSnapshotStore(fs::path root)
    : root_{std::move(root)} {
    auto ec = std::error_code{};
    fs::create_directories(root_, ec);
    if (ec) {
        storage_failure("cannot create snapshot directory '" + root_.string() + "': " + ec.message());
    }
}

auto FileSnapshotStore::document_dir(const DocumentId& document_id) const -> fs::path {
    return root_ / hex_encode(document_id);
}

auto FileSnapshotStore::snapshot_path(const DocumentId& document_id, Version version) const -> fs::path {
    return document_dir(document_id) / version_file_name(version);
}

auto FileSnapshotStore::read_snapshot(const fs::path& path) const -> Snapshot {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) storage_failure("cannot open snapshot file '" + path.string() + "'");

    auto raw = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) storage_failure("cannot read snapshot file '" + path.string() + "'");

    auto frame = std::vector<std::byte>(raw.size());
    std::ranges::transform(raw, frame.begin(), [](char c) { return static_cast<std::byte>(c); });

    auto payload = storage::decompress_frame(frame);
    if (!payload) {
        throw SnapshotError{ErrorKind::decoding_error,
                            "snapshot file '" + path.string() + "' is not a valid frame"};
    }
    try {
        return nlohmann::json::parse(*payload).get<Snapshot>();
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError{ErrorKind::decoding_error,
                            "snapshot file '" + path.string() + "' is malformed: " + e.what()};
    }
}

auto FileSnapshotStore::get_snapshot(const DocumentId& document_id, Version version,
                                     bool find_closest) const -> std::optional<Snapshot> {
    auto lock = std::shared_lock{mutex_};
    if (!find_closest) {
        auto path = snapshot_path(document_id, version);
        auto ec = std::error_code{};
        auto present = fs::exists(path, ec);
        if (ec) storage_failure("cannot inspect '" + path.string() + "': " + ec.message());
        if (!present) return std::nullopt;
        return read_snapshot(path);
    }

    auto best = std::optional<Version>{};
    for (auto candidate : list_versions(document_id)) {
        if (candidate <= version && (!best || candidate > *best)) best = candidate;
    }
    if (!best) return std::nullopt;
    return read_snapshot(snapshot_path(document_id, *best));
}

void FileSnapshotStore::save_snapshot(const Snapshot& snapshot) {
    if (snapshot.document_id.empty()) {
        throw SnapshotError{ErrorKind::invalid_arguments, "a snapshot needs a document id"};
    }
    auto payload = std::string{};
    try {
        payload = nlohmann::json(snapshot).dump();
    } catch (const nlohmann::json::exception& e) {
        storage_failure("cannot serialize snapshot of '" + snapshot.document_id + "': " + e.what());
    }
    auto frame = storage::compress_frame(payload);
    if (!frame) storage_failure("cannot compress snapshot of '" + snapshot.document_id + "'");

    auto lock = std::unique_lock{mutex_};
    auto dir = document_dir(snapshot.document_id);
    auto ec = std::error_code{};
    fs::create_directories(dir, ec);
    if (ec) storage_failure("cannot create '" + dir.string() + "': " + ec.message());

    auto target = dir / version_file_name(snapshot.version);
    auto temp = target;
    temp += ".tmp";
    {
        auto out = std::ofstream{temp, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char*>(frame->data()),
                  static_cast<std::streamsize>(frame->size()));
        out.close();
        if (!out) {
            discard(temp);
            storage_failure("cannot write snapshot file '" + temp.string() + "'");
        }
    }
    fs::rename(temp, target, ec);
    if (ec) {
        discard(temp);
        storage_failure("cannot move snapshot into '" + target.string() + "': " + ec.message());
    }
}

auto FileSnapshotStore::delete_snapshot(const DocumentId& document_id, Version version) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto ec = std::error_code{};
    auto removed = fs::remove(snapshot_path(document_id, version), ec);
    if (ec) storage_failure("cannot delete snapshot: " + ec.message());
    return removed;
}

auto FileSnapshotStore::snapshot_versions(const DocumentId& document_id) const -> std::vector<Version> {
    auto lock = std::shared_lock{mutex_};
    auto result = list_versions(document_id);
    std::ranges::sort(result);
    return result;
}

auto FileSnapshotStore::list_versions(const DocumentId& document_id) const -> std::vector<Version> {
    auto result = std::vector<Version>{};
    auto dir = document_dir(document_id);
    auto ec = std::error_code{};
    auto it = fs::directory_iterator{dir, ec};
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        if (auto version = parse_version(it->path())) result.push_back(*version);
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        storage_failure("cannot list snapshots in '" + dir.string() + "': " + ec.message());
    }
    return result;
}

}  // namespace docsnap_cpp
