#include "hgraph/storage/command_log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

#include "hgraph/common/logger.h"
#include "hgraph/storage/file_lock.h"

namespace hgraph {
namespace storage {

namespace {

constexpr size_t kPayloadSize = 28;

void put_u32(uint8_t* out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

void put_u64(uint8_t* out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint32_t get_u32(const uint8_t* in) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | in[i];
    }
    return v;
}

uint64_t get_u64(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | in[i];
    }
    return v;
}

std::string errno_text() {
    return std::strerror(errno);
}

core::Result<void> write_fully(int fd, const std::vector<uint8_t>& bytes, const std::string& path) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                             "Failed to write " + path + ": " + errno_text());
        }
        written += static_cast<size_t>(n);
    }
    return core::Result<void>();
}

std::vector<uint8_t> encode_all(const std::vector<core::Command>& commands) {
    std::vector<uint8_t> bytes;
    bytes.reserve(commands.size() * CommandLog::kRecordSize);
    for (const auto& cmd : commands) {
        auto record = CommandLog::encode_record(cmd);
        bytes.insert(bytes.end(), record.begin(), record.end());
    }
    return bytes;
}

std::string record_error(size_t index, const std::string& what) {
    return "Corrupted command log record #" + std::to_string(index) + ": " + what;
}

} // namespace

uint32_t crc32(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & (0u - (crc & 1u)));
        }
    }
    return ~crc;
}

CommandLog::CommandLog(core::StoreConfig config) : config_(std::move(config)) {}

core::Result<void> CommandLog::init() {
    try {
        std::filesystem::create_directories(config_.store_dir());
    } catch (const std::filesystem::filesystem_error& e) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to create graph directory: " + std::string(e.what()));
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::EXCLUSIVE);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }

    // Opening without O_TRUNC keeps an existing log intact.
    int fd = ::open(config_.commands_path().c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to create " + config_.commands_path() + ": " + errno_text());
    }
    ::close(fd);

    HGRAPH_INFO("Initialized graph store at {}", config_.store_dir());
    return core::Result<void>();
}

bool CommandLog::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(config_.commands_path(), ec);
}

core::Result<void> CommandLog::ensure_initialized() const {
    if (!exists()) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "No graph store at " + config_.store_dir() + " (run init first)");
    }
    return core::Result<void>();
}

core::Result<void> CommandLog::append(const core::Command& command) {
    return append(std::vector<core::Command>{command});
}

core::Result<void> CommandLog::append(const std::vector<core::Command>& commands) {
    auto ready = ensure_initialized();
    if (!ready.ok()) {
        return ready;
    }
    if (commands.empty()) {
        return core::Result<void>();
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::EXCLUSIVE);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }
    auto result = write_unlocked(commands);
    if (result.ok()) {
        HGRAPH_DEBUG("Appended {} command(s) to {}", commands.size(), config_.commands_path());
    }
    return result;
}

core::Result<void> CommandLog::write_unlocked(const std::vector<core::Command>& commands) {
    const std::string path = config_.commands_path();
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to open " + path + ": " + errno_text());
    }

    struct stat before;
    if (::fstat(fd, &before) != 0) {
        auto failed = core::Result<void>::error(core::Error::Code::IO_ERROR,
                                                "Failed to stat " + path + ": " + errno_text());
        ::close(fd);
        return failed;
    }

    auto written = write_fully(fd, encode_all(commands), path);
    if (written.ok() && config_.sync_on_append && ::fsync(fd) != 0) {
        written = core::Result<void>::error(core::Error::Code::IO_ERROR,
                                            "Failed to sync " + path + ": " + errno_text());
    }
    if (!written.ok()) {
        // Drop any partial batch so the log still holds whole records only.
        if (::ftruncate(fd, before.st_size) != 0) {
            HGRAPH_ERROR("Failed to roll back {} to {} bytes: {}", path, before.st_size, errno_text());
        } else {
            HGRAPH_WARN("Rolled back {} to {} bytes after a failed append", path, before.st_size);
        }
    }
    ::close(fd);
    return written;
}

core::Result<std::vector<core::Command>> CommandLog::load() const {
    auto ready = ensure_initialized();
    if (!ready.ok()) {
        return core::Result<std::vector<core::Command>>::propagate(ready);
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::SHARED);
    if (!lock.ok()) {
        return core::Result<std::vector<core::Command>>::propagate(lock);
    }
    return read_unlocked();
}

core::Result<std::vector<core::Command>> CommandLog::read_unlocked() const {
    const std::string path = config_.commands_path();
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result<std::vector<core::Command>>::error(core::Error::Code::IO_ERROR,
                                                               "Failed to open " + path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return core::Result<std::vector<core::Command>>::error(core::Error::Code::IO_ERROR,
                                                               "Failed to read " + path);
    }

    auto decoded = decode(bytes);
    if (decoded.ok()) {
        HGRAPH_DEBUG("Loaded {} command(s) from {}", decoded.value().size(), path);
    } else {
        HGRAPH_ERROR("{}: {}", path, decoded.error());
    }
    return decoded;
}

core::Result<void> CommandLog::clear() {
    auto ready = ensure_initialized();
    if (!ready.ok()) {
        return ready;
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::EXCLUSIVE);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }
    return replace_unlocked({});
}

core::Result<void> CommandLog::rewrite(const Rewriter& rewriter) {
    auto ready = ensure_initialized();
    if (!ready.ok()) {
        return ready;
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::EXCLUSIVE);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }

    auto current = read_unlocked();
    if (!current.ok()) {
        return core::Result<void>::propagate(current);
    }
    auto replacement = rewriter(current.value());
    if (!replacement.ok()) {
        return core::Result<void>::propagate(replacement);
    }

    auto result = replace_unlocked(replacement.value());
    if (result.ok()) {
        HGRAPH_INFO("Rewrote command log: {} -> {} command(s)",
                    current.value().size(), replacement.value().size());
    }
    return result;
}

core::Result<void> CommandLog::replace_unlocked(const std::vector<core::Command>& commands) {
    const std::string path = config_.commands_path();
    const std::string tmp_path = path + ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to create " + tmp_path + ": " + errno_text());
    }
    auto written = write_fully(fd, encode_all(commands), tmp_path);
    if (written.ok() && ::fsync(fd) != 0) {
        written = core::Result<void>::error(core::Error::Code::IO_ERROR,
                                            "Failed to sync " + tmp_path + ": " + errno_text());
    }
    ::close(fd);
    if (!written.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return written;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to replace " + path + ": " + errno_text());
    }
    return core::Result<void>();
}

core::Result<void> CommandLog::destroy() {
    std::error_code ec;
    if (!std::filesystem::exists(config_.store_dir(), ec)) {
        return core::Result<void>();
    }

    auto lock = FileLock::Acquire(config_.lock_path(), FileLock::Mode::EXCLUSIVE);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }

    std::filesystem::remove_all(config_.store_dir(), ec);
    if (ec) {
        return core::Result<void>::error(core::Error::Code::IO_ERROR,
                                         "Failed to remove " + config_.store_dir() + ": " + ec.message());
    }
    HGRAPH_INFO("Removed graph store at {}", config_.store_dir());
    return core::Result<void>();
}

CommandLog::Record CommandLog::encode_record(const core::Command& command) {
    Record record{};
    put_u32(record.data(), kRecordMagic);
    record[4] = static_cast<uint8_t>(command.type);
    put_u64(record.data() + 8, command.a);
    if (command.is_edge_command()) {
        put_u64(record.data() + 16, command.b);
    }
    if (command.type == core::CommandType::ADD_EDGE) {
        put_u32(record.data() + 24, command.weight);
    }
    put_u32(record.data() + kPayloadSize, crc32(record.data(), kPayloadSize));
    return record;
}

core::Result<core::Command> CommandLog::decode_record(const uint8_t* data, size_t index) {
    if (get_u32(data) != kRecordMagic) {
        return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                  record_error(index, "bad magic"));
    }
    if (get_u32(data + kPayloadSize) != crc32(data, kPayloadSize)) {
        return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                  record_error(index, "checksum mismatch"));
    }

    uint8_t op = data[4];
    if (op < static_cast<uint8_t>(core::CommandType::ADD_VERTEX) ||
        op > static_cast<uint8_t>(core::CommandType::REMOVE_EDGE)) {
        return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                  record_error(index, "unknown op " + std::to_string(op)));
    }

    core::Command cmd;
    cmd.type = static_cast<core::CommandType>(op);
    cmd.a = get_u64(data + 8);
    if (cmd.a == core::kInvalidVertex) {
        return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                  record_error(index, "vertex id 0"));
    }
    if (cmd.is_edge_command()) {
        cmd.b = get_u64(data + 16);
        if (cmd.b == core::kInvalidVertex) {
            return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                      record_error(index, "vertex id 0"));
        }
    }
    if (cmd.type == core::CommandType::ADD_EDGE) {
        cmd.weight = get_u32(data + 24);
        if (cmd.weight == 0) {
            return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR,
                                                      record_error(index, "edge weight 0"));
        }
    }
    return core::Result<core::Command>(cmd);
}

core::Result<std::vector<core::Command>> CommandLog::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % kRecordSize != 0) {
        return core::Result<std::vector<core::Command>>::error(
            core::Error::Code::PARSE_ERROR,
            record_error(bytes.size() / kRecordSize,
                         "truncated (" + std::to_string(bytes.size() % kRecordSize) + " trailing bytes)"));
    }

    std::vector<core::Command> commands;
    commands.reserve(bytes.size() / kRecordSize);
    for (size_t offset = 0, index = 0; offset < bytes.size(); offset += kRecordSize, ++index) {
        auto cmd = decode_record(bytes.data() + offset, index);
        if (!cmd.ok()) {
            return core::Result<std::vector<core::Command>>::propagate(cmd);
        }
        commands.push_back(cmd.value());
    }
    return core::Result<std::vector<core::Command>>(std::move(commands));
}

} // namespace storage
} // namespace hgraph
