#ifndef HGRAPH_STORAGE_COMMAND_LOG_H_
#define HGRAPH_STORAGE_COMMAND_LOG_H_

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "hgraph/core/config.h"
#include "hgraph/core/result.h"
#include "hgraph/core/types.h"

namespace hgraph {
namespace storage {

/**
 * @brief Durable, append-only log of graph commands
 *
 * Records are fixed 32-byte little-endian frames:
 *
 *   magic u32 | op u8 | reserved[3] | a u64 | b u64 | weight u32 | crc32 u32
 *
 * where the CRC covers the first 28 bytes. Appends take the store lock
 * exclusively and loads take it shared, so a reader never observes a
 * half-written batch from a cooperating writer. Any malformed record makes
 * the whole load fail with PARSE_ERROR.
 */
class CommandLog {
public:
    static constexpr size_t kRecordSize = 32;
    static constexpr uint32_t kRecordMagic = 0x48474C43;  // "HGLC"

    using Record = std::array<uint8_t, kRecordSize>;
    using Rewriter = std::function<core::Result<std::vector<core::Command>>(
        const std::vector<core::Command>&)>;

    explicit CommandLog(core::StoreConfig config);

    /// Creates the store directory, an empty log and the lock file.
    core::Result<void> init();

    /// True when the log file exists.
    bool exists() const;

    core::Result<void> append(const core::Command& command);

    /// Appends a batch with a single write under one exclusive lock.
    core::Result<void> append(const std::vector<core::Command>& commands);

    /// Reads every command in append order.
    core::Result<std::vector<core::Command>> load() const;

    /// Truncates the log to zero commands.
    core::Result<void> clear();

    /**
     * @brief Replaces the log with `rewriter(current commands)`
     *
     * Load, rewrite and replacement happen under one exclusive lock. The new
     * log is written to a temporary file and renamed over the old one.
     */
    core::Result<void> rewrite(const Rewriter& rewriter);

    /// Deletes the whole store directory.
    core::Result<void> destroy();

    const core::StoreConfig& config() const { return config_; }

    static Record encode_record(const core::Command& command);

    /**
     * @brief Decodes one record
     * @param index position of the record in the log, used in error messages
     */
    static core::Result<core::Command> decode_record(const uint8_t* data, size_t index);

    /// Decodes a whole log image.
    static core::Result<std::vector<core::Command>> decode(const std::vector<uint8_t>& bytes);

private:
    core::Result<void> ensure_initialized() const;
    core::Result<std::vector<core::Command>> read_unlocked() const;
    core::Result<void> write_unlocked(const std::vector<core::Command>& commands);
    core::Result<void> replace_unlocked(const std::vector<core::Command>& commands);

    core::StoreConfig config_;
};

/// CRC-32 (IEEE, reflected) of a byte range.
uint32_t crc32(const uint8_t* data, size_t length);

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_COMMAND_LOG_H_
