#pragma once

#include "mkp/domain.hpp"
#include "mkp/utility.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace makeport {

struct OutputConfig {
    size_t max_output_chars = 0; ///< 0 means unlimited.
    bool write_to_file = false;
    std::filesystem::path temp_dir_root; ///< Empty selects the system temp directory.
};

/**
 * @brief The per-process directory that artifacts are written into.
 *
 * The name is randomized once at startup; the directory itself is created on
 * first use. Concurrent invocations only ever create distinct files in it.
 */
class SessionDirectory {
public:
    explicit SessionDirectory(std::filesystem::path path) : path_(std::move(path)) {
    }

    /**
     * @brief Picks `<root>/makeport-<8 hex digits>`.
     * @param root Parent directory; empty selects the system temp directory.
     */
    static SessionDirectory create(const std::filesystem::path &root = {});

    const std::filesystem::path &path() const {
        return path_;
    }

    /// Creates the directory if needed.
    Result<std::filesystem::path> ensure() const;

private:
    std::filesystem::path path_;
};

struct ProcessedOutput {
    std::string text;
    std::optional<OutputArtifact> artifact;
    bool truncated = false;
    size_t original_length = 0;
};

/**
 * @brief Truncates captured output and optionally persists it in full.
 */
class OutputManager {
public:
    OutputManager(OutputConfig config, SessionDirectory session);

    /**
     * @brief Produces the text to hand back for one invocation.
     *
     * With file writing enabled the untruncated output is written to a new
     * file named after the target, the time and a sequence number. A failed
     * write is logged and leaves `artifact` empty. The returned text is cut to
     * at most `max_output_chars` bytes on a UTF-8 boundary and followed by a
     * note when the output is longer than that.
     */
    ProcessedOutput process(std::string_view target, std::string_view raw_output) const;

    const OutputConfig &config() const {
        return config_;
    }
    const SessionDirectory &session() const {
        return session_;
    }

private:
    Result<std::filesystem::path> write_artifact(std::string_view target, std::string_view raw_output) const;

    OutputConfig config_;
    SessionDirectory session_;
    mutable std::atomic<uint64_t> sequence_{0};
};

/// Largest prefix length not above `limit` that does not split a UTF-8 sequence.
size_t utf8_prefix_length(std::string_view text, size_t limit);

} // namespace makeport
