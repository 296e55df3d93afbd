#include "mkp/output.hpp"

#include "mkp/log.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>

namespace makeport {

SessionDirectory SessionDirectory::create(const std::filesystem::path &root) {
    std::filesystem::path base = root;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec);
        if (ec)
            base = "/tmp";
    }

    std::mt19937 rng{std::random_device{}()};
    return SessionDirectory(base / std::format("makeport-{:08x}", static_cast<uint32_t>(rng())));
}

Result<std::filesystem::path> SessionDirectory::ensure() const {
    std::error_code ec;
    if (std::filesystem::create_directories(path_, ec)) {
        log::info("Created output directory: {}", path_.string());
    }
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", path_.string(), ec.message()));
    }
    return path_;
}

OutputManager::OutputManager(OutputConfig config, SessionDirectory session)
    : config_(std::move(config)), session_(std::move(session)) {
}

size_t utf8_prefix_length(std::string_view text, size_t limit) {
    if (limit >= text.size())
        return text.size();
    size_t cut = limit;
    // back off while the first dropped byte is a continuation byte
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        cut--;
    return cut;
}

Result<std::filesystem::path> OutputManager::write_artifact(std::string_view target, std::string_view raw_output) const {
    auto dir = session_.ensure();
    if (!dir)
        return std::unexpected(dir.error());

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed);
    std::filesystem::path file = *dir / std::format("{}-{}-{}.log", target, millis, seq);

    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return std::unexpected(std::format("Failed to open {} for writing", file.string()));
    out.write(raw_output.data(), static_cast<std::streamsize>(raw_output.size()));
    out.close();
    if (!out)
        return std::unexpected(std::format("Failed to write {}", file.string()));
    return file;
}

ProcessedOutput OutputManager::process(std::string_view target, std::string_view raw_output) const {
    ProcessedOutput processed;
    processed.original_length = raw_output.size();

    if (config_.write_to_file) {
        if (auto file = write_artifact(target, raw_output); file) {
            log::info("Wrote full output of '{}' to {}", target, file->string());
            processed.artifact = OutputArtifact{std::move(*file)};
        } else {
            log::warn("Could not persist output of '{}': {}", target, file.error());
        }
    }

    const size_t limit = config_.max_output_chars;
    if (limit == 0 || raw_output.size() <= limit) {
        processed.text = std::string(raw_output);
        return processed;
    }

    const size_t kept = utf8_prefix_length(raw_output, limit);
    processed.truncated = true;
    processed.text = std::string(raw_output.substr(0, kept));
    processed.text += std::format("\n\n... (output truncated: showing {} of {} characters)\n", kept, raw_output.size());
    if (processed.artifact) {
        processed.text += std::format("Full output written to: {}\n", processed.artifact->path.string());
    } else {
        processed.text += "Configure targets to log verbose output to files and return summaries instead.\n";
    }
    return processed;
}

} // namespace makeport
