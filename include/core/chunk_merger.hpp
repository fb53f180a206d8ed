#pragma once

#include "core/processing_result.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief One chunk file with its ordering key
 */
struct ChunkFile
{
    std::string path;
    std::string file_name;
    int64_t sequence_key;
};

/**
 * @brief Destination of merged bytes
 */
class MergeOutput
{
public:
    virtual ~MergeOutput() = default;
    virtual bool write(const char *data, size_t size) = 0;
    virtual bool close() = 0;
};

/**
 * @brief Result of a merge run
 */
struct MergeResult
{
    StageResult status;
    std::vector<ChunkFile> chunks;
    uint64_t bytes_written = 0;
    // At least one chunk had no usable sequence number
    bool degraded = false;
};

/**
 * @brief Concatenates the chunk files of a task into a single artifact
 *
 * Chunks are ordered by the first run of digits in their file name. Ties keep
 * file-name order. On any failure no artifact is left behind.
 */
class ChunkMerger
{
public:
    using OutputFactory = std::function<std::unique_ptr<MergeOutput>(const std::string &path)>;

    static constexpr int64_t kUnnumberedKey = -1;

    struct Options
    {
        std::string chunk_extension = ".chunk";
        size_t buffer_size = 64 * 1024;
        bool reject_unnumbered = false;
    };

    explicit ChunkMerger(Options options,
                         std::shared_ptr<spdlog::logger> logger = nullptr,
                         OutputFactory output_factory = nullptr);

    /**
     * @brief Merge every chunk under input_dir into output_file
     * @param input_dir Directory holding the chunk files
     * @param output_file Artifact to create (truncated if present)
     */
    MergeResult merge(const std::string &input_dir, const std::string &output_file);

    /**
     * @brief Enumerate and order the chunk files of input_dir without merging
     */
    MergeResult collectChunks(const std::string &input_dir) const;

    /**
     * @brief Ordering key of a chunk file name
     * @return The first maximal run of decimal digits in the base name, or kUnnumberedKey
     */
    static int64_t extractSequenceKey(const std::string &file_name);

    /**
     * @brief Sort by file name, then stable-sort by key
     */
    static void orderChunks(std::vector<ChunkFile> &chunks);

    /**
     * @brief Default output: a binary std::ofstream
     */
    static std::unique_ptr<MergeOutput> openFileOutput(const std::string &path);

private:
    bool copyChunk(const ChunkFile &chunk, MergeOutput &output, std::vector<char> &buffer,
                   uint64_t &bytes_written, std::string &error_message) const;
    void discardArtifact(const std::string &output_file, StageResult &status) const;

    Options options_;
    std::shared_ptr<spdlog::logger> logger_;
    OutputFactory output_factory_;
};
