#include "core/chunk_merger.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>

namespace
{
    class FileMergeOutput : public MergeOutput
    {
    public:
        explicit FileMergeOutput(const std::string &path)
            : stream_(path, std::ios::binary | std::ios::trunc) {}

        bool isOpen() const { return stream_.is_open(); }

        bool write(const char *data, size_t size) override
        {
            stream_.write(data, static_cast<std::streamsize>(size));
            return stream_.good();
        }

        bool close() override
        {
            stream_.flush();
            bool ok = stream_.good();
            stream_.close();
            return ok && !stream_.fail();
        }

    private:
        std::ofstream stream_;
    };

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

ChunkMerger::ChunkMerger(Options options, std::shared_ptr<spdlog::logger> logger, OutputFactory output_factory)
    : options_(std::move(options)),
      logger_(logger ? std::move(logger) : Logger::get()),
      output_factory_(output_factory ? std::move(output_factory) : OutputFactory(&ChunkMerger::openFileOutput))
{
    if (options_.buffer_size == 0)
        options_.buffer_size = 64 * 1024;
}

std::unique_ptr<MergeOutput> ChunkMerger::openFileOutput(const std::string &path)
{
    auto output = std::make_unique<FileMergeOutput>(path);
    if (!output->isOpen())
        return nullptr;
    return output;
}

int64_t ChunkMerger::extractSequenceKey(const std::string &file_name)
{
    const std::string base = fs::path(file_name).filename().string();

    auto first = std::find_if(base.begin(), base.end(), [](unsigned char c)
                              { return std::isdigit(c) != 0; });
    if (first == base.end())
        return kUnnumberedKey;
    auto last = std::find_if(first, base.end(), [](unsigned char c)
                             { return std::isdigit(c) == 0; });

    constexpr int64_t max_key = std::numeric_limits<int64_t>::max();
    int64_t value = 0;
    for (auto it = first; it != last; ++it)
    {
        int digit = *it - '0';
        if (value > (max_key - digit) / 10)
            return kUnnumberedKey;
        value = value * 10 + digit;
    }
    return value;
}

void ChunkMerger::orderChunks(std::vector<ChunkFile> &chunks)
{
    std::sort(chunks.begin(), chunks.end(), [](const ChunkFile &a, const ChunkFile &b)
              { return a.file_name < b.file_name; });
    std::stable_sort(chunks.begin(), chunks.end(), [](const ChunkFile &a, const ChunkFile &b)
                     { return a.sequence_key < b.sequence_key; });
}

MergeResult ChunkMerger::collectChunks(const std::string &input_dir) const
{
    MergeResult result;

    if (!FileUtils::isValidDirectory(input_dir))
    {
        result.status = StageResult::Failure(PipelineErrorKind::NoChunksFound,
                                             "failed to find chunks",
                                             "source directory does not exist: " + input_dir);
        return result;
    }

    std::string listing_error;
    FileUtils::listFilesAsObservable(input_dir).subscribe(
        [this, &result](const std::string &file_path)
        {
            std::string name = fs::path(file_path).filename().string();
            if (!endsWith(name, options_.chunk_extension))
                return;
            result.chunks.push_back(ChunkFile{file_path, name, extractSequenceKey(name)});
        },
        [&listing_error](const std::exception &e)
        {
            listing_error = e.what();
        },
        []() {});

    if (!listing_error.empty())
    {
        result.chunks.clear();
        result.status = StageResult::Failure(PipelineErrorKind::MergeIOError,
                                             "failed to find chunks", listing_error);
        return result;
    }

    if (result.chunks.empty())
    {
        result.status = StageResult::Failure(PipelineErrorKind::NoChunksFound,
                                             "failed to find chunks",
                                             "no *" + options_.chunk_extension + " files in " + input_dir);
        return result;
    }

    orderChunks(result.chunks);

    for (const auto &chunk : result.chunks)
    {
        if (chunk.sequence_key == kUnnumberedKey)
        {
            result.degraded = true;
            logger_->warn("Chunk has no sequence number, ordering it first path={}", chunk.path);
        }
    }

    if (result.degraded && options_.reject_unnumbered)
    {
        result.status = StageResult::Failure(PipelineErrorKind::InvalidChunkName,
                                             "chunk without sequence number",
                                             "unnumbered chunk files in " + input_dir);
    }
    return result;
}

MergeResult ChunkMerger::merge(const std::string &input_dir, const std::string &output_file)
{
    MergeResult result = collectChunks(input_dir);
    if (!result.status.success)
        return result;

    logger_->info("Merging chunks path={} chunks={} output={}", input_dir, result.chunks.size(), output_file);

    std::unique_ptr<MergeOutput> output = output_factory_(output_file);
    if (!output)
    {
        result.status = StageResult::Failure(PipelineErrorKind::MergeIOError,
                                             "failed to create output file", output_file);
        discardArtifact(output_file, result.status);
        return result;
    }

    std::vector<char> buffer(options_.buffer_size);
    for (const auto &chunk : result.chunks)
    {
        std::string error_message;
        if (!copyChunk(chunk, *output, buffer, result.bytes_written, error_message))
        {
            output->close();
            output.reset();
            result.status = StageResult::Failure(PipelineErrorKind::MergeIOError,
                                                 "failed to write chunk " + chunk.path + " to merged file",
                                                 error_message);
            discardArtifact(output_file, result.status);
            return result;
        }
    }

    if (!output->close())
    {
        output.reset();
        result.status = StageResult::Failure(PipelineErrorKind::MergeIOError,
                                             "failed to close merged file", output_file);
        discardArtifact(output_file, result.status);
        return result;
    }

    logger_->debug("Merged {} bytes into {}", result.bytes_written, output_file);
    result.status = StageResult::Ok();
    return result;
}

bool ChunkMerger::copyChunk(const ChunkFile &chunk, MergeOutput &output, std::vector<char> &buffer,
                            uint64_t &bytes_written, std::string &error_message) const
{
    std::ifstream input(chunk.path, std::ios::binary);
    if (!input.is_open())
    {
        error_message = "failed to open chunk: " + std::string(std::strerror(errno));
        return false;
    }

    while (input)
    {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = input.gcount();
        if (input.bad())
        {
            error_message = "failed to read chunk";
            return false;
        }
        if (count > 0)
        {
            if (!output.write(buffer.data(), static_cast<size_t>(count)))
            {
                error_message = "failed to write merged file";
                return false;
            }
            bytes_written += static_cast<uint64_t>(count);
        }
    }
    return true;
}

void ChunkMerger::discardArtifact(const std::string &output_file, StageResult &status) const
{
    std::string remove_error;
    if (!FileUtils::removeFile(output_file, remove_error))
    {
        logger_->error("Failed to remove partial merged file path={} error={}", output_file, remove_error);
        status.details += "; partial merged file could not be removed: " + remove_error;
    }
}
