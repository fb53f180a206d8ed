#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <exception>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief File utilities shared by the merge and cleanup stages
 */
class FileUtils
{
public:
    /**
     * Lists the regular files directly inside a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @return SimpleObservable that emits file paths; invalid or unreadable directories go to onError
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Removes a file if present
     * @param file_path File to remove
     * @param error_message Receives the reason on failure
     * @return true if the file is gone afterwards
     */
    static bool removeFile(const std::string &file_path, std::string &error_message);
};
