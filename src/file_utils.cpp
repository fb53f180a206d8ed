#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <stdexcept>
#include <system_error>

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    // Validate directory exists
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    for (const auto &entry : fs::directory_iterator(dir_path))
                    {
                        if (entry.is_regular_file())
                        {
                            onNext(entry.path().string());
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::is_directory(dir_path, ec) && !ec;
}

bool FileUtils::removeFile(const std::string &file_path, std::string &error_message)
{
    std::error_code ec;
    fs::remove(file_path, ec);
    if (ec)
    {
        error_message = ec.message();
        return false;
    }
    return true;
}
