#ifndef FILE_SINK_HPP
#define FILE_SINK_HPP

#include <cstddef>
#include <filesystem>
#include <string>

/**
 * FileSink - Destination for a downloaded file, keyed by filename
 *
 * A sink holds at most one open file at a time. create() never replaces
 * an existing file.
 */
class FileSink {
public:
    virtual ~FileSink() = default;

    virtual bool exists(const std::string& name) const = 0;

    /** Create name for writing; fails if it already exists */
    virtual bool create(const std::string& name) = 0;

    /** Append to the file opened by create() */
    virtual bool write(const char* data, size_t length) = 0;

    virtual bool close() = 0;
};


/**
 * DirectorySink - Writes files into one local directory
 *
 * Only the final path component of a name is used, so a server supplied
 * name cannot escape the directory.
 */
class DirectorySink : public FileSink {
public:
    explicit DirectorySink(std::filesystem::path directory = std::filesystem::current_path());
    ~DirectorySink() override;

    DirectorySink(const DirectorySink&) = delete;
    DirectorySink& operator=(const DirectorySink&) = delete;

    bool exists(const std::string& name) const override;
    bool create(const std::string& name) override;
    bool write(const char* data, size_t length) override;
    bool close() override;

    /** Where name would be stored, empty if name has no usable component */
    std::filesystem::path resolve(const std::string& name) const;

private:
    std::filesystem::path directory;
    int file_fd = -1;
};

#endif // FILE_SINK_HPP
