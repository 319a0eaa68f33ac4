#pragma once
#include <ctime>
#include <string>

// File access the editor needs from its host. The codec and editors never
// touch the filesystem themselves.
class FileHost {
public:
    virtual ~FileHost() = default;
    virtual std::string read_text(const std::string& path) = 0;
    virtual void write_text(const std::string& path, const std::string& data) = 0;
    // Copies path next to itself and returns the copy's path.
    virtual std::string copy_file(const std::string& path) = 0;
};

class LocalFileHost : public FileHost {
public:
    std::string read_text(const std::string& path) override;
    void write_text(const std::string& path, const std::string& data) override;
    std::string copy_file(const std::string& path) override;
};

// "<path>.backup_YYYYMMDD_HHMMSS" in local time.
std::string backup_path_for(const std::string& path, std::time_t when);
