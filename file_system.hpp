#pragma once

#include <string>
#include <utility>

class FileSystem
{
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string &path) const = 0;
    virtual bool is_directory(const std::string &path) const = 0;

    // Returns false if the file could not be removed. Missing files are not an error.
    virtual bool remove(const std::string &path) = 0;

    // Moves temp_path over final_path in one step. Throws RedactError(IOFailure).
    virtual void replace_atomically(const std::string &temp_path, const std::string &final_path) = 0;
};

class PhysicalFileSystem : public FileSystem
{
public:
    bool exists(const std::string &path) const override;
    bool is_directory(const std::string &path) const override;
    bool remove(const std::string &path) override;
    void replace_atomically(const std::string &temp_path, const std::string &final_path) override;
};

// Deletes a file when the scope ends unless release() was called.
class TempFileScope
{
public:
    TempFileScope(FileSystem &fs, std::string path) : fs_(fs), path_(std::move(path)) {}
    ~TempFileScope();

    TempFileScope(const TempFileScope &) = delete;
    TempFileScope &operator=(const TempFileScope &) = delete;

    const std::string &path() const { return path_; }
    void release() { released_ = true; }

private:
    FileSystem &fs_;
    std::string path_;
    bool released_ = false;
};
