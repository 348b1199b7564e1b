#include "file_system.hpp"
#include "error_code.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

bool PhysicalFileSystem::exists(const std::string &path) const
{
    std::error_code ec;
    return fs::exists(path, ec);
}

bool PhysicalFileSystem::is_directory(const std::string &path) const
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool PhysicalFileSystem::remove(const std::string &path)
{
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

void PhysicalFileSystem::replace_atomically(const std::string &temp_path, const std::string &final_path)
{
    // rename(2) replaces the destination atomically on the same filesystem
    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec)
    {
        throw RedactError(ErrorCode::IOFailure,
                          "Cannot move " + temp_path + " to " + final_path + ": " + ec.message());
    }
}

TempFileScope::~TempFileScope()
{
    if (released_)
        return;
    if (fs_.exists(path_) && !fs_.remove(path_))
        std::cerr << "⚠️  Failed to remove temporary file: " << path_ << "\n";
}
