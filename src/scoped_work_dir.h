#pragma once

#include <filesystem>
#include <string>

// A private temporary directory owned by one comparison run. Created in
// the constructor, removed with everything in it by the destructor.
class ScopedWorkDir {
public:
    explicit ScopedWorkDir(const std::string& prefix = "sheet_comparator");
    ~ScopedWorkDir();

    ScopedWorkDir(const ScopedWorkDir&) = delete;
    ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

    // Moves a finished file out of the work directory, replacing destination.
    static void publish(const std::filesystem::path& staged, const std::filesystem::path& destination);

private:
    std::filesystem::path path_;
};
