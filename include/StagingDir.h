#pragma once
#include <filesystem>
#include <string>

// Transient working directory owned by exactly one operation.
// Created in the constructor, removed recursively in the destructor,
// whatever the exit path (success, failure, cancellation).
class StagingDir {
public:
    static constexpr const char* PREFIX = "comicmerge_";

    // root defaults to the system temp directory
    explicit StagingDir(const std::filesystem::path& root = {});
    ~StagingDir();

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    // Fresh subdirectory, e.g. one per chapter.
    std::filesystem::path subdir(const std::string& name) const;

    // Removes staging directories under root whose owning process no longer
    // exists. Returns how many were removed.
    static size_t sweep_stale(const std::filesystem::path& root = {});

private:
    std::filesystem::path m_path;
};
