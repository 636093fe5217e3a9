#pragma once
#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <cstdint>
#include <filesystem>
#include <optional>

// zip.h stays in the .cpp
struct zip;
typedef struct zip zip_t;

// Closes the libzip handle; used by unique_ptr so every exit path releases it.
struct ZipCloser { void operator()(zip_t* z) const noexcept; };

constexpr uint64_t DEFAULT_MAX_ENTRY_SIZE = 100ull * 1024 * 1024;  // 100 MiB

// Одна запись архива. Данные не загружаются: index служит ленивым дескриптором,
// действительный только пока открыт породивший его ArchiveReader.
struct ArchiveEntry {
    uint64_t index = 0;
    std::string name;          // as stored in the archive
    std::string extension;     // lower case, no dot
    uint64_t size = 0;
    uint64_t compressed_size = 0;
    bool is_symlink = false;
    bool is_encrypted = false;
    bool oversized = false;
};

class ArchiveReader {
public:
    // Throws MergeError(UnreadableArchive) for missing, zero-byte, non-ZIP or
    // unparsable files.
    explicit ArchiveReader(const std::filesystem::path& path,
                           uint64_t max_entry_size = DEFAULT_MAX_ENTRY_SIZE);

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&&) noexcept = default;
    ArchiveReader& operator=(ArchiveReader&&) noexcept = default;

    const std::filesystem::path& path() const { return m_path; }
    uint64_t entry_count() const;

    // Image entries (jpg, jpeg, png, webp, gif, bmp; case-insensitive) in
    // archive order. Throws MergeError(EmptyArchive) when there are none.
    std::vector<ArchiveEntry> list_image_entries() const;

    // Whole entry in memory. Throws MergeError(CorruptEntry).
    std::vector<char> read_entry(const ArchiveEntry& entry) const;

    // Streams the entry in fixed-size chunks. Returns bytes written.
    // Throws MergeError(CorruptEntry) on read failure, MergeError(IOFailure)
    // when `out` fails.
    uint64_t read_entry_to(const ArchiveEntry& entry, std::ostream& out) const;

    // Case-insensitive lookup of any entry by its full name.
    std::optional<ArchiveEntry> find_entry(const std::string& name) const;

    // Small non-image entries (metadata). Returns nullopt when the entry is
    // missing, larger than `limit` or unreadable.
    std::optional<std::string> read_small(const std::string& name, uint64_t limit) const;

    // Quick header check without opening through libzip.
    static bool looks_like_zip(const std::filesystem::path& path);

private:
    ArchiveEntry stat_entry(uint64_t index) const;

    std::filesystem::path m_path;
    uint64_t m_max_entry_size;
    std::unique_ptr<zip_t, ZipCloser> m_zip;
};
