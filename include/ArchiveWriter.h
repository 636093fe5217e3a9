#pragma once
#include <string>
#include <deque>
#include <memory>
#include <functional>
#include <filesystem>

#include "ArchiveReader.h"   // ZipCloser, zip_t

// Пишет новый ZIP во временный файл рядом с назначением и переименовывает
// его на место только в commit(). Если commit() не дошёл до конца,
// деструктор выбрасывает временный файл: частичный результат никогда
// не появляется по целевому пути.
class ArchiveWriter {
public:
    // 1980-01-01 00:00 in MS-DOS date/time, written on every entry so equal
    // inputs give byte-identical archives.
    static constexpr uint16_t FIXED_DOS_DATE = (0 << 9) | (1 << 5) | 1;
    static constexpr uint16_t FIXED_DOS_TIME = 0;

    explicit ArchiveWriter(const std::filesystem::path& destination);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // The file is read when commit() runs; it must exist until then.
    void add_file(const std::string& entry_name, const std::filesystem::path& source, bool compress);
    void add_bytes(const std::string& entry_name, std::string data, bool compress);

    size_t entry_count() const { return m_entries; }
    const std::filesystem::path& temp_path() const { return m_temp; }
    const std::filesystem::path& destination() const { return m_destination; }

    // progress: fraction 0..1 of the archive written.
    // cancelled: polled while writing; returning true aborts with
    // MergeError(Cancelled). Other failures throw MergeError(IOFailure).
    void commit(std::function<void(double)> progress = {},
                std::function<bool()> cancelled = {});

private:
    void set_entry_attributes(int64_t index, const std::string& entry_name, bool compress);
    static void on_progress(zip_t* archive, double fraction, void* self);
    static int on_cancel(zip_t* archive, void* self);

    std::filesystem::path m_destination;
    std::filesystem::path m_temp;
    std::unique_ptr<zip_t, ZipCloser> m_zip;
    std::deque<std::string> m_buffers;   // zip_source_buffer keeps pointers into these
    size_t m_entries = 0;
    bool m_committed = false;
    std::function<void(double)> m_progress;
    std::function<bool()> m_cancelled;
};
