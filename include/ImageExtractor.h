#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <filesystem>

#include "ArchiveReader.h"
#include "ImageFormats.h"
#include "MergeError.h"
#include "PathValidator.h"
#include "Progress.h"

// Запись главы после переименования: ch{chapter}_{page:03d}.{ext}
struct RenamedEntry {
    std::string source_name;             // original entry name inside the archive
    std::string target_name;             // ch1_001.jpg
    std::string extension;
    int chapter = 0;
    int page = 0;                        // 1-based, after natural sort
    uint64_t size = 0;
    std::filesystem::path staged_path;   // bytes on disk, inside the staging area
};

struct ChapterGroup {
    std::filesystem::path source;
    int chapter = 0;
    std::vector<RenamedEntry> entries;
    std::vector<Issue> issues;           // skipped entries with reasons
};

std::string chapter_entry_name(int chapter, int page, const std::string& ext);

// Извлекает страницы одного архива:
//   1. открывает источник через ArchiveReader
//   2. оставляет только выбранные форматы
//   3. упорядочивает естественной сортировкой
//   4. нумерует страницы с 1
//   5. пишет файлы ch{N}_{page:03d}.{ext} в destination_dir (каждое имя проходит PathValidator)
//   6. после каждой записанной страницы отправляет ExtractionProgress
//
// Битая запись пропускается с предупреждением; ошибка возникает, только если не
// уцелело ни одной записи. При любой ошибке (и при отмене) файлы, записанные
// этим вызовом, удаляются. Уже существующий файл с целевым именем не
// перезаписывается: extract() завершается с IOFailure.
class ImageExtractor {
public:
    ImageExtractor() = default;

    void set_observer(ProgressObserver* observer) { m_observer = observer; }
    void set_cancel_flag(const std::atomic<bool>* flag) { m_cancel = flag; }
    // strict: a rejected entry path fails the whole extraction
    void set_strict(bool strict) { m_strict = strict; }
    void set_max_entry_size(uint64_t bytes) { m_max_entry_size = bytes; }

    ChapterGroup extract(const std::filesystem::path& source,
                         int chapter_index,
                         const FormatSet& selected_formats,
                         const std::filesystem::path& destination_dir) const;

private:
    bool cancel_requested() const { return m_cancel && m_cancel->load(); }
    void emit(const ExtractionProgress& snapshot) const;

    PathValidator m_validator;
    ProgressObserver* m_observer = nullptr;
    const std::atomic<bool>* m_cancel = nullptr;
    bool m_strict = false;
    uint64_t m_max_entry_size = DEFAULT_MAX_ENTRY_SIZE;
};
