#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <future>
#include <thread>
#include <optional>
#include <filesystem>

#include "ArchiveReader.h"
#include "ImageExtractor.h"
#include "ImageFormats.h"
#include "MergeError.h"
#include "Progress.h"
#include "SourceInfo.h"

enum class SourceKind { CBZ, ZIP };

const char* source_kind_name(SourceKind kind);

// By extension: .cbz -> CBZ, .zip -> ZIP (case-insensitive).
std::optional<SourceKind> detect_source_kind(const std::filesystem::path& path);

// Источник слияния. Порядок в списке задаёт порядок глав.
struct SourceEntry {
    std::filesystem::path path;
    size_t position = 0;
    SourceKind kind = SourceKind::CBZ;
    std::optional<int> chapter;     // explicit chapter number, else 1-based position
};

struct MergeOptions {
    FormatSet selected_formats = supported_formats();
    bool strict_mode = false;
    bool copy_comic_info = true;
    bool overwrite = false;
    size_t progress_batch = 10;
    uint64_t max_entry_size = DEFAULT_MAX_ENTRY_SIZE;
    std::filesystem::path staging_root;     // empty: system temp directory
};

struct ChapterSummary {
    std::filesystem::path source;
    SourceKind kind = SourceKind::CBZ;
    int chapter = 0;
    size_t pages = 0;
};

struct MergeResult {
    bool success = false;
    std::filesystem::path output_path;
    std::optional<ErrorKind> error_kind;
    std::string error;
    std::vector<Issue> issues;              // skipped entries and sources
    std::vector<ChapterSummary> chapters;
    std::vector<std::string> entry_names;   // final archive order
    size_t total_pages = 0;
    bool comic_info_copied = false;
    bool resequenced = false;               // page numbers re-derived after a collision
};

enum class EngineState { Idle, Validating, Processing, Finalizing, Done, Failed };

const char* engine_state_name(EngineState state);

// Одна операция за раз на экземпляр. merge() синхронный; start() запускает
// тот же merge() в выделенном рабочем потоке. Второй вызов во время работы
// получает OperationInProgress; то же самое для двух движков, пишущих
// в один и тот же выходной путь.
class MergeEngine {
public:
    MergeEngine() = default;
    ~MergeEngine();

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    // Observer is called on the worker; it must outlive the operation.
    // Refused (false) while an operation is running.
    bool set_observer(ProgressObserver* observer);

    MergeResult merge(const std::vector<SourceEntry>& sources,
                      const std::filesystem::path& output,
                      const MergeOptions& options);

    std::future<MergeResult> start(std::vector<SourceEntry> sources,
                                   std::filesystem::path output,
                                   MergeOptions options);

    // Checked at every entry boundary and while the archive is written.
    void request_cancel() { m_cancel = true; }

    bool busy() const { return m_busy.load(); }
    EngineState state() const { return m_state.load(); }

private:
    bool acquire();
    MergeResult run(const std::vector<SourceEntry>& sources,
                    const std::filesystem::path& output,
                    const MergeOptions& options);
    void check_cancel() const;

    std::atomic<ProgressObserver*> m_observer{nullptr};
    std::atomic<bool> m_busy{false};
    std::atomic<bool> m_cancel{false};
    std::atomic<EngineState> m_state{EngineState::Idle};
    std::thread m_worker;
};

// Проверка списка источников до слияния: каждый открывается и
// просматривается, ничего не извлекается.
struct SourceValidation {
    std::vector<SourceInfo> valid;
    std::vector<Issue> invalid;
    uint64_t total_size = 0;
    size_t total_pages = 0;

    bool all_valid() const { return invalid.empty(); }
};

SourceValidation validate_sources(const std::vector<SourceEntry>& sources,
                                  uint64_t max_entry_size = DEFAULT_MAX_ENTRY_SIZE);

// Orders the concatenated chapter groups into the final entry list. When two
// entries share a chapter and page, every entry of that chapter is renumbered
// by its 1-based position in the concatenated stream. Returns true if any
// renumbering happened.
bool resolve_collisions(std::vector<RenamedEntry>& entries);
