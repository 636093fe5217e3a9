#include "MergeEngine.h"
#include "ArchiveWriter.h"
#include "ComicInfo.h"
#include "Logger.h"
#include "PathValidator.h"
#include "StagingDir.h"
#include <map>
#include <set>
#include <mutex>
#include <cmath>
#include <utility>
#include <exception>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    // Выходные пути, в которые сейчас пишет какой-либо движок процесса.
    std::mutex g_outputs_mutex;
    std::set<std::string> g_outputs;

    std::string output_key(const fs::path& output) {
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(output, ec);
        return (ec ? fs::absolute(output) : canonical).lexically_normal().string();
    }

    class OutputLock {
    public:
        explicit OutputLock(const fs::path& output) : m_key(output_key(output)) {
            std::lock_guard<std::mutex> lock(g_outputs_mutex);
            if (!g_outputs.insert(m_key).second)
                throw MergeError(ErrorKind::OperationInProgress, output.string() + " is already being written");
        }
        ~OutputLock() {
            std::lock_guard<std::mutex> lock(g_outputs_mutex);
            g_outputs.erase(m_key);
        }
        OutputLock(const OutputLock&) = delete;
        OutputLock& operator=(const OutputLock&) = delete;
    private:
        std::string m_key;
    };

    // Clears the busy flag on every exit path.
    class BusyGuard {
    public:
        explicit BusyGuard(std::atomic<bool>& busy) : m_busy(busy) {}
        ~BusyGuard() { m_busy = false; }
        BusyGuard(const BusyGuard&) = delete;
        BusyGuard& operator=(const BusyGuard&) = delete;
    private:
        std::atomic<bool>& m_busy;
    };

    MergeResult busy_result(const fs::path& output) {
        MergeResult result;
        result.output_path = output;
        result.error_kind = ErrorKind::OperationInProgress;
        result.error = "another merge is already running on this engine";
        Logger::warn("Merge into " + output.string() + " rejected: " + result.error);
        return result;
    }

    void check_source(const SourceEntry& source) {
        std::error_code ec;
        if (!fs::is_regular_file(source.path, ec))
            throw MergeError(ErrorKind::UnreadableArchive, source.path.string() + ": not a regular file");
        auto detected = detect_source_kind(source.path);
        if (!detected || *detected != source.kind) {
            throw MergeError(ErrorKind::UnreadableArchive,
                             source.path.string() + ": declared " + source_kind_name(source.kind) +
                             " but the file extension is '" + source.path.extension().string() + "'");
        }
    }

    // Metadata only: any failure means "omit ComicInfo.xml", never a failed source.
    std::optional<std::string> read_comic_info(const fs::path& source, uint64_t max_entry_size) {
        std::optional<std::string> xml;
        try {
            ArchiveReader reader(source, max_entry_size);
            xml = reader.read_small(COMIC_INFO_NAME, MAX_COMIC_INFO_SIZE);
        }
        catch (const std::exception& e) {
            Logger::warn(source.filename().string() + ": " + COMIC_INFO_NAME + " not copied: " + e.what());
            return std::nullopt;
        }
        if (!xml) return std::nullopt;
        ComicInfoCheck check = check_comic_info(*xml);
        if (!check.well_formed) {
            Logger::warn(source.filename().string() + ": " + COMIC_INFO_NAME + " not copied: " + check.error);
            return std::nullopt;
        }
        return xml;
    }
}

const char* source_kind_name(SourceKind kind) {
    switch (kind) {
    case SourceKind::CBZ: return "CBZ";
    case SourceKind::ZIP: return "ZIP";
    }
    return "Unknown";
}

std::optional<SourceKind> detect_source_kind(const fs::path& path) {
    std::string ext = extension_of(path.filename().string());
    if (ext == "cbz") return SourceKind::CBZ;
    if (ext == "zip") return SourceKind::ZIP;
    return std::nullopt;
}

const char* engine_state_name(EngineState state) {
    switch (state) {
    case EngineState::Idle:       return "Idle";
    case EngineState::Validating: return "Validating";
    case EngineState::Processing: return "Processing";
    case EngineState::Finalizing: return "Finalizing";
    case EngineState::Done:       return "Done";
    case EngineState::Failed:     return "Failed";
    }
    return "Unknown";
}

bool resolve_collisions(std::vector<RenamedEntry>& entries) {
    std::set<std::pair<int, int>> seen;
    std::set<int> colliding;
    for (const auto& e : entries) {
        if (!seen.insert({ e.chapter, e.page }).second) colliding.insert(e.chapter);
    }
    if (colliding.empty()) return false;

    int position = 0;
    for (auto& e : entries) {
        ++position;
        if (!colliding.count(e.chapter)) continue;
        e.page = position;
        e.target_name = chapter_entry_name(e.chapter, position, e.extension);
    }

    std::string list;
    for (int ch : colliding) list += (list.empty() ? "" : ", ") + std::to_string(ch);
    Logger::warn("Page collision in chapter(s) " + list + "; pages renumbered by position in the merged stream");
    return true;
}

SourceValidation validate_sources(const std::vector<SourceEntry>& sources, uint64_t max_entry_size) {
    SourceValidation summary;
    for (const auto& source : sources) {
        try {
            if (source.chapter && *source.chapter < 1)
                throw MergeError(ErrorKind::InvalidChapter, source.path.string() + ": chapter " +
                                 std::to_string(*source.chapter) + " is below 1");
            check_source(source);
            SourceInfo info = inspect_source(source.path, max_entry_size);
            summary.total_size += info.file_size;
            summary.total_pages += info.page_count;
            summary.valid.push_back(std::move(info));
        }
        catch (const MergeError& e) {
            summary.invalid.push_back({ e.kind(), source.path.string(), e.what() });
        }
    }
    return summary;
}

MergeEngine::~MergeEngine() {
    if (m_worker.joinable()) m_worker.join();
}

bool MergeEngine::set_observer(ProgressObserver* observer) {
    if (m_busy.load()) return false;
    m_observer = observer;
    return true;
}

bool MergeEngine::acquire() {
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true)) return false;
    m_cancel = false;
    return true;
}

void MergeEngine::check_cancel() const {
    if (m_cancel.load()) throw MergeError(ErrorKind::Cancelled, "merge cancelled");
}

MergeResult MergeEngine::merge(const std::vector<SourceEntry>& sources,
                               const fs::path& output,
                               const MergeOptions& options) {
    if (!acquire()) return busy_result(output);
    BusyGuard guard(m_busy);
    return run(sources, output, options);
}

std::future<MergeResult> MergeEngine::start(std::vector<SourceEntry> sources,
                                            fs::path output,
                                            MergeOptions options) {
    std::promise<MergeResult> promise;
    std::future<MergeResult> future = promise.get_future();
    if (!acquire()) {
        promise.set_value(busy_result(output));
        return future;
    }
    // the previous worker has already released the flag; reap it
    if (m_worker.joinable()) m_worker.join();

    m_worker = std::thread([this, promise = std::move(promise), sources = std::move(sources),
                            output = std::move(output), options = std::move(options)]() mutable {
        MergeResult result;
        {
            BusyGuard guard(m_busy);
            result = run(sources, output, options);
        }
        promise.set_value(std::move(result));
    });
    return future;
}

MergeResult MergeEngine::run(const std::vector<SourceEntry>& sources,
                             const fs::path& output,
                             const MergeOptions& options) {
    MergeResult result;
    result.output_path = output;

    ProgressObserver* observer = m_observer.load();
    ProgressReporter reporter(observer, options.progress_batch);
    m_state = EngineState::Validating;
    reporter.begin(sources.size());
    Logger::info("Merge started: " + std::to_string(sources.size()) + " source(s) -> " + output.string());

    try {
        // ---- Validating ----
        if (options.selected_formats.empty())
            throw MergeError(ErrorKind::NoFormatsSelected, "no image formats selected");
        if (sources.empty())
            throw MergeError(ErrorKind::EmptyArchive, "no sources to merge");

        for (const auto& source : sources) {
            if (source.chapter && *source.chapter < 1)
                throw MergeError(ErrorKind::InvalidChapter, source.path.string() + ": chapter " +
                                 std::to_string(*source.chapter) + " is below 1");
        }

        PathValidator validator;
        PathCheck out_check = validator.validate_output_file(output, options.overwrite);
        if (!out_check)
            throw MergeError(ErrorKind::InvalidOutput, output.string() + ": " + out_check.reason);

        OutputLock output_lock(output);
        StagingDir staging(options.staging_root);

        ImageExtractor extractor;
        extractor.set_observer(observer);
        extractor.set_cancel_flag(&m_cancel);
        extractor.set_strict(options.strict_mode);
        extractor.set_max_entry_size(options.max_entry_size);

        // ---- Processing ----
        m_state = EngineState::Processing;
        std::vector<ChapterGroup> groups;
        std::optional<std::string> comic_info;

        for (size_t i = 0; i < sources.size(); ++i) {
            check_cancel();
            const SourceEntry& source = sources[i];
            const std::string name = source.path.filename().string();
            const int chapter = source.chapter.value_or(static_cast<int>(i + 1));

            reporter.phase(source.kind == SourceKind::ZIP ? Phase::Extracting : Phase::Reading, name);
            try {
                check_source(source);
                fs::path dir = staging.subdir("source_" + std::to_string(i + 1));
                ChapterGroup group = extractor.extract(source.path, chapter, options.selected_formats, dir);

                if (i == 0 && options.copy_comic_info)
                    comic_info = read_comic_info(source.path, options.max_entry_size);

                result.issues.insert(result.issues.end(), group.issues.begin(), group.issues.end());
                result.chapters.push_back({ source.path, source.kind, chapter, group.entries.size() });
                reporter.source_completed(name, group.entries.size());
                groups.push_back(std::move(group));
            }
            catch (const MergeError& e) {
                bool fatal = options.strict_mode ||
                             e.kind() == ErrorKind::Cancelled ||
                             e.kind() == ErrorKind::IOFailure ||
                             e.kind() == ErrorKind::NoFormatsSelected;
                if (fatal) throw;
                Logger::warn("Skipped source " + source.path.string() + " [" + error_kind_name(e.kind()) + "] " + e.what());
                result.issues.push_back({ e.kind(), source.path.string(), e.what() });
                reporter.source_completed(name, 0);
            }
        }

        if (groups.empty())
            throw MergeError(ErrorKind::EmptyArchive, "no source produced any pages");

        // ---- Finalizing ----
        m_state = EngineState::Finalizing;
        std::vector<RenamedEntry> pages;
        for (auto& g : groups) {
            for (auto& e : g.entries) pages.push_back(std::move(e));
        }
        result.resequenced = resolve_collisions(pages);

        ArchiveWriter writer(output);
        for (const auto& page : pages) {
            check_cancel();
            PathCheck check = validator.validate(page.target_name);
            if (!check) {
                if (options.strict_mode)
                    throw MergeError(ErrorKind::PathRejected, page.target_name + ": " + check.reason);
                Logger::warn("Skipped output entry " + page.target_name + ": " + check.reason);
                result.issues.push_back({ ErrorKind::PathRejected, page.target_name, check.reason });
                continue;
            }
            writer.add_file(page.target_name, page.staged_path, false);
            result.entry_names.push_back(page.target_name);
        }
        if (comic_info) {
            writer.add_bytes(COMIC_INFO_NAME, std::move(*comic_info), true);
            result.comic_info_copied = true;
        }

        const size_t total = result.entry_names.size();
        reporter.phase(Phase::Writing, output.filename().string());
        reporter.entries_written(0, total);
        writer.commit(
            [&reporter, total](double fraction) {
                auto written = static_cast<size_t>(std::floor(fraction * static_cast<double>(total)));
                reporter.entries_written(written, total);
            },
            [this]() { return m_cancel.load(); });
        reporter.entries_written(total, total);

        result.total_pages = total;
        result.success = true;
        m_state = EngineState::Done;
        reporter.finish(Phase::Done);
        Logger::info("Merge finished: " + output.string() + " (" + std::to_string(total) + " pages, " +
                     std::to_string(groups.size()) + " chapter(s), " +
                     std::to_string(result.issues.size()) + " issue(s))");
    }
    catch (const MergeError& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.error = e.what();
        result.entry_names.clear();
        result.total_pages = 0;
        result.comic_info_copied = false;
        m_state = EngineState::Failed;
        reporter.finish(e.kind() == ErrorKind::Cancelled ? Phase::Cancelled : Phase::Failed, result.error);
        if (e.kind() == ErrorKind::Cancelled)
            Logger::warn("Merge into " + output.string() + " cancelled");
        else
            Logger::error("Merge into " + output.string() + " failed [" + error_kind_name(e.kind()) + "]: " + e.what());
    }
    catch (const std::exception& e) {
        result.success = false;
        result.error_kind = ErrorKind::IOFailure;
        result.error = e.what();
        result.entry_names.clear();
        result.total_pages = 0;
        result.comic_info_copied = false;
        m_state = EngineState::Failed;
        reporter.finish(Phase::Failed, result.error);
        Logger::error("Merge into " + output.string() + " failed: " + e.what());
    }
    return result;
}
