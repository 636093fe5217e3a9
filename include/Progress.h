#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <optional>
#include <cstddef>
#include <variant>
#include <vector>

enum class Phase { Validating, Reading, Extracting, Writing, Done, Failed, Cancelled };

const char* phase_name(Phase phase);

// Снимки прогресса неизменяемы: наблюдатель получает копию по значению,
// новый снимок заменяет предыдущий. Общего изменяемого состояния между
// рабочим потоком и UI нет.
struct MergeProgress {
    size_t total_sources = 0;
    size_t sources_completed = 0;
    std::string current_source;
    size_t total_entries = 0;
    size_t entries_written = 0;
    Phase phase = Phase::Validating;
    std::optional<std::string> error;
};

struct ExtractionProgress {
    std::string source;
    size_t entries_found = 0;
    size_t entries_extracted = 0;
    std::string current_file;
};

// Called on the worker. Implementations must return quickly; see ProgressQueue.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void on_merge_progress(MergeProgress snapshot) { (void)snapshot; }
    virtual void on_extraction_progress(ExtractionProgress snapshot) { (void)snapshot; }
};

// Buffered observer: the worker only appends under a short lock,
// the UI thread polls drain()/latest() at its own pace.
class ProgressQueue : public ProgressObserver {
public:
    using Snapshot = std::variant<MergeProgress, ExtractionProgress>;

    explicit ProgressQueue(size_t max_buffered = 4096) : m_max(max_buffered) {}

    void on_merge_progress(MergeProgress snapshot) override;
    void on_extraction_progress(ExtractionProgress snapshot) override;

    std::vector<Snapshot> drain();
    std::optional<MergeProgress> latest() const;
    size_t dropped() const;

private:
    void push(Snapshot s);

    mutable std::mutex m_mutex;
    std::deque<Snapshot> m_items;
    std::optional<MergeProgress> m_latest;
    size_t m_max;
    size_t m_dropped = 0;
};

// Emits MergeProgress at checkpoints. Keeps the last published snapshot,
// batches entry updates every `batch` entries and never lets
// entries_written go backwards.
class ProgressReporter {
public:
    ProgressReporter(ProgressObserver* observer, size_t batch);

    void begin(size_t total_sources);
    void phase(Phase p, const std::string& current_source = "");
    void source_completed(const std::string& source, size_t chapter_entries);
    void entries_written(size_t written, size_t total);
    void finish(Phase terminal, const std::optional<std::string>& error = std::nullopt);

    const MergeProgress& last() const { return m_last; }

private:
    void publish(MergeProgress next);

    ProgressObserver* m_observer;
    size_t m_batch;
    size_t m_last_batch_mark = 0;
    MergeProgress m_last;
};
