#include "Progress.h"
#include <algorithm>
#include <exception>
#include "Logger.h"

const char* phase_name(Phase phase) {
    switch (phase) {
    case Phase::Validating: return "validating";
    case Phase::Reading:    return "reading";
    case Phase::Extracting: return "extracting";
    case Phase::Writing:    return "writing";
    case Phase::Done:       return "done";
    case Phase::Failed:     return "failed";
    case Phase::Cancelled:  return "cancelled";
    }
    return "unknown";
}

// === ProgressQueue ===
void ProgressQueue::on_merge_progress(MergeProgress snapshot) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_latest = snapshot;
    }
    push(std::move(snapshot));
}

void ProgressQueue::on_extraction_progress(ExtractionProgress snapshot) {
    push(std::move(snapshot));
}

void ProgressQueue::push(Snapshot s) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // bounded: oldest snapshots go first
    if (m_items.size() >= m_max) {
        m_items.pop_front();
        ++m_dropped;
    }
    m_items.push_back(std::move(s));
}

std::vector<ProgressQueue::Snapshot> ProgressQueue::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Snapshot> out(std::make_move_iterator(m_items.begin()),
                              std::make_move_iterator(m_items.end()));
    m_items.clear();
    return out;
}

std::optional<MergeProgress> ProgressQueue::latest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latest;
}

size_t ProgressQueue::dropped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

// === ProgressReporter ===
ProgressReporter::ProgressReporter(ProgressObserver* observer, size_t batch)
    : m_observer(observer), m_batch(std::max<size_t>(1, batch)) {}

void ProgressReporter::begin(size_t total_sources) {
    MergeProgress next;
    next.total_sources = total_sources;
    next.phase = Phase::Validating;
    m_last_batch_mark = 0;
    publish(next);
}

void ProgressReporter::phase(Phase p, const std::string& current_source) {
    MergeProgress next = m_last;
    next.phase = p;
    if (!current_source.empty()) next.current_source = current_source;
    publish(next);
}

void ProgressReporter::source_completed(const std::string& source, size_t chapter_entries) {
    MergeProgress next = m_last;
    next.sources_completed++;
    next.current_source = source;
    next.total_entries += chapter_entries;
    publish(next);
}

void ProgressReporter::entries_written(size_t written, size_t total) {
    MergeProgress next = m_last;
    next.total_entries = total;
    next.entries_written = std::max(m_last.entries_written, std::min(written, total));
    next.phase = Phase::Writing;

    bool last_entry = next.entries_written == total;
    if (!last_entry && next.entries_written < m_last_batch_mark + m_batch) return;
    if (next.entries_written == m_last.entries_written && m_last.phase == Phase::Writing) return;

    m_last_batch_mark = next.entries_written;
    publish(next);
}

void ProgressReporter::finish(Phase terminal, const std::optional<std::string>& error) {
    MergeProgress next = m_last;
    next.phase = terminal;
    next.error = error;
    publish(next);
}

void ProgressReporter::publish(MergeProgress next) {
    m_last = next;
    if (!m_observer) return;
    try {
        m_observer->on_merge_progress(std::move(next));
    } catch (const std::exception& e) {
        Logger::warn(std::string("Progress observer threw: ") + e.what());
    }
}
