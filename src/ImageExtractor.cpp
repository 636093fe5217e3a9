#include "ImageExtractor.h"
#include "NaturalSort.h"
#include "Logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <exception>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    constexpr size_t SNIFF_BYTES = 12;

    // Files written by one extract() call; removed unless keep() is reached.
    class WrittenFiles {
    public:
        ~WrittenFiles() {
            if (m_keep) return;
            for (const auto& p : m_files) {
                std::error_code ec;
                fs::remove(p, ec);
                if (ec) Logger::warn("Cannot remove " + p.string() + ": " + ec.message());
            }
        }
        void add(const fs::path& p) { m_files.push_back(p); }
        void drop_last() {
            if (m_files.empty()) return;
            std::error_code ec;
            fs::remove(m_files.back(), ec);
            m_files.pop_back();
        }
        void keep() { m_keep = true; }
    private:
        std::vector<fs::path> m_files;
        bool m_keep = false;
    };

    std::string sniff_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        char head[SNIFF_BYTES] = {};
        in.read(head, SNIFF_BYTES);
        return sniff_image_format(head, static_cast<size_t>(in.gcount()));
    }
}

std::string chapter_entry_name(int chapter, int page, const std::string& ext) {
    std::ostringstream ss;
    ss << "ch" << chapter << "_" << std::setw(3) << std::setfill('0') << page << "." << ext;
    return ss.str();
}

void ImageExtractor::emit(const ExtractionProgress& snapshot) const {
    if (!m_observer) return;
    try {
        m_observer->on_extraction_progress(snapshot);
    } catch (const std::exception& e) {
        Logger::warn(std::string("Progress observer threw: ") + e.what());
    }
}

ChapterGroup ImageExtractor::extract(const fs::path& source,
                                     int chapter_index,
                                     const FormatSet& selected_formats,
                                     const fs::path& destination_dir) const {
    if (selected_formats.empty())
        throw MergeError(ErrorKind::NoFormatsSelected, "no image formats selected");
    if (chapter_index < 1)
        throw MergeError(ErrorKind::InvalidChapter,
                         "chapter number must be 1 or greater, got " + std::to_string(chapter_index));

    std::error_code ec;
    fs::create_directories(destination_dir, ec);
    if (ec)
        throw MergeError(ErrorKind::IOFailure, "cannot create " + destination_dir.string() + ": " + ec.message());

    const std::string source_name = source.filename().string();
    ArchiveReader reader(source, m_max_entry_size);

    std::vector<ArchiveEntry> entries;
    for (auto& e : reader.list_image_entries()) {
        if (selected_formats.count(e.extension)) entries.push_back(std::move(e));
    }
    if (entries.empty())
        throw MergeError(ErrorKind::EmptyArchive,
                         source_name + ": no entries match selected formats (" + join_formats(selected_formats) + ")");

    natural_sort(entries, [](const ArchiveEntry& e) -> std::string_view { return e.name; });

    ChapterGroup group;
    group.source = source;
    group.chapter = chapter_index;

    ExtractionProgress progress;
    progress.source = source.string();
    progress.entries_found = entries.size();

    auto skip = [&](const ArchiveEntry& entry, ErrorKind kind, const std::string& reason) {
        if (kind == ErrorKind::PathRejected && m_strict)
            throw MergeError(kind, source_name + ": " + entry.name + ": " + reason);
        Logger::warn("Skipped " + source_name + ":" + entry.name + " [" + error_kind_name(kind) + "] " + reason);
        group.issues.push_back({ kind, source_name + ":" + entry.name, reason });
    };

    WrittenFiles written;
    int page = 0;
    for (const auto& entry : entries) {
        if (cancel_requested())
            throw MergeError(ErrorKind::Cancelled, "extraction of " + source_name + " cancelled");

        PathCheck check = m_validator.validate(entry.name);
        if (!check) { skip(entry, ErrorKind::PathRejected, check.reason); continue; }
        if (entry.is_symlink) { skip(entry, ErrorKind::PathRejected, "symbolic link entry"); continue; }
        if (entry.oversized) {
            skip(entry, ErrorKind::CorruptEntry, "entry exceeds " + std::to_string(m_max_entry_size) + " bytes");
            continue;
        }

        std::string target = chapter_entry_name(chapter_index, page + 1, entry.extension);
        PathCheck target_check = m_validator.validate(target, destination_dir);
        if (!target_check) { skip(entry, ErrorKind::PathRejected, target_check.reason); continue; }

        fs::path out_path = destination_dir / target;
        // never truncate a file this call did not create
        std::error_code exists_ec;
        if (fs::symlink_status(out_path, exists_ec).type() != fs::file_type::not_found)
            throw MergeError(ErrorKind::IOFailure, out_path.string() + " already exists");
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out)
            throw MergeError(ErrorKind::IOFailure, "cannot write " + out_path.string());
        written.add(out_path);

        uint64_t bytes = 0;
        try {
            bytes = reader.read_entry_to(entry, out);
        }
        catch (const MergeError& err) {
            if (err.kind() != ErrorKind::CorruptEntry) throw;
            out.close();
            written.drop_last();
            skip(entry, ErrorKind::CorruptEntry, err.what());
            continue;
        }
        out.close();
        if (out.fail())
            throw MergeError(ErrorKind::IOFailure, "cannot write " + out_path.string());

        std::string sniffed = sniff_file(out_path);
        if (!sniffed.empty() && sniffed != format_family(entry.extension)) {
            Logger::warn(source_name + ":" + entry.name + " has ." + entry.extension +
                         " extension but " + sniffed + " content");
        }

        ++page;
        RenamedEntry renamed;
        renamed.source_name = entry.name;
        renamed.target_name = target;
        renamed.extension = entry.extension;
        renamed.chapter = chapter_index;
        renamed.page = page;
        renamed.size = bytes;
        renamed.staged_path = out_path;
        group.entries.push_back(std::move(renamed));

        progress.entries_extracted = static_cast<size_t>(page);
        progress.current_file = entry.name;
        emit(progress);
    }

    if (group.entries.empty())
        throw MergeError(ErrorKind::EmptyArchive, source_name + ": no entries survived extraction");

    written.keep();
    Logger::info("Extracted " + std::to_string(group.entries.size()) + " pages from " + source_name +
                 " as chapter " + std::to_string(chapter_index));
    return group;
}
