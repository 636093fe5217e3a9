#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <exception>
#include "ConfigLoader.h"
#include "ImageExtractor.h"
#include "Logger.h"
#include "MergeEngine.h"
#include "Progress.h"
#include "ReportWriter.h"
#include "SourceInfo.h"
#include "StagingDir.h"

namespace fs = std::filesystem;

static constexpr const char* VERSION = "ComicMerge 1.0.0";
static constexpr const char* DEFAULT_CONFIG = "comicmerge.json";

static std::atomic<bool> g_interrupted{false};

static void on_interrupt(int) { g_interrupted = true; }

// ---------------------------------------------------------------------------

void print_ui_help() {
    std::cout << "\n"
        << "==================================================================\n"
        << "              COMIC MERGE TOOL\n"
        << "==================================================================\n\n"
        << "  ComicMerge <output.cbz> <source.cbz|source.zip>... [options]\n"
        << "  ComicMerge --extract <source.zip> <dir> [--chapter-index N] [options]\n"
        << "  ComicMerge --info <source.cbz|source.zip>...\n\n"
        << "OPTIONS:\n"
        << "  -c, --config <file>        Defaults file (default: comicmerge.json)\n"
        << "  -f, --formats <list>       Image formats, e.g. jpg,png (default: all)\n"
        << "  --strict                   Fail on the first bad source or unsafe entry\n"
        << "  --overwrite                Replace an existing output file\n"
        << "  --unique                   Pick name_1.cbz, name_2.cbz... if the output exists\n"
        << "  --no-comicinfo             Do not copy ComicInfo.xml from the first source\n"
        << "  --chapter <source>=<N>     Explicit chapter number for a source\n"
        << "  --chapter-index <N>        Chapter number for --extract (default: 1)\n"
        << "  --output-json <path>       Export JSON report to path\n"
        << "  --output-txt <path>        Export TXT report to path\n"
        << "  -h, --help                 This help\n"
        << "  --version                  Print version\n"
        << "==================================================================\n";
}

// Prints the newest snapshot on one status line.
static void print_progress(const MergeProgress& p) {
    std::cerr << "\r[" << phase_name(p.phase) << "] sources " << p.sources_completed << "/" << p.total_sources;
    if (p.total_entries > 0)
        std::cerr << ", pages " << p.entries_written << "/" << p.total_entries;
    if (!p.current_source.empty())
        std::cerr << "  " << p.current_source;
    std::cerr << "        " << std::flush;
}

class ConsoleExtractionObserver : public ProgressObserver {
public:
    void on_extraction_progress(ExtractionProgress snapshot) override {
        std::cerr << "\r[Extracting] " << snapshot.entries_extracted << "/" << snapshot.entries_found
                  << "  " << snapshot.current_file << "        " << std::flush;
    }
};

static int run_extract(const fs::path& source, const fs::path& dir, int chapter, const MergeDefaults& cfg) {
    ConsoleExtractionObserver observer;
    ImageExtractor extractor;
    extractor.set_observer(&observer);
    extractor.set_strict(cfg.options.strict_mode);
    extractor.set_max_entry_size(cfg.options.max_entry_size);

    try {
        ChapterGroup group = extractor.extract(source, chapter, cfg.options.selected_formats, dir);
        std::cerr << "\n";
        std::cout << "Extracted " << group.entries.size() << " pages to " << dir.string() << "\n";
        for (const auto& i : group.issues)
            std::cout << "  skipped [" << error_kind_name(i.kind) << "] " << i.subject << ": " << i.reason << "\n";
        return 0;
    }
    catch (const MergeError& e) {
        std::cerr << "\n";
        Logger::error(std::string("Extraction failed [") + error_kind_name(e.kind()) + "]: " + e.what());
        std::cout << "FAILED [" << error_kind_name(e.kind()) << "] " << e.what() << "\n";
        return 1;
    }
}

// Сводка по архивам без слияния: страницы, форматы, размер.
static int run_info(const std::vector<std::string>& paths, const MergeDefaults& cfg) {
    std::vector<SourceEntry> sources;
    for (size_t i = 0; i < paths.size(); ++i) {
        SourceEntry src;
        src.path = paths[i];
        src.position = i;
        src.kind = detect_source_kind(src.path).value_or(SourceKind::CBZ);
        sources.push_back(src);
    }

    SourceValidation summary = validate_sources(sources, cfg.options.max_entry_size);
    std::cout << "\n--- SOURCES ---\n";
    for (const auto& info : summary.valid) {
        std::cout << info.file_name << ": " << info.page_count << " pages ("
                  << join_formats(info.formats) << "), " << (info.file_size / 1024) << " KB"
                  << (info.has_comic_info ? ", ComicInfo.xml" : "") << "\n";
    }
    for (const auto& bad : summary.invalid)
        std::cout << "  invalid [" << error_kind_name(bad.kind) << "] " << bad.subject << ": " << bad.reason << "\n";
    std::cout << "Total: " << summary.total_pages << " pages, " << (summary.total_size / 1024) << " KB in "
              << summary.valid.size() << "/" << sources.size() << " source(s)\n";
    return summary.all_valid() ? 0 : 1;
}

static void print_result(const MergeResult& result) {
    std::cout << "\n--- MERGE RESULT ---\n";
    if (result.success) {
        std::cout << "Output: " << result.output_path.string() << "\n";
        for (const auto& c : result.chapters)
            std::cout << "chapter " << c.chapter << ": " << c.pages << " pages from "
                      << c.source.filename().string() << "\n";
        std::cout << "Pages: " << result.total_pages
                  << (result.comic_info_copied ? "  (ComicInfo.xml copied)" : "") << "\n";
        if (result.resequenced)
            std::cout << "Duplicate chapter pages were renumbered by stream position\n";
    }
    else {
        std::cout << "FAILED [" << (result.error_kind ? error_kind_name(*result.error_kind) : "Unknown")
                  << "] " << result.error << "\n";
    }
    for (const auto& i : result.issues)
        std::cout << "  skipped [" << error_kind_name(i.kind) << "] " << i.subject << ": " << i.reason << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_ui_help();
        return 0;
    }

    // Handle -h/--help/--version before treating argv[1] as a path
    {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            print_ui_help();
            return 0;
        }
        if (first == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    std::string config_path = DEFAULT_CONFIG;
    for (int i = 1; i + 1 < argc; ++i)
        if (std::string(argv[i]) == "-c" || std::string(argv[i]) == "--config")
            config_path = argv[i + 1];

    MergeDefaults cfg = ConfigLoader::load(config_path);
    Logger::init(cfg.log_dir);
    Logger::info("ComicMerge started, config: " + config_path);

    size_t swept = StagingDir::sweep_stale();
    if (swept > 0) Logger::info("Removed " + std::to_string(swept) + " stale staging director(ies)");

    std::vector<std::string> positional;
    std::map<std::string, int> explicit_chapters;
    std::string output_json;
    std::string output_txt;
    std::string extract_source;
    std::string extract_dir;
    int chapter_index = 1;
    bool unique_output = false;
    bool info_mode = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                ++i;
            }
            else if ((arg == "-f" || arg == "--formats") && i + 1 < argc) {
                std::vector<std::string> rejected;
                cfg.options.selected_formats = parse_format_list(argv[++i], &rejected);
                for (const auto& r : rejected)
                    std::cerr << "[Warn] unknown format '" << r << "' ignored\n";
            }
            else if (arg == "--strict") {
                cfg.options.strict_mode = true;
            }
            else if (arg == "--overwrite") {
                cfg.options.overwrite = true;
            }
            else if (arg == "--unique") {
                unique_output = true;
            }
            else if (arg == "--info") {
                info_mode = true;
            }
            else if (arg == "--no-comicinfo") {
                cfg.options.copy_comic_info = false;
            }
            else if (arg == "--chapter" && i + 1 < argc) {
                std::string mapping = argv[++i];
                auto eq = mapping.rfind('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "[Error] --chapter expects <source>=<N>, got '" << mapping << "'\n";
                    return 1;
                }
                int chapter = std::stoi(mapping.substr(eq + 1));
                if (chapter < 1) {
                    std::cerr << "[Error] --chapter number must be 1 or greater, got " << chapter << "\n";
                    return 1;
                }
                explicit_chapters[fs::path(mapping.substr(0, eq)).lexically_normal().string()] = chapter;
            }
            else if (arg == "--chapter-index" && i + 1 < argc) {
                chapter_index = std::stoi(argv[++i]);
                if (chapter_index < 1) {
                    std::cerr << "[Error] --chapter-index must be 1 or greater, got " << chapter_index << "\n";
                    return 1;
                }
            }
            else if (arg == "--extract" && i + 2 < argc) {
                extract_source = argv[++i];
                extract_dir = argv[++i];
            }
            else if (arg == "--output-json" && i + 1 < argc) {
                output_json = argv[++i];
            }
            else if (arg == "--output-txt" && i + 1 < argc) {
                output_txt = argv[++i];
            }
            else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "[Error] unknown option " << arg << "\n";
                return 1;
            }
            else {
                positional.push_back(arg);
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "[Error] bad number in arguments: " << e.what() << "\n";
        return 1;
    }

    if (!extract_source.empty())
        return run_extract(extract_source, extract_dir, chapter_index, cfg);

    if (info_mode) {
        if (positional.empty()) {
            std::cerr << "[Error] --info needs at least one source\n";
            return 1;
        }
        return run_info(positional, cfg);
    }

    if (positional.size() < 2) {
        std::cerr << "[Error] need an output file and at least one source\n";
        print_ui_help();
        return 1;
    }

    fs::path output = positional[0];
    if (!cfg.output_dir.empty() && !output.has_parent_path())
        output = fs::path(cfg.output_dir) / output;

    if (unique_output && !cfg.options.overwrite) {
        fs::path dir = output.parent_path().empty() ? fs::path(".") : output.parent_path();
        fs::path picked = unique_output_path(dir, output.stem().string(), output.extension().string());
        if (output.parent_path().empty()) picked = picked.filename();
        if (picked != output) {
            std::cerr << "[Info] " << output.string() << " exists, writing " << picked.string() << "\n";
            output = picked;
        }
    }

    std::vector<SourceEntry> sources;
    for (size_t i = 1; i < positional.size(); ++i) {
        SourceEntry src;
        src.path = positional[i];
        src.position = i - 1;
        auto kind = detect_source_kind(src.path);
        if (!kind) {
            std::cerr << "[Error] " << src.path.string() << ": only .cbz and .zip sources are supported\n";
            return 1;
        }
        src.kind = *kind;
        auto it = explicit_chapters.find(src.path.lexically_normal().string());
        if (it != explicit_chapters.end()) src.chapter = it->second;
        sources.push_back(src);
    }

    std::cerr << "[Info] Merging " << sources.size() << " source(s) into " << output.string()
              << " (formats: " << join_formats(cfg.options.selected_formats)
              << (cfg.options.strict_mode ? ", strict" : "") << ")\n";

    ProgressQueue queue;
    MergeEngine engine;
    engine.set_observer(&queue);

    std::signal(SIGINT, on_interrupt);
    auto t_start = std::chrono::high_resolution_clock::now();
    std::future<MergeResult> future = engine.start(sources, output, cfg.options);

    bool cancel_sent = false;
    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_interrupted && !cancel_sent) {
            std::cerr << "\n[Info] Cancelling...\n";
            engine.request_cancel();
            cancel_sent = true;
        }
        queue.drain();
        if (auto latest = queue.latest()) print_progress(*latest);
    }
    queue.drain();
    if (auto latest = queue.latest()) print_progress(*latest);
    std::cerr << "\n";

    MergeResult result = future.get();
    std::signal(SIGINT, SIG_DFL);
    double elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t_start).count();
    Logger::info("Merge took " + std::to_string(elapsed) + "s");

    print_result(result);

    if (!output_json.empty()) {
        if (ReportWriter::write_json(output_json, result)) std::cout << "[Reports] " << output_json << "\n";
        else Logger::warn("Cannot write report " + output_json);
    }
    if (!output_txt.empty()) {
        if (ReportWriter::write_txt(output_txt, result)) std::cout << "[Reports] " << output_txt << "\n";
        else Logger::warn("Cannot write report " + output_txt);
    }

    std::cout << "[Log]     " << Logger::path() << "\n";
    return result.success ? 0 : 1;
}
