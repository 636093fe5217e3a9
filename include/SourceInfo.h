#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include "ArchiveReader.h"
#include "ImageFormats.h"

// Сводка по одному архиву для списка файлов: страницы, форматы, размер.
struct SourceInfo {
    std::filesystem::path path;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t total_files = 0;               // every entry, images or not
    size_t page_count = 0;
    std::vector<std::string> image_files;   // natural order
    FormatSet formats;                      // extensions present
    bool has_comic_info = false;
};

// Opens the archive read-only and lists its pages without extracting.
// Throws MergeError (UnreadableArchive, EmptyArchive) like ArchiveReader.
SourceInfo inspect_source(const std::filesystem::path& path,
                          uint64_t max_entry_size = DEFAULT_MAX_ENTRY_SIZE);

// First free name in dir: "<stem><ext>", then "<stem>_1<ext>", "<stem>_2<ext>", ...
std::filesystem::path unique_output_path(const std::filesystem::path& dir,
                                         const std::string& stem,
                                         const std::string& ext = ".cbz");
