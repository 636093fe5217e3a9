#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

struct GenStats {
    int archives = 0;
    int pages = 0;
    int comic_info = 0;     // archives with ComicInfo.xml
    int traps = 0;          // entries a merge must skip (non-image, traversal, corrupt)
    size_t total_bytes = 0;

    void print() const {
        std::cout << "===== GENERATION REPORT (Ground Truth) =====" << std::endl;
        std::cout << "Archives: " << archives << " | Pages: " << pages
            << " | ComicInfo.xml: " << comic_info << " | Traps: " << traps << std::endl;
        std::cout << "Total Size: " << (total_bytes / 1024) << " KB" << std::endl;
        std::cout << "============================================" << std::endl;
    }
};

// Одна запись синтетического архива. Имя пишется как есть,
// в том числе "../../etc/passwd.jpg".
struct GenEntry {
    std::string name;
    std::string data;
    bool corrupt_crc = false;   // stored CRC does not match the data
    bool symlink = false;       // UNIX symlink in the external attributes
};

// Детерминированный генератор тестовых комиксов: один и тот же seed
// даёт одни и те же байты.
class ComicGenerator {
public:
    explicit ComicGenerator(uint32_t seed = 42);

    // Magic bytes of `ext` followed by seeded noise, `size` bytes in total.
    std::string image_bytes(const std::string& ext, size_t size);

    static std::string comic_info_xml(const std::string& title, int pages);

    // `count` pages "<stem><n>.<ext>" (n from 1, optionally zero-padded to 3),
    // shuffled so archive order differs from reading order.
    std::vector<GenEntry> pages(const std::string& stem, int count, const std::string& ext,
                                bool zero_pad = false, size_t page_size = 2048);

    // Uncompressed ZIP written directly, so names, CRCs and attributes are
    // exactly what the caller asked for.
    static void write_zip(const fs::path& path, const std::vector<GenEntry>& entries);

    fs::path make_comic(const fs::path& path, int pages, const std::string& ext = "jpg",
                        bool with_comic_info = false);

    // File with an archive extension and no ZIP structure.
    void write_not_an_archive(const fs::path& path, size_t size = 512);

    // A folder of chapters for benchmarks and manual runs: mixed formats,
    // some ComicInfo.xml, a few trap entries per archive.
    GenStats generate_library(const fs::path& dir, size_t archives, size_t pages_per_archive);

private:
    static uint32_t calculate_CRC32(const char* data, size_t length);

    std::mt19937 rng;
};
