#include "generator/Generator.h"
#include "ImageFormats.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace {
    // Простая таблица CRC32 для ZIP
    uint32_t crc32_table[256];
    bool crc_initialized = false;

    void init_crc32() {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t c = i;
            for (int j = 0; j < 8; j++) c = (c & 1) ? (0xEDB88320 ^ (c >> 1)) : (c >> 1);
            crc32_table[i] = c;
        }
        crc_initialized = true;
    }

    // ZIP is little-endian regardless of the host
    void put16(std::ostream& out, uint16_t v) {
        char b[2] = { static_cast<char>(v & 0xFF), static_cast<char>(v >> 8) };
        out.write(b, 2);
    }

    void put32(std::ostream& out, uint32_t v) {
        char b[4] = { static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                      static_cast<char>((v >> 16) & 0xFF), static_cast<char>(v >> 24) };
        out.write(b, 4);
    }

    constexpr uint16_t ZIP_VERSION = 20;
    constexpr uint16_t MADE_BY_UNIX = (3 << 8) | ZIP_VERSION;
    constexpr uint32_t SYMLINK_ATTRIBUTES = 0120777u << 16;
    constexpr uint32_t FILE_ATTRIBUTES = 0100644u << 16;
    constexpr uint16_t DOS_DATE_1980 = (0 << 9) | (1 << 5) | 1;

    const std::string& magic_for(const std::string& ext) {
        static const std::string none;
        static const std::string webp = Sig::Img::RIFF + std::string("\x00\x10\x00\x00", 4) + Sig::Img::WEBP;
        std::string family = format_family(ext);
        if (family == "png") return Sig::Img::PNG;
        if (family == "jpg") return Sig::Img::JPG;
        if (family == "gif") return Sig::Img::GIF89;
        if (family == "bmp") return Sig::Img::BMP;
        if (family == "webp") return webp;
        return none;
    }
}

uint32_t ComicGenerator::calculate_CRC32(const char* data, size_t length) {
    if (!crc_initialized) init_crc32();
    uint32_t c = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        c = crc32_table[(c ^ (uint8_t)data[i]) & 0xFF] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFF;
}

ComicGenerator::ComicGenerator(uint32_t seed) : rng(seed) {}

std::string ComicGenerator::image_bytes(const std::string& ext, size_t size) {
    std::string data = magic_for(ext);
    std::uniform_int_distribution<int> noise(0, 255);
    while (data.size() < size) data.push_back(static_cast<char>(noise(rng)));
    return data;
}

std::string ComicGenerator::comic_info_xml(const std::string& title, int pages) {
    std::ostringstream ss;
    ss << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
       << "<ComicInfo xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">\n"
       << "  <Title>" << title << "</Title>\n"
       << "  <PageCount>" << pages << "</PageCount>\n"
       << "</ComicInfo>\n";
    return ss.str();
}

std::vector<GenEntry> ComicGenerator::pages(const std::string& stem, int count, const std::string& ext,
                                            bool zero_pad, size_t page_size) {
    std::vector<GenEntry> entries;
    for (int n = 1; n <= count; ++n) {
        std::ostringstream name;
        name << stem;
        if (zero_pad) name << std::setw(3) << std::setfill('0');
        name << n << "." << ext;
        entries.push_back({ name.str(), image_bytes(ext, page_size) });
    }
    std::shuffle(entries.begin(), entries.end(), rng);
    return entries;
}

void ComicGenerator::write_zip(const fs::path& path, const std::vector<GenEntry>& entries) {
    struct Central {
        const GenEntry* entry;
        uint32_t crc32;
        uint32_t offset;
    };

    std::ofstream zip(path, std::ios::binary | std::ios::trunc);
    if (!zip) throw std::runtime_error("cannot create " + path.string());

    std::vector<Central> central;
    for (const auto& e : entries) {
        uint32_t crc = calculate_CRC32(e.data.data(), e.data.size());
        if (e.corrupt_crc) crc ^= 0xA5A5A5A5;
        uint32_t size = static_cast<uint32_t>(e.data.size());
        central.push_back({ &e, crc, static_cast<uint32_t>(zip.tellp()) });

        // Local File Header
        put32(zip, 0x04034b50);
        put16(zip, ZIP_VERSION);
        put16(zip, 0);              // флаги
        put16(zip, 0);              // метод: хранение
        put16(zip, 0);              // время
        put16(zip, DOS_DATE_1980);
        put32(zip, crc);
        put32(zip, size);           // сжатый
        put32(zip, size);           // несжатый
        put16(zip, static_cast<uint16_t>(e.name.size()));
        put16(zip, 0);              // extra
        zip.write(e.name.data(), e.name.size());
        zip.write(e.data.data(), e.data.size());
    }

    // Central Directory
    uint32_t cd_start = static_cast<uint32_t>(zip.tellp());
    for (const auto& c : central) {
        const GenEntry& e = *c.entry;
        put32(zip, 0x02014b50);
        put16(zip, MADE_BY_UNIX);
        put16(zip, ZIP_VERSION);
        put16(zip, 0);
        put16(zip, 0);
        put16(zip, 0);
        put16(zip, DOS_DATE_1980);
        put32(zip, c.crc32);
        put32(zip, static_cast<uint32_t>(e.data.size()));
        put32(zip, static_cast<uint32_t>(e.data.size()));
        put16(zip, static_cast<uint16_t>(e.name.size()));
        put16(zip, 0);              // extra
        put16(zip, 0);              // comment
        put16(zip, 0);              // disk start
        put16(zip, 0);              // internal attr
        put32(zip, e.symlink ? SYMLINK_ATTRIBUTES : FILE_ATTRIBUTES);
        put32(zip, c.offset);
        zip.write(e.name.data(), e.name.size());
    }
    uint32_t cd_size = static_cast<uint32_t>(zip.tellp()) - cd_start;

    // End of Central Directory Record
    put32(zip, 0x06054b50);
    put16(zip, 0);
    put16(zip, 0);
    put16(zip, static_cast<uint16_t>(central.size()));
    put16(zip, static_cast<uint16_t>(central.size()));
    put32(zip, cd_size);
    put32(zip, cd_start);
    put16(zip, 0);

    if (!zip) throw std::runtime_error("cannot write " + path.string());
}

fs::path ComicGenerator::make_comic(const fs::path& path, int count, const std::string& ext, bool with_comic_info) {
    std::vector<GenEntry> entries = pages("page", count, ext);
    if (with_comic_info)
        entries.push_back({ "ComicInfo.xml", comic_info_xml(path.stem().string(), count) });
    write_zip(path, entries);
    return path;
}

void ComicGenerator::write_not_an_archive(const fs::path& path, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot create " + path.string());
    std::string text = "this is not a zip archive ";
    std::uniform_int_distribution<int> noise('a', 'z');
    while (text.size() < size) text.push_back(static_cast<char>(noise(rng)));
    out.write(text.data(), text.size());
}

GenStats ComicGenerator::generate_library(const fs::path& dir, size_t archives, size_t pages_per_archive) {
    static const std::vector<std::string> formats = { "jpg", "png", "webp", "gif", "bmp", "jpeg" };
    GenStats stats;
    fs::create_directories(dir);

    std::uniform_int_distribution<size_t> format_dist(0, formats.size() - 1);
    std::discrete_distribution<> size_dist({ 70, 25, 5 });
    std::bernoulli_distribution with_info(0.5);

    for (size_t a = 0; a < archives; ++a) {
        const std::string& ext = formats[format_dist(rng)];

        std::vector<GenEntry> entries;
        for (size_t p = 1; p <= pages_per_archive; ++p) {
            size_t fsize = 0;
            int cat = size_dist(rng);
            if (cat == 0) fsize = std::uniform_int_distribution<size_t>(4 * 1024, 64 * 1024)(rng);
            else if (cat == 1) fsize = std::uniform_int_distribution<size_t>(64 * 1024, 512 * 1024)(rng);
            else fsize = std::uniform_int_distribution<size_t>(512 * 1024, 2 * 1024 * 1024)(rng);

            entries.push_back({ "page" + std::to_string(p) + "." + ext, image_bytes(ext, fsize) });
            stats.pages++;
            stats.total_bytes += fsize;
        }
        std::shuffle(entries.begin(), entries.end(), rng);

        // Ловушки: не-изображение, выход за каталог, битый CRC
        entries.push_back({ "notes.txt", "scanlation notes" });
        entries.push_back({ "../escape" + std::to_string(a) + ".jpg", image_bytes("jpg", 256) });
        GenEntry broken{ "zz_broken." + ext, image_bytes(ext, 1024) };
        broken.corrupt_crc = true;
        entries.push_back(broken);
        stats.traps += 3;

        std::ostringstream name;
        name << "chapter_" << std::setw(3) << std::setfill('0') << (a + 1) << (a % 2 ? ".zip" : ".cbz");
        if (with_info(rng)) {
            entries.push_back({ "ComicInfo.xml", comic_info_xml(name.str(), static_cast<int>(pages_per_archive)) });
            stats.comic_info++;
        }
        write_zip(dir / name.str(), entries);
        stats.archives++;

        if ((a + 1) % 10 == 0) std::cout << "\rGenerating: " << (a + 1) << "/" << archives << std::flush;
    }
    std::cout << std::endl;
    return stats;
}
