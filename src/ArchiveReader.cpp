#include "ArchiveReader.h"
#include "ImageFormats.h"
#include "MergeError.h"
#include "Logger.h"
#include <zip.h>
#include <functional>
#include <system_error>
#include <boost/iostreams/device/mapped_file.hpp>
#include <boost/algorithm/string/predicate.hpp>
#ifdef _WIN32
#include <io.h>   // _dup, _fileno
#endif

namespace fs = std::filesystem;

namespace {
    constexpr size_t CHUNK_SIZE = 1 << 16;
    constexpr uint32_t UNIX_FILE_TYPE_MASK = 0170000;
    constexpr uint32_t UNIX_SYMLINK = 0120000;

    struct ZipFileCloser {
        void operator()(zip_file_t* f) const noexcept { if (f) zip_fclose(f); }
    };

    // On Windows, zip_open() uses the current system codepage for the path, which
    // breaks for UTF-8 filenames. Open with _wfopen_s and hand a dup of the fd to
    // zip_fdopen so libzip owns it.
    zip_t* open_zip_path(const fs::path& path, int* errcode) {
#ifdef _WIN32
        FILE* fp = nullptr;
        if (_wfopen_s(&fp, path.wstring().c_str(), L"rb") != 0 || !fp) {
            *errcode = ZIP_ER_OPEN;
            return nullptr;
        }
        int fd = _dup(_fileno(fp));
        fclose(fp);
        if (fd < 0) { *errcode = ZIP_ER_OPEN; return nullptr; }
        return zip_fdopen(fd, ZIP_RDONLY, errcode);
#else
        return zip_open(path.c_str(), ZIP_RDONLY, errcode);
#endif
    }

    std::string zip_code_message(int code) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, code);
        std::string msg = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        return msg;
    }

    // macOS resource forks and AppleDouble files carry image extensions but
    // are not pages.
    bool is_archive_system_file(const std::string& name) {
        if (name.rfind("__MACOSX/", 0) == 0) return true;
        auto slash = name.find_last_of('/');
        std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
        return base.rfind("._", 0) == 0;
    }

    void read_chunks(zip_t* archive, const ArchiveEntry& entry,
                     const std::function<void(const char*, size_t)>& sink) {
        if (entry.is_encrypted)
            throw MergeError(ErrorKind::CorruptEntry, entry.name + ": encrypted entry");

        std::unique_ptr<zip_file_t, ZipFileCloser> zf(zip_fopen_index(archive, entry.index, 0));
        if (!zf)
            throw MergeError(ErrorKind::CorruptEntry, entry.name + ": " + zip_strerror(archive));

        std::vector<char> buf(CHUNK_SIZE);
        uint64_t total = 0;
        zip_int64_t n;
        while ((n = zip_fread(zf.get(), buf.data(), buf.size())) > 0) {
            sink(buf.data(), static_cast<size_t>(n));
            total += static_cast<uint64_t>(n);
        }
        if (n < 0)
            throw MergeError(ErrorKind::CorruptEntry, entry.name + ": " + zip_file_strerror(zf.get()));
        if (total != entry.size)
            throw MergeError(ErrorKind::CorruptEntry, entry.name + ": short read (" +
                             std::to_string(total) + " of " + std::to_string(entry.size) + " bytes)");

        if (zip_fclose(zf.release()) != 0)
            throw MergeError(ErrorKind::CorruptEntry, entry.name + ": checksum mismatch");
    }
}

void ZipCloser::operator()(zip_t* z) const noexcept {
    // read-only handle: discard never writes
    if (z) zip_discard(z);
}

bool ArchiveReader::looks_like_zip(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec || size < Sig::Arc::ZIP_LOCAL.size()) return false;
    try {
        boost::iostreams::mapped_file_params params(path.string());
        params.length = Sig::Arc::ZIP_LOCAL.size();
        boost::iostreams::mapped_file_source mmap(params);
        if (!mmap.is_open()) return false;
        std::string head(mmap.data(), mmap.size());
        return head == Sig::Arc::ZIP_LOCAL || head == Sig::Arc::ZIP_EMPTY;
    }
    catch (const std::exception& e) {
        Logger::warn("Cannot map " + path.string() + ": " + e.what());
        return false;
    }
}

ArchiveReader::ArchiveReader(const fs::path& path, uint64_t max_entry_size)
    : m_path(path), m_max_entry_size(max_entry_size) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw MergeError(ErrorKind::UnreadableArchive, path.string() + ": file not found");
    if (fs::file_size(path, ec) == 0 || ec)
        throw MergeError(ErrorKind::UnreadableArchive, path.string() + ": zero-byte archive");
    if (!looks_like_zip(path))
        throw MergeError(ErrorKind::UnreadableArchive, path.string() + ": not a ZIP archive");

    int errcode = 0;
    m_zip.reset(open_zip_path(path, &errcode));
    if (!m_zip)
        throw MergeError(ErrorKind::UnreadableArchive, path.string() + ": " + zip_code_message(errcode));
}

uint64_t ArchiveReader::entry_count() const {
    zip_int64_t n = zip_get_num_entries(m_zip.get(), 0);
    return n < 0 ? 0 : static_cast<uint64_t>(n);
}

ArchiveEntry ArchiveReader::stat_entry(uint64_t index) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(m_zip.get(), index, 0, &st) != 0)
        throw MergeError(ErrorKind::CorruptEntry, "entry #" + std::to_string(index) + ": " + zip_strerror(m_zip.get()));

    ArchiveEntry e;
    e.index = index;
    e.name = (st.valid & ZIP_STAT_NAME) && st.name ? st.name : "";
    e.extension = extension_of(e.name);
    e.size = (st.valid & ZIP_STAT_SIZE) ? st.size : 0;
    e.compressed_size = (st.valid & ZIP_STAT_COMP_SIZE) ? st.comp_size : 0;
    e.is_encrypted = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;
    e.oversized = e.size > m_max_entry_size;

    zip_uint8_t opsys = 0;
    zip_uint32_t attributes = 0;
    if (zip_file_get_external_attributes(m_zip.get(), index, 0, &opsys, &attributes) == 0 &&
        opsys == ZIP_OPSYS_UNIX) {
        e.is_symlink = ((attributes >> 16) & UNIX_FILE_TYPE_MASK) == UNIX_SYMLINK;
    }
    return e;
}

std::vector<ArchiveEntry> ArchiveReader::list_image_entries() const {
    std::vector<ArchiveEntry> entries;
    uint64_t total = entry_count();
    for (uint64_t i = 0; i < total; ++i) {
        ArchiveEntry e;
        try {
            e = stat_entry(i);
        }
        catch (const MergeError& err) {
            Logger::warn(m_path.filename().string() + ": " + err.what());
            continue;
        }
        if (e.name.empty() || e.name.back() == '/') continue;
        if (!is_supported_format(e.extension)) continue;
        if (is_archive_system_file(e.name)) continue;
        entries.push_back(std::move(e));
    }

    if (entries.empty())
        throw MergeError(ErrorKind::EmptyArchive,
                         m_path.filename().string() + ": no image entries (" + join_formats(supported_formats()) + ")");
    return entries;
}

std::vector<char> ArchiveReader::read_entry(const ArchiveEntry& entry) const {
    std::vector<char> data;
    data.reserve(static_cast<size_t>(entry.size));
    read_chunks(m_zip.get(), entry, [&data](const char* p, size_t n) {
        data.insert(data.end(), p, p + n);
    });
    return data;
}

uint64_t ArchiveReader::read_entry_to(const ArchiveEntry& entry, std::ostream& out) const {
    uint64_t written = 0;
    read_chunks(m_zip.get(), entry, [&](const char* p, size_t n) {
        out.write(p, static_cast<std::streamsize>(n));
        if (!out) throw MergeError(ErrorKind::IOFailure, entry.name + ": write failed");
        written += n;
    });
    return written;
}

std::optional<ArchiveEntry> ArchiveReader::find_entry(const std::string& name) const {
    uint64_t total = entry_count();
    for (uint64_t i = 0; i < total; ++i) {
        const char* stored = zip_get_name(m_zip.get(), i, 0);
        if (stored && boost::algorithm::iequals(name, stored)) {
            try {
                return stat_entry(i);
            }
            catch (const MergeError& err) {
                Logger::warn(m_path.filename().string() + ": " + err.what());
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> ArchiveReader::read_small(const std::string& name, uint64_t limit) const {
    auto entry = find_entry(name);
    if (!entry || entry->size > limit) return std::nullopt;
    try {
        std::vector<char> data = read_entry(*entry);
        return std::string(data.begin(), data.end());
    }
    catch (const MergeError& err) {
        Logger::warn(m_path.filename().string() + ": " + err.what());
        return std::nullopt;
    }
}
