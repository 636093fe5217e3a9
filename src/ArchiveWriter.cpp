#include "ArchiveWriter.h"
#include "MergeError.h"
#include "Logger.h"
#include <zip.h>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    fs::path make_temp_path(const fs::path& destination) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path name = "." + destination.filename().string() + ".part-" + std::to_string(stamp);
        return destination.parent_path() / name;
    }
}

ArchiveWriter::ArchiveWriter(const fs::path& destination)
    : m_destination(destination), m_temp(make_temp_path(destination)) {
    int errcode = 0;
    m_zip.reset(zip_open(m_temp.string().c_str(), ZIP_CREATE | ZIP_EXCL, &errcode));
    if (!m_zip) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        throw MergeError(ErrorKind::IOFailure, "cannot create " + m_temp.string() + ": " + msg);
    }
}

ArchiveWriter::~ArchiveWriter() {
    if (m_committed) return;
    m_zip.reset();  // zip_discard: nothing is written
    std::error_code ec;
    if (fs::exists(m_temp, ec)) {
        fs::remove(m_temp, ec);
        if (ec) Logger::warn("Cannot remove temporary archive " + m_temp.string() + ": " + ec.message());
    }
}

void ArchiveWriter::set_entry_attributes(int64_t index, const std::string& entry_name, bool compress) {
    zip_uint64_t idx = static_cast<zip_uint64_t>(index);
    if (zip_set_file_compression(m_zip.get(), idx, compress ? ZIP_CM_DEFLATE : ZIP_CM_STORE, 0) != 0 ||
        zip_file_set_dostime(m_zip.get(), idx, FIXED_DOS_TIME, FIXED_DOS_DATE, 0) != 0) {
        throw MergeError(ErrorKind::IOFailure, entry_name + ": " + zip_strerror(m_zip.get()));
    }
}

void ArchiveWriter::add_file(const std::string& entry_name, const fs::path& source, bool compress) {
    zip_source_t* src = zip_source_file(m_zip.get(), source.string().c_str(), 0, 0);
    if (!src)
        throw MergeError(ErrorKind::IOFailure, source.string() + ": " + zip_strerror(m_zip.get()));

    zip_int64_t index = zip_file_add(m_zip.get(), entry_name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(src);
        throw MergeError(ErrorKind::IOFailure, entry_name + ": " + zip_strerror(m_zip.get()));
    }
    set_entry_attributes(index, entry_name, compress);
    ++m_entries;
}

void ArchiveWriter::add_bytes(const std::string& entry_name, std::string data, bool compress) {
    m_buffers.push_back(std::move(data));
    const std::string& stored = m_buffers.back();

    zip_source_t* src = zip_source_buffer(m_zip.get(), stored.data(), stored.size(), 0);
    if (!src)
        throw MergeError(ErrorKind::IOFailure, entry_name + ": " + zip_strerror(m_zip.get()));

    zip_int64_t index = zip_file_add(m_zip.get(), entry_name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(src);
        throw MergeError(ErrorKind::IOFailure, entry_name + ": " + zip_strerror(m_zip.get()));
    }
    set_entry_attributes(index, entry_name, compress);
    ++m_entries;
}

void ArchiveWriter::on_progress(zip_t*, double fraction, void* self) {
    auto* writer = static_cast<ArchiveWriter*>(self);
    if (writer->m_progress) writer->m_progress(fraction);
}

int ArchiveWriter::on_cancel(zip_t*, void* self) {
    auto* writer = static_cast<ArchiveWriter*>(self);
    return (writer->m_cancelled && writer->m_cancelled()) ? 1 : 0;
}

void ArchiveWriter::commit(std::function<void(double)> progress, std::function<bool()> cancelled) {
    if (m_committed) return;
    // libzip removes an archive with no entries instead of writing it
    if (m_entries == 0)
        throw MergeError(ErrorKind::EmptyArchive, "no entries to write into " + m_destination.string());

    m_progress = std::move(progress);
    m_cancelled = std::move(cancelled);
    zip_register_progress_callback_with_state(m_zip.get(), 0.001, &ArchiveWriter::on_progress, nullptr, this);
    zip_register_cancel_callback_with_state(m_zip.get(), &ArchiveWriter::on_cancel, nullptr, this);

    if (zip_close(m_zip.get()) != 0) {
        bool was_cancelled = zip_error_code_zip(zip_get_error(m_zip.get())) == ZIP_ER_CANCELLED;
        std::string msg = zip_strerror(m_zip.get());
        m_zip.reset();  // still open after a failed close; discard it
        if (was_cancelled)
            throw MergeError(ErrorKind::Cancelled, "cancelled while writing " + m_destination.filename().string());
        throw MergeError(ErrorKind::IOFailure, "cannot write " + m_temp.string() + ": " + msg);
    }
    m_zip.release();  // zip_close freed the handle

    std::error_code ec;
    fs::rename(m_temp, m_destination, ec);
    if (ec)
        throw MergeError(ErrorKind::IOFailure, "cannot move archive into place at " +
                         m_destination.string() + ": " + ec.message());
    m_committed = true;
}
