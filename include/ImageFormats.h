#pragma once
#include <string>
#include <vector>
#include <set>
#include <cstddef>

// Форматы страниц, которые понимает слияние.
// Расширение хранится в нижнем регистре и без точки: "jpg", "png", ...
using FormatSet = std::set<std::string>;

namespace Sig {
    namespace Img {
        const std::string PNG("\x89\x50\x4E\x47\x0D\x0A\x1A\x0A", 8);
        const std::string JPG("\xFF\xD8\xFF", 3);
        const std::string GIF87("GIF87a");
        const std::string GIF89("GIF89a");
        const std::string BMP("BM");
        // WEBP: "RIFF" <size:4> "WEBP"
        const std::string RIFF("RIFF");
        const std::string WEBP("WEBP");
    }

    namespace Arc {
        // Local file header и пустой архив (только end of central directory)
        const std::string ZIP_LOCAL("\x50\x4B\x03\x04", 4);
        const std::string ZIP_EMPTY("\x50\x4B\x05\x06", 4);
    }
}

// All six supported formats, sorted.
const FormatSet& supported_formats();

bool is_supported_format(const std::string& ext);

// Lower-cased extension of a file or entry name without the dot ("" if none).
std::string extension_of(const std::string& name);

// "jpeg" and "jpg" are the same family; everything else is its own family.
std::string format_family(const std::string& ext);

// Parses "jpg, .PNG,webp". Unknown tokens are returned through `rejected`
// instead of being accepted.
FormatSet parse_format_list(const std::string& text, std::vector<std::string>* rejected = nullptr);

std::string join_formats(const FormatSet& formats);

// Magic-byte sniff of the first bytes of an image.
// Returns the format family ("jpg", "png", "gif", "bmp", "webp") or "".
std::string sniff_image_format(const char* data, size_t size);
