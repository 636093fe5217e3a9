#include "ImageFormats.h"
#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace {
    bool starts_with(const char* data, size_t size, const std::string& sig, size_t offset = 0) {
        if (size < offset + sig.size()) return false;
        return std::string(data + offset, sig.size()) == sig;
    }
}

const FormatSet& supported_formats() {
    static const FormatSet formats = { "bmp", "gif", "jpeg", "jpg", "png", "webp" };
    return formats;
}

bool is_supported_format(const std::string& ext) {
    return supported_formats().count(ext) != 0;
}

std::string extension_of(const std::string& name) {
    auto slash = name.find_last_of("/\\");
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos) return "";
    if (slash != std::string::npos && dot < slash) return "";
    if (dot + 1 >= name.size()) return "";
    return boost::algorithm::to_lower_copy(name.substr(dot + 1));
}

std::string format_family(const std::string& ext) {
    return ext == "jpeg" ? "jpg" : ext;
}

FormatSet parse_format_list(const std::string& text, std::vector<std::string>* rejected) {
    FormatSet formats;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        boost::algorithm::trim(token);
        if (token.empty()) continue;
        if (token.front() == '.') token.erase(0, 1);
        std::string ext = boost::algorithm::to_lower_copy(token);
        if (is_supported_format(ext)) {
            formats.insert(ext);
        } else if (rejected) {
            rejected->push_back(token);
        }
    }
    return formats;
}

std::string join_formats(const FormatSet& formats) {
    std::string out;
    for (const auto& f : formats) {
        if (!out.empty()) out += ",";
        out += f;
    }
    return out;
}

std::string sniff_image_format(const char* data, size_t size) {
    if (starts_with(data, size, Sig::Img::PNG)) return "png";
    if (starts_with(data, size, Sig::Img::JPG)) return "jpg";
    if (starts_with(data, size, Sig::Img::GIF87) || starts_with(data, size, Sig::Img::GIF89)) return "gif";
    if (starts_with(data, size, Sig::Img::RIFF) && starts_with(data, size, Sig::Img::WEBP, 8)) return "webp";
    if (starts_with(data, size, Sig::Img::BMP)) return "bmp";
    return "";
}
