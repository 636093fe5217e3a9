#pragma once
#include <string>
#include <cstddef>

constexpr const char* COMIC_INFO_NAME = "ComicInfo.xml";
constexpr size_t MAX_COMIC_INFO_SIZE = 1024 * 1024;

struct ComicInfoCheck {
    bool well_formed = false;
    std::string root;     // name of the document element
    std::string error;    // parser message when not well-formed
};

// Well-formedness check only; the document is copied through untouched.
// Accepted when it parses and its root element is <ComicInfo>.
ComicInfoCheck check_comic_info(const std::string& xml);
