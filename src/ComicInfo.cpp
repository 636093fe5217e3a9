#include "ComicInfo.h"
#include <expat.h>
#include <memory>
#include <type_traits>

namespace {
    struct ParserFree {
        void operator()(XML_Parser p) const noexcept { if (p) XML_ParserFree(p); }
    };

    struct ParseState {
        std::string root;
        int depth = 0;
    };

    void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** /*atts*/) {
        auto* state = static_cast<ParseState*>(user_data);
        if (state->depth == 0 && state->root.empty()) state->root = name;
        ++state->depth;
    }

    void XMLCALL on_end(void* user_data, const XML_Char* /*name*/) {
        --static_cast<ParseState*>(user_data)->depth;
    }
}

ComicInfoCheck check_comic_info(const std::string& xml) {
    ComicInfoCheck result;
    if (xml.empty()) {
        result.error = "empty document";
        return result;
    }

    std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserFree> parser(XML_ParserCreate(nullptr));
    if (!parser) {
        result.error = "cannot create XML parser";
        return result;
    }

    ParseState state;
    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), on_start, on_end);

    if (XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), XML_TRUE) == XML_STATUS_ERROR) {
        result.error = std::string(XML_ErrorString(XML_GetErrorCode(parser.get()))) +
                       " at line " + std::to_string(XML_GetCurrentLineNumber(parser.get()));
        return result;
    }

    result.root = state.root;
    if (state.root != "ComicInfo") {
        result.error = "root element is <" + state.root + ">, expected <ComicInfo>";
        return result;
    }
    result.well_formed = true;
    return result;
}
