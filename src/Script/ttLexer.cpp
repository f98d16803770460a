#include "pch.h"
#include "ttInternal.h"

namespace tt {

static int LineOf(std::string_view src, size_t pos)
{
    return 1 + (int)std::count(src.begin(), src.begin() + pos, '\n');
}

// comments are blanked out rather than erased so that line numbers survive.
std::string StripComments(std::string_view source, Diagnostics* warnings)
{
    std::string ret(source);

    // block comments first. they may span lines and do not nest.
    size_t offset = 0;
    for (;;) {
        size_t begin = ret.find("/*", offset);
        if (begin == std::string::npos)
            break;

        size_t end = ret.find("*/", begin + 2);
        if (end == std::string::npos) {
            if (warnings) {
                warnings->push_back({ LineOf(ret, begin), ErrorCode::UnterminatedComment,
                    "unterminated block comment, the rest of the file is ignored" });
            }
            end = ret.size();
        }
        else {
            end += 2;
        }

        for (size_t i = begin; i < end; ++i) {
            if (ret[i] != '\n')
                ret[i] = ' ';
        }
        offset = end;
    }

    // then line comments
    size_t line_begin = 0;
    while (line_begin < ret.size()) {
        size_t line_end = ret.find('\n', line_begin);
        if (line_end == std::string::npos)
            line_end = ret.size();

        size_t pos = ret.find("//", line_begin);
        if (pos != std::string::npos && pos < line_end) {
            for (size_t i = pos; i < line_end; ++i)
                ret[i] = ' ';
        }
        line_begin = line_end + 1;
    }
    return ret;
}

std::vector<SourceLine> Lex(std::string_view source, Diagnostics* warnings)
{
    std::vector<SourceLine> ret;

    int number = 0;
    Split(StripComments(source, warnings), "\n", [&](std::string l) {
        ++number;
        auto text = Trim(l);
        if (!text.empty())
            ret.push_back({ number, std::string(text) });
        });
    return ret;
}

} // namespace tt
