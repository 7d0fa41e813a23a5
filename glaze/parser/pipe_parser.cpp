#include "pipe_parser.hpp"
#include "../re2_patterns.hpp"
#include "../str_util.hpp"

#include <re2/re2.h>

namespace glaze {

PipeChain parse_pipes(const std::string& expression) {
    PipeChain chain;
    if (expression.find("|>") == std::string::npos) {
        chain.expression = expression;
        return chain;
    }

    std::vector<std::string> segments;
    re2::StringPiece input(expression);
    std::string segment;
    while (re2::RE2::Consume(&input, pattern_pipe_separator(), &segment)) {
        segments.push_back(str_trim(segment));
    }
    segments.push_back(str_trim(std::string(input.data(), input.size())));

    if (segments.size() < 2) {
        chain.expression = expression;
        return chain;
    }

    chain.expression = segments[0];
    for (size_t i = 1; i < segments.size(); i++) {
        std::string marker;
        if (re2::RE2::FullMatch(segments[i], pattern_pipe_marker(), &marker)) {
            if (marker == "raw") chain.raw = true;
            else if (marker == "json") chain.json = true;
            else chain.url = true;
            continue;
        }
        chain.pipes.push_back(segments[i]);
    }
    return chain;
}

std::string compile_pipes(const std::string& base, const std::vector<std::string>& pipes) {
    std::string result = base;
    for (const std::string& pipe : pipes) {
        if (pipe.find("...") != std::string::npos) {
            result = str_replace_all(pipe, "...", result);
        } else {
            result = "(" + pipe + ")(" + result + ")";
        }
    }
    return result;
}

} // namespace glaze
