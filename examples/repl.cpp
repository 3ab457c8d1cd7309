#include <termcalc/format.hpp>
#include <termcalc/interpreter.hpp>
#include <termcalc/parser.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <readline/history.h>
#include <readline/readline.h>

namespace {

// readline's completion hooks are plain C callbacks.
termcalc::Session* g_session = nullptr;

char* complete_name(const char* text, int state) {
    static std::vector<std::string> matches;
    static std::size_t next = 0;

    if (state == 0) {
        matches.clear();
        next = 0;
        for (const auto& entry : g_session->env().search(text)) matches.push_back(entry.first);
    }
    if (next >= matches.size()) return nullptr;
    return strdup(matches[next++].c_str());
}

char** complete(const char* text, int /*start*/, int /*end*/) {
    rl_attempted_completion_over = 1; // no filename fallback
    if (!termcalc::ident_at_end(text)) return nullptr;
    return rl_completion_matches(text, complete_name);
}

std::size_t parse_digits(int argc, char** argv) {
    std::size_t digits = termcalc::kDisplayDigits;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--digits") == 0 && i + 1 < argc) {
            long v = std::strtol(argv[++i], nullptr, 10);
            if (v <= 0) {
                fmt::print(stderr, "--digits expects a positive number\n");
                std::exit(2);
            }
            digits = static_cast<std::size_t>(v);
        } else {
            fmt::print(stderr, "usage: {} [--digits N]\n", argv[0]);
            std::exit(2);
        }
    }
    return digits;
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t digits = parse_digits(argc, argv);

    termcalc::Session session;
    g_session = &session;

    rl_attempted_completion_function = complete;
    rl_basic_word_break_characters = " \t\n()+-*/^=,";

    while (char* raw = readline("> ")) {
        std::string line(raw);
        std::free(raw);
        if (line.find_first_not_of(' ') == std::string::npos) continue;
        add_history(line.c_str());

        // "?expr" evaluates without keeping assignments or touching ans.
        const bool preview = line.front() == '?';
        const std::string input = preview ? line.substr(1) : line;

        try {
            if (preview) {
                termcalc::Number result = session.preview(input);
                fmt::print("current result {}\n", termcalc::format_number(result, digits));
            } else {
                termcalc::Number result = session.submit(input);
                fmt::print("= {}\n", termcalc::format_number(result, digits));
            }
        } catch (const termcalc::ParseError& e) {
            fmt::print(stderr, "{}\n", termcalc::describe(e, input));
        } catch (const termcalc::EvalError& e) {
            fmt::print(stderr, "error: {}\n", e.what());
        }
    }
    fmt::print("\n");
    return 0;
}
