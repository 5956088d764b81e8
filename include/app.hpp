#ifndef APP_H
#define APP_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace app
{
    struct Options
    {
        std::optional<std::filesystem::path> out_file;

        // transformations, always applied in this order
        bool standardize = false;
        bool determinize = false;
        bool complete    = false;

        // space separated words to run through the final automaton
        std::vector<std::string> words;
    };

    // with no transformation requested, the classic standardize then complete sequence runs
    auto resolve_steps(Options options) -> Options;

    [[nodiscard]]
    auto report(const std::filesystem::path& path, Options options) -> std::string;

    auto run(const std::filesystem::path& path, Options options) -> void;
}

#endif
