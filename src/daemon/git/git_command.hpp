#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

struct GitOutput {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
    // First line of stdout with trailing whitespace removed.
    std::string first_line() const;
    // stderr (or stdout if stderr is empty), trimmed, for error messages.
    std::string diagnostic() const;
};

namespace git {

// Runs `git -C <repo> <args...>` and captures both streams. The expected
// error is only set when the process could not be started or waited for;
// a non-zero exit is reported through GitOutput::exit_code.
std::expected<GitOutput, std::string> run(const std::string& repo,
                                          const std::vector<std::string>& args);

// Runs `git <args...>` and hands every stderr line to on_line as soon as it
// arrives. Carriage returns split lines too, since git redraws progress with
// them. Returns the exit code.
std::expected<int, std::string> run_streaming(
    const std::vector<std::string>& args,
    const std::function<void(const std::string&)>& on_line);

std::vector<std::string> split_lines(const std::string& text);
std::string trim(const std::string& s);

} // namespace git
