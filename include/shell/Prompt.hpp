#pragma once

#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace sdbx::shell {

// Thrown when the user answers "q"/"quit". The CLI exits with status 0.
struct QuitRequested : std::runtime_error {
    QuitRequested() : std::runtime_error("Quit requested by user") {}
};

class Prompt {
public:
    Prompt(std::istream& in, std::ostream& out);

    // Blank -> def, y/yes -> true, n/no -> false, q/quit -> QuitRequested,
    // anything else re-prompts.
    [[nodiscard]] bool yesno(std::string message, bool def) const;

    // Asks for the local Dropbox folder. Blank -> def. An existing path must be
    // confirmed for overwrite, otherwise the question is asked again.
    [[nodiscard]] std::filesystem::path askForPath(const std::string& def = "~/Dropbox") const;

    void print(const std::string& message) const;

private:
    std::istream& in_;
    std::ostream& out_;

    [[nodiscard]] std::string readLine(const std::string& message) const;
};

}
