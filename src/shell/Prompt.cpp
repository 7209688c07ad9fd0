#include "shell/Prompt.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <istream>
#include <ostream>

using namespace sdbx::shell;

namespace {

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    const auto first = s.find_first_not_of(chars);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(chars);
    return s.substr(first, last - first + 1);
}

}

Prompt::Prompt(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::string Prompt::readLine(const std::string& message) const {
    out_ << message << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        log::Registry::shell()->debug("[Prompt] End of input while waiting for an answer");
        out_ << "\nExit" << std::endl;
        throw QuitRequested();
    }
    return line;
}

void Prompt::print(const std::string& message) const {
    out_ << message << std::endl;
}

bool Prompt::yesno(std::string message, const bool def) const {
    message += def ? " [Y/n] " : " [N/y] ";

    while (true) {
        const auto answer = util::toLower(trim(readLine(message)));
        if (answer.empty()) return def;
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no") return false;
        if (answer == "q" || answer == "quit") {
            out_ << "Exit" << std::endl;
            throw QuitRequested();
        }
        log::Registry::shell()->debug("[Prompt] Unrecognized answer '{}'", answer);
        out_ << "Please answer YES or NO." << std::endl;
    }
}

std::filesystem::path Prompt::askForPath(const std::string& def) const {
    namespace fs = std::filesystem;

    const auto defPath = util::expandUser(def);

    while (true) {
        // Paths dragged into a terminal arrive wrapped in single quotes
        const auto res = trim(trim(readLine(
            "Please give Dropbox folder location or press enter for default [" + defPath.string() + "]: ")), "'");

        if (res.empty()) return fs::absolute(defPath).lexically_normal();

        const auto path = fs::absolute(util::expandUser(res)).lexically_normal();
        if (!fs::exists(path)) return path;

        if (yesno("Directory '" + path.string() + "' already exists. Should we overwrite?", true)) return path;
    }
}
